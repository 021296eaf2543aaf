#include "event_service.hpp"

#include <iterator>

#include <anonrelay/errors.hpp>

namespace NRelay {
namespace NEvents {

TEventTracker TEventServiceHandle::Write(TEvent event) {
    std::vector<TEvent> events;
    events.emplace_back(std::move(event));
    return WriteBatch(std::move(events));
}

TEventTracker TEventServiceHandle::WriteBatch(std::vector<TEvent> events) {
    if (!Sender_) {
        throw TFatalError("event service is not connected");
    }
    auto [reply, receiver] = MakeOneshot<TReplyResult>(Sender_.Poller());
    if (!Sender_.TrySend(TEventRequest{std::move(events), std::move(reply)})) {
        throw TFatalError("event service queue is full");
    }
    return TEventTracker(std::move(receiver));
}

TEventService::TEventService(TPollerBase* poller, IEventWriter& writer, size_t maxBatch, TLogger logger)
    : Writer_(writer)
    , MaxBatch_(maxBatch)
    , Logger_(std::move(logger))
{
    auto [sender, receiver] = MakeChannel<TEventRequest>(poller);
    Sender_ = std::move(sender);
    Receiver_ = std::move(receiver);
}

TEventServiceHandle TEventService::Handle() {
    if (!Sender_) {
        throw TFatalError("event service is already running");
    }
    return TEventServiceHandle(Sender_);
}

TFuture<void> TEventService::Run() {
    Sender_ = {};

    while (auto first = co_await Receiver_.Receive()) {
        std::vector<TEventRequest> requests;
        std::vector<TEvent> batch;
        auto take = [&](TEventRequest&& request) {
            batch.insert(batch.end(),
                std::make_move_iterator(request.Events.begin()),
                std::make_move_iterator(request.Events.end()));
            requests.emplace_back(std::move(request));
        };

        take(std::move(*first));
        TEventRequest next;
        while (batch.size() < MaxBatch_ && Receiver_.TryReceive(next)) {
            take(std::move(next));
        }

        TReplyResult result;
        try {
            Writer_.Write(batch);
            Log(Logger_, ELogLevel::Debug, "wrote " + std::to_string(batch.size()) + " events");
        } catch (const std::exception& ex) {
            Log(Logger_, ELogLevel::Error, std::string("failed to write events: ") + ex.what());
            result = std::make_exception_ptr(TPersistenceError(ex.what()));
        }

        for (auto& request : requests) {
            request.Reply.Send(result);
        }
    }
    co_return;
}

} // namespace NEvents
} // namespace NRelay
