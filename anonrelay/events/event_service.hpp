#pragma once

#include <vector>

#include <anonrelay/channel.hpp>
#include <anonrelay/corochain.hpp>
#include <anonrelay/log.hpp>
#include <anonrelay/poller.hpp>

#include "event.hpp"
#include "event_log.hpp"

namespace NRelay {
namespace NEvents {

struct TEventRequest {
    std::vector<TEvent> Events;
    TReplySender Reply;
};

/**
 * @brief Durability result of one write request.
 *
 * Await WaitWritten() before doing anything visible that depends on the
 * events being stored.
 */
class TEventTracker {
public:
    explicit TEventTracker(TReplyReceiver receiver)
        : Receiver_(std::move(receiver))
    { }

    /// @throws TPersistenceError if the batch holding the events failed.
    TFuture<void> WaitWritten() {
        return WaitReply(std::move(Receiver_));
    }

private:
    TReplyReceiver Receiver_;
};

/// Caller side of the event service; cheap to copy.
class TEventServiceHandle {
public:
    TEventServiceHandle() = default;
    explicit TEventServiceHandle(TSender<TEventRequest> sender)
        : Sender_(std::move(sender))
    { }

    TEventTracker Write(TEvent event);
    /// Events of one batch reach the log contiguously and in order.
    TEventTracker WriteBatch(std::vector<TEvent> events);

private:
    TSender<TEventRequest> Sender_;
};

/**
 * @brief Single writer of the event log.
 *
 * Takes one request, drains whatever else is already queued up to
 * @p maxBatch events, stores the lot with one IEventWriter::Write and hands
 * the same result to every request of the batch. A failed write is not
 * retried; every caller of the batch gets the same TPersistenceError.
 *
 * @code{.cpp}
 * TEventService service(&loop.Poller(), writer);
 * auto events = service.Handle();
 * auto running = service.Run();
 * co_await events.Write(TUserStopped{"alice"}).WaitWritten();
 * @endcode
 *
 * Handles must be taken before Run(). Run() completes once every handle is gone.
 */
class TEventService {
public:
    TEventService(TPollerBase* poller, IEventWriter& writer, size_t maxBatch = 1000, TLogger logger = {});

    TEventServiceHandle Handle();

    TFuture<void> Run();

private:
    IEventWriter& Writer_;
    size_t MaxBatch_;
    TLogger Logger_;
    TSender<TEventRequest> Sender_;
    TReceiver<TEventRequest> Receiver_;
};

} // namespace NEvents
} // namespace NRelay
