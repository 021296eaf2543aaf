#include "dispatcher.hpp"

#include <algorithm>
#include <optional>
#include <stdexcept>

#include <anonrelay/errors.hpp>
#include <anonrelay/overloaded.hpp>

namespace NRelay {
namespace NActors {

using namespace NEvents;

namespace {

void RemoveThread(TUserState& state, const TThreadId& threadId) {
    if (!state.Threads.erase(threadId)) {
        throw std::invalid_argument("thread is not found: " + threadId);
    }
}

} // namespace

TReplayBuilder::TUserEntry::TUserEntry(TPollerBase* poller, size_t capacity, TUser user, TChatId chatId)
    : Mailboxes(poller, capacity)
    , Handle(std::make_shared<TUserHandle>(std::move(user), std::move(Mailboxes.ActionSender)))
    , ChatId(chatId)
{ }

TReplayBuilder::TUserEntry& TReplayBuilder::Get(const std::string& login) {
    auto it = Users_.find(login);
    if (it == Users_.end()) {
        throw std::invalid_argument("user not found: @" + login);
    }
    return it->second;
}

TUserHandlePtr TReplayBuilder::GetHandle(const std::string& login) {
    return Get(login).Handle;
}

void TReplayBuilder::Apply(const TEvent& event) {
    std::visit(TOverloaded{
        [&](const TUserConnected& ev) {
            auto login = ev.User.Login;
            auto [_, inserted] = Users_.try_emplace(login, Poller_, MailboxCapacity_, ev.User, ev.ChatId);
            if (!inserted) {
                throw std::invalid_argument("user @" + login + " is connected twice");
            }
        },
        [&](const TThreadStarted& ev) {
            auto other = GetHandle(ev.OtherLogin);
            Get(ev.Login).State.Threads.insert_or_assign(ev.MyThreadId,
                TThread{ev.MyThreadId, ev.AnonMode, ev.OtherThreadId, std::move(other)});
        },
        [&](const TThreadMessageReceived& ev) {
            Get(ev.Login).State.MessageIndex[ev.MessageId] = ev.ThreadId;
            LastMessageId_ = std::max(LastMessageId_, ev.MessageId);
        },
        [&](const TThreadTerminated& ev) {
            RemoveThread(Get(ev.Login).State, ev.MyThreadId);
            RemoveThread(Get(ev.OtherLogin).State, ev.OtherThreadId);
        },
        [&](const TUserBanned& ev) {
            auto& state = Get(ev.Login).State;
            RemoveThread(state, ev.BannedThreadId);
            if (!ev.OtherThreadId.empty()) {
                Get(ev.BannedLogin).State.Threads.erase(ev.OtherThreadId);
            }
            state.Banlist[ev.BannedLogin] = ev.BannedThreadId;
        },
        [&](const TUserUnbanned& ev) {
            if (!Get(ev.Login).State.Banlist.erase(ev.UnbannedLogin)) {
                throw std::invalid_argument("user is not banned: @" + ev.UnbannedLogin);
            }
        },
        [&](const TUserStopped& ev) {
            Get(ev.Login).Handle->Stopped = true;
        },
        [&](const TUserStarted& ev) {
            Get(ev.Login).Handle->Stopped = false;
        },
    }, event);
}

size_t TReplayBuilder::ApplyAll(TEventLogReader& reader) {
    size_t count = 0;
    while (auto event = reader.Next()) {
        try {
            Apply(*event);
        } catch (const std::invalid_argument& ex) {
            throw TReplayError(reader.LineNumber(), ex.what());
        }
        ++count;
    }
    return count;
}

TCommandDispatcher::TCommandDispatcher(TPollerBase* poller,
                                       ITransport& transport,
                                       TEventServiceHandle events,
                                       IThreadIdGenerator& threadIds,
                                       TRelayOptions options,
                                       TLogger logger)
{
    Context_.Poller = poller;
    Context_.Transport = &transport;
    Context_.Events = std::move(events);
    Context_.ThreadIds = &threadIds;
    Context_.Directory = &Directory_;
    Context_.Options = std::move(options);
    Context_.Logger = std::move(logger);
}

TMessageId TCommandDispatcher::Restore(TEventLogReader& reader) {
    TReplayBuilder builder(Context_.Poller, Context_.Options.MailboxCapacity);
    auto count = builder.ApplyAll(reader);
    Log(Context_.Logger, ELogLevel::Info, "Read " + std::to_string(count) + " events from event log");

    std::lock_guard guard(Mutex_);
    if (!Actors_.empty()) {
        throw TFatalError("event log replayed after actors were started");
    }
    for (auto& [_, entry] : builder.Users()) {
        Directory_.InsertIfAbsent(entry.Handle);
    }
    for (auto& [_, entry] : builder.Users()) {
        Spawn(entry.Handle, entry.ChatId, std::move(entry.State), std::move(entry.Mailboxes));
    }
    return builder.LastMessageId();
}

TFuture<void> TCommandDispatcher::Dispatch(TUser user, TChatId chatId, TCommand command) {
    std::optional<TEventTracker> connected;
    TSender<TCommandRequest> sender;
    {
        std::lock_guard guard(Mutex_);
        auto it = Actors_.find(user.Login);
        if (it != Actors_.end()) {
            sender = it->second.Commands;
        } else {
            connected.emplace(Context_.Events.Write(TUserConnected{user, chatId}));
            TMailboxes mailboxes(Context_.Poller, Context_.Options.MailboxCapacity);
            auto handle = std::make_shared<TUserHandle>(user, std::move(mailboxes.ActionSender));
            Directory_.InsertIfAbsent(handle);
            sender = Spawn(std::move(handle), chatId, TUserState{}, std::move(mailboxes));
        }
    }

    auto [reply, receiver] = MakeOneshot<TReplyResult>(Context_.Poller);
    co_await sender.Send(TCommandRequest{std::move(command), std::move(reply)});
    if (connected) {
        co_await connected->WaitWritten();
    }
    co_await WaitReply(std::move(receiver));
    co_return;
}

const TUserActor* TCommandDispatcher::FindActor(const std::string& login) const {
    std::lock_guard guard(Mutex_);
    auto it = Actors_.find(login);
    return it == Actors_.end() ? nullptr : it->second.Actor.get();
}

TSender<TCommandRequest> TCommandDispatcher::Spawn(TUserHandlePtr handle, TChatId chatId, TUserState state, TMailboxes mailboxes) {
    auto login = handle->User.Login;
    auto& slot = Actors_[login];
    slot.Commands = std::move(mailboxes.CommandSender);
    slot.Actor = std::make_unique<TUserActor>(
        Context_,
        std::move(handle),
        chatId,
        std::move(state),
        std::move(mailboxes.Slot),
        std::move(mailboxes.Commands),
        std::move(mailboxes.Actions));
    slot.Running = slot.Actor->Run();
    Log(Context_.Logger, ELogLevel::Debug, "started user actor @" + login);
    return slot.Commands;
}

} // namespace NActors
} // namespace NRelay
