#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

#include <anonrelay/command.hpp>
#include <anonrelay/events/event_log.hpp>

#include "directory.hpp"
#include "user_actor.hpp"

namespace NRelay {
namespace NActors {

/**
 * @brief Left fold of the event log into the initial state of every actor.
 *
 * Apply() handles one event; events that name an unknown login or a thread
 * that does not exist throw std::invalid_argument. The fold does not start
 * anything: TCommandDispatcher::Restore() turns the result into actors.
 */
class TReplayBuilder {
public:
    struct TUserEntry {
        TUserEntry(TPollerBase* poller, size_t capacity, TUser user, TChatId chatId);

        TMailboxes Mailboxes;
        TUserHandlePtr Handle;
        TChatId ChatId;
        TUserState State;
    };

    TReplayBuilder(TPollerBase* poller, size_t mailboxCapacity)
        : Poller_(poller)
        , MailboxCapacity_(mailboxCapacity)
    { }

    void Apply(const NEvents::TEvent& event);

    /// Reads the whole log. @throws TReplayError naming the offending line.
    size_t ApplyAll(NEvents::TEventLogReader& reader);

    const std::map<std::string, TUserEntry>& Users() const {
        return Users_;
    }

    std::map<std::string, TUserEntry>& Users() {
        return Users_;
    }

    /// Largest message id any actor has indexed, 0 for an empty log.
    TMessageId LastMessageId() const {
        return LastMessageId_;
    }

private:
    TUserEntry& Get(const std::string& login);
    TUserHandlePtr GetHandle(const std::string& login);

    TPollerBase* Poller_;
    size_t MailboxCapacity_;
    std::map<std::string, TUserEntry> Users_;
    TMessageId LastMessageId_ = 0;
};

/**
 * @class TCommandDispatcher
 * @brief Routes user commands to user actors, creating actors on first contact.
 *
 * At most one actor exists per login. An actor created for a new login first
 * records UserConnected; the command that created it is answered only once
 * that event is stored.
 *
 * @code{.cpp}
 * TCommandDispatcher dispatcher(&poller, transport, events, threadIds, options, logger);
 * transport.ContinueAfter(dispatcher.Restore(reader)); // optional, before the first Dispatch
 * co_await dispatcher.Dispatch(user, chatId, ParseCommand(text, messageId));
 * @endcode
 *
 * A closed actor mailbox or a dropped reply channel surfaces as TFatalError.
 */
class TCommandDispatcher {
public:
    TCommandDispatcher(TPollerBase* poller,
                       ITransport& transport,
                       NEvents::TEventServiceHandle events,
                       IThreadIdGenerator& threadIds,
                       TRelayOptions options = {},
                       TLogger logger = {});

    TCommandDispatcher(const TCommandDispatcher&) = delete;
    TCommandDispatcher& operator=(const TCommandDispatcher&) = delete;

    /**
     * @brief Rebuilds every actor from the event log and starts them all.
     *
     * Must be called before any Dispatch(). Yields the largest message id
     * the restored actors know, so the transport can continue its numbering
     * after it.
     * @throws TReplayError if the log is corrupt or inconsistent; nothing is started then.
     */
    TMessageId Restore(NEvents::TEventLogReader& reader);

    /// Forwards @p command to @p user's actor and waits for the outcome.
    TFuture<void> Dispatch(TUser user, TChatId chatId, TCommand command);

    const TUserDirectory& Directory() const {
        return Directory_;
    }

    /// Actor of @p login, nullptr if there is none.
    const TUserActor* FindActor(const std::string& login) const;

private:
    struct TActorSlot {
        TSender<TCommandRequest> Commands;
        std::unique_ptr<TUserActor> Actor;
        TFuture<void> Running;
    };

    /// Starts an actor; the caller holds Mutex_.
    TSender<TCommandRequest> Spawn(TUserHandlePtr handle, TChatId chatId, TUserState state, TMailboxes mailboxes);

    TUserDirectory Directory_;
    TRelayContext Context_;
    mutable std::mutex Mutex_;
    std::map<std::string, TActorSlot> Actors_;
};

} // namespace NActors
} // namespace NRelay
