#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <random>
#include <string>

#include <anonrelay/channel.hpp>
#include <anonrelay/corochain.hpp>
#include <anonrelay/events/event_service.hpp>
#include <anonrelay/log.hpp>
#include <anonrelay/names.hpp>
#include <anonrelay/poller.hpp>
#include <anonrelay/transport.hpp>

#include "directory.hpp"
#include "messages.hpp"

namespace NRelay {
namespace NActors {

struct TRelayOptions {
    /// The only login allowed to /broadcast.
    std::string OperatorLogin = "sergio_4min";
    size_t MailboxCapacity = 100;
    /// Pause after each owner command; zero disables it.
    std::chrono::milliseconds CommandDelay{250};
};

/// Collaborators shared by every actor; owned by the dispatcher.
struct TRelayContext {
    TPollerBase* Poller = nullptr;
    ITransport* Transport = nullptr;
    NEvents::TEventServiceHandle Events;
    IThreadIdGenerator* ThreadIds = nullptr;
    TUserDirectory* Directory = nullptr;
    TRelayOptions Options;
    TLogger Logger;
};

/// Everything an actor owns besides its mailboxes.
struct TUserState {
    std::map<TThreadId, TThread> Threads;
    /// Thread of every message the user sent or received.
    std::map<TMessageId, TThreadId> MessageIndex;
    /// Banned login -> id of the thread it was banned on.
    std::map<std::string, TThreadId> Banlist;

    bool operator==(const TUserState&) const = default;
};

/// Both mailboxes of an actor, parked on one wait slot.
struct TMailboxes {
    TMailboxes(TPollerBase* poller, size_t capacity);

    std::shared_ptr<TWaitSlot> Slot;
    TSender<TCommandRequest> CommandSender;
    TReceiver<TCommandRequest> Commands;
    TSender<TActionRequest> ActionSender;
    TReceiver<TActionRequest> Actions;
};

/**
 * @class TUserActor
 * @brief Owner of one user's threads, message index, ban list and stopped flag.
 *
 * Run() serves commands from the user and actions from peer actors, one
 * request at a time, alternating between the two mailboxes when both have
 * work. Recoverable errors (TRelayError) go back on the request's reply
 * channel; anything else ends the actor, closes its mailboxes and is
 * rethrown from Run().
 *
 * The actor never waits for a reply from itself: pairing with its own
 * login is rejected before any request is sent.
 */
class TUserActor {
public:
    TUserActor(const TRelayContext& context,
               TUserHandlePtr self,
               TChatId chatId,
               TUserState state,
               std::shared_ptr<TWaitSlot> slot,
               TReceiver<TCommandRequest> commands,
               TReceiver<TActionRequest> actions);

    ~TUserActor();

    TUserActor(const TUserActor&) = delete;
    TUserActor& operator=(const TUserActor&) = delete;

    /// Completes when both mailboxes are exhausted.
    TFuture<void> Run();

    const TUserState& State() const {
        return State_;
    }

    const TUserHandlePtr& Handle() const {
        return Self_;
    }

private:
    TFuture<void> Serve();
    TFuture<void> ServeCommand(TCommandRequest request);
    TFuture<void> ServeAction(TActionRequest request);

    TFuture<void> HandleCommand(TCommand command);
    TFuture<void> Start();
    TFuture<void> Stop();
    TFuture<void> Help();
    TFuture<void> Users();
    TFuture<void> Threads();
    TFuture<void> Random(TMessageId messageId, std::string text);
    TFuture<void> Send(TThreadId threadId, TMessageId messageId, std::string text);
    TFuture<void> Reply(TMessageId replyMessageId, TMessageId messageId, std::string text);
    TFuture<void> Close(TThreadId threadId);
    TFuture<void> Ban(TThreadId threadId);
    TFuture<void> Unban(TThreadId threadId);
    TFuture<void> Banlist();
    TFuture<void> Broadcast(std::string text);

    TFuture<void> HandleAction(TAction action);
    TFuture<void> StartAnonymousThread(TThread thread);
    TFuture<void> ReceiveText(TThreadId threadId, std::string text);
    TFuture<void> TerminateThread(TThreadId threadId);
    TFuture<void> ReceiveBroadcast(std::string text);

    /**
     * Pairing: installs the peer's half through its mailbox, then keeps ours.
     * Yields the id of the peer's half; an id the peer already uses is
     * replaced by a fresh one.
     */
    TFuture<TThreadId> CreateThread(TThreadId myThreadId, std::string otherLogin, EAnonymityMode mode);
    TFuture<TMessageId> SendToSelf(std::string text);
    TThreadId FreshThreadId();

    const std::string& Login() const {
        return Self_->User.Login;
    }

    const TRelayContext& Context_;
    NEvents::TEventServiceHandle Events_;
    TUserHandlePtr Self_;
    TChatId ChatId_;
    TUserState State_;
    std::shared_ptr<TWaitSlot> Slot_;
    TReceiver<TCommandRequest> Commands_;
    TReceiver<TActionRequest> Actions_;
    std::minstd_rand Random_;
};

} // namespace NActors
} // namespace NRelay
