#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <variant>

#include <anonrelay/channel.hpp>
#include <anonrelay/command.hpp>
#include <anonrelay/corochain.hpp>
#include <anonrelay/data.hpp>

namespace NRelay {
namespace NActors {

struct TUserHandle;
using TUserHandlePtr = std::shared_ptr<TUserHandle>;

/**
 * @brief One side of a conversation, owned by the actor of its user.
 *
 * The peer holds the mirror thread: its id is OtherId and its mode is
 * MirrorMode(AnonMode). The peer is reached only through its handle.
 */
struct TThread {
    TThreadId Id;
    EAnonymityMode AnonMode = EAnonymityMode::Both;
    TThreadId OtherId;
    TUserHandlePtr Other;

    /// Relays @p text to the peer's mirror thread.
    TFuture<void> SendText(std::string text) const;
    /// Asks the peer to drop its mirror thread.
    TFuture<void> Terminate() const;

    /// Peers are compared by login, the handles themselves are not.
    bool operator==(const TThread& other) const;
};

struct TStartAnonymousThread {
    TThread Thread;
};

struct TSendText {
    TThreadId ThreadId;
    std::string Text;
};

struct TTerminateThread {
    TThreadId ThreadId;
};

struct TBroadcast {
    std::string Text;
};

/// Request from a peer actor.
using TAction = std::variant<
    TStartAnonymousThread,
    TSendText,
    TTerminateThread,
    TBroadcast>;

struct TActionRequest {
    TAction Action;
    TReplySender Reply;
};

/// Request from the actor's own user, forwarded by the dispatcher.
struct TCommandRequest {
    TCommand Command;
    TReplySender Reply;
};

/**
 * @brief Shared routing handle of one user actor.
 *
 * The only object shared between actors: the user record, the actor's action
 * mailbox and its stopped flag.
 */
struct TUserHandle {
    TUserHandle(TUser user, TSender<TActionRequest> actions)
        : User(std::move(user))
        , Actions(std::move(actions))
    { }

    /// Sends @p action to the actor and waits for it to be handled.
    TFuture<void> SendAction(TAction action);

    const TUser User;
    TSender<TActionRequest> Actions;
    std::atomic<bool> Stopped = false;
};

} // namespace NActors
} // namespace NRelay
