#pragma once

/**
 * @file channel.hpp
 * @brief Mailboxes and one-shot replies between coroutines of the same loop.
 *
 * TChannel is a bounded multi-producer single-consumer queue. Producers hold
 * copyable TSender handles; when the last one is gone the receiver sees the
 * channel as exhausted once it is drained. Send() suspends while the channel is
 * full, which is how a slow actor pushes back on its peers.
 *
 * TOneshot carries exactly one value back to whoever asked for it. Command
 * replies, peer-action replies and event durability results all travel this
 * way, and Ask() ties a request and its reply together:
 *
 * @code{.cpp}
 * struct TRequest {
 *     std::string Text;
 *     TReplySender Reply;
 * };
 *
 * TFuture<void> client(TSender<TRequest> server) {
 *     co_await Ask(server, [](TReplySender reply) {
 *         return TRequest{"hello", std::move(reply)};
 *     });
 * }
 *
 * TFuture<void> serve(TReceiver<TRequest> inbox) {
 *     while (auto request = co_await inbox.Receive()) {
 *         request->Reply.Send(nullptr); // success
 *     }
 * }
 * @endcode
 *
 * All wake-ups go through TPollerBase::Post, so a Send() never runs the
 * receiver inside the sender's stack.
 */

#include <exception>
#include <limits>
#include <memory>
#include <optional>
#include <utility>

#include "corochain.hpp"
#include "errors.hpp"
#include "poller.hpp"
#include "queue.hpp"

namespace NRelay {

/**
 * @brief The single coroutine parked on one or more receivers.
 *
 * Receivers created with the same slot wake the same waiter, which lets an
 * actor sleep until either of its mailboxes has something.
 */
class TWaitSlot {
public:
    explicit TWaitSlot(TPollerBase* poller)
        : Poller_(poller)
    { }

    void Notify() {
        if (Handle_) {
            Poller_->Post(std::exchange(Handle_, {}));
        }
    }

    auto Wait() {
        struct TAwaitable {
            bool await_ready() const noexcept {
                return false;
            }

            void await_suspend(THandle h) {
                Slot->Handle_ = h;
            }

            void await_resume() noexcept { }

            TWaitSlot* Slot;
        };
        return TAwaitable{this};
    }

    /// Forgets the parked coroutine, e.g. when its frame is being destroyed.
    void Reset() {
        Handle_ = {};
    }

    TPollerBase* Poller() const {
        return Poller_;
    }

private:
    TPollerBase* Poller_;
    THandle Handle_;
};

template<typename T> class TSender;
template<typename T> class TReceiver;

template<typename T>
struct TChannelState {
    TChannelState(std::shared_ptr<TWaitSlot> slot, size_t capacity)
        : Slot(std::move(slot))
        , Capacity(capacity)
    { }

    void WakeBlockedSenders() {
        THandle h;
        while (BlockedSenders.TryPop(h)) {
            Slot->Poller()->Post(h);
        }
    }

    std::shared_ptr<TWaitSlot> Slot;
    size_t Capacity;
    TRingQueue<T> Items;
    TRingQueue<THandle> BlockedSenders;
    size_t Senders = 0;
    bool ReceiverClosed = false;
};

template<typename T>
class TSender {
public:
    TSender() = default;

    explicit TSender(std::shared_ptr<TChannelState<T>> state)
        : State_(std::move(state))
    {
        ++State_->Senders;
    }

    TSender(const TSender& other)
        : State_(other.State_)
    {
        if (State_) {
            ++State_->Senders;
        }
    }

    TSender(TSender&& other) noexcept
        : State_(std::move(other.State_))
    { }

    TSender& operator=(TSender other) {
        Release();
        State_ = std::move(other.State_);
        return *this;
    }

    ~TSender() {
        Release();
    }

    /**
     * @brief Enqueues @p item, suspending while the channel is full.
     * @throws TFatalError if the receiving side is gone.
     */
    TFuture<void> Send(T item) {
        auto state = State_;
        if (!state) {
            throw TFatalError("send on an empty sender");
        }
        while (true) {
            if (state->ReceiverClosed) {
                throw TFatalError("mailbox is closed");
            }
            if (state->Items.Size() < state->Capacity) {
                break;
            }
            co_await TSpaceAwaiter{state.get()};
        }
        state->Items.Push(std::move(item));
        state->Slot->Notify();
        co_return;
    }

    /// Enqueues without waiting; false if the channel is full.
    bool TrySend(T&& item) {
        if (!State_ || State_->ReceiverClosed) {
            throw TFatalError("mailbox is closed");
        }
        if (State_->Items.Size() >= State_->Capacity) {
            return false;
        }
        State_->Items.Push(std::move(item));
        State_->Slot->Notify();
        return true;
    }

    TPollerBase* Poller() const {
        return State_->Slot->Poller();
    }

    explicit operator bool() const {
        return !!State_;
    }

private:
    struct TSpaceAwaiter {
        bool await_ready() const noexcept {
            return false;
        }

        void await_suspend(THandle h) {
            State->BlockedSenders.Push(std::move(h));
        }

        void await_resume() noexcept { }

        TChannelState<T>* State;
    };

    void Release() {
        if (State_ && --State_->Senders == 0) {
            State_->Slot->Notify();
        }
        State_.reset();
    }

    std::shared_ptr<TChannelState<T>> State_;
};

template<typename T>
class TReceiver {
public:
    TReceiver() = default;

    explicit TReceiver(std::shared_ptr<TChannelState<T>> state)
        : State_(std::move(state))
    { }

    TReceiver(TReceiver&&) = default;
    TReceiver& operator=(TReceiver&& other) {
        if (this != &other) {
            Close();
            State_ = std::move(other.State_);
        }
        return *this;
    }
    TReceiver(const TReceiver&) = delete;
    TReceiver& operator=(const TReceiver&) = delete;

    ~TReceiver() {
        Close();
    }

    bool TryReceive(T& item) {
        if (!State_ || !State_->Items.TryPop(item)) {
            return false;
        }
        THandle h;
        if (State_->BlockedSenders.TryPop(h)) {
            State_->Slot->Poller()->Post(h);
        }
        return true;
    }

    /// No queued items and no sender left: nothing will ever arrive.
    bool Exhausted() const {
        return !State_ || (State_->Items.Empty() && State_->Senders == 0);
    }

    /// Next item, or std::nullopt once the channel is exhausted.
    TFuture<std::optional<T>> Receive() {
        while (true) {
            T item;
            if (TryReceive(item)) {
                co_return std::optional<T>(std::move(item));
            }
            if (Exhausted()) {
                co_return std::optional<T>{};
            }
            co_await State_->Slot->Wait();
        }
    }

    /**
     * @brief Refuses further items and drops the queued ones.
     *
     * Blocked and future senders fail with TFatalError; dropped requests
     * release their reply channels, failing whoever waits on them.
     */
    void Close() {
        if (!State_ || State_->ReceiverClosed) {
            return;
        }
        State_->ReceiverClosed = true;
        State_->Items.Clear();
        State_->WakeBlockedSenders();
    }

    size_t Size() const {
        return State_ ? State_->Items.Size() : 0;
    }

private:
    std::shared_ptr<TChannelState<T>> State_;
};

/**
 * @brief Creates a channel whose receiver parks on @p slot.
 *
 * Pass the same slot to several channels to wait on all of them at once.
 */
template<typename T>
std::pair<TSender<T>, TReceiver<T>> MakeChannel(std::shared_ptr<TWaitSlot> slot, size_t capacity) {
    auto state = std::make_shared<TChannelState<T>>(std::move(slot), capacity);
    TSender<T> sender(state);
    return {std::move(sender), TReceiver<T>(std::move(state))};
}

template<typename T>
std::pair<TSender<T>, TReceiver<T>> MakeChannel(TPollerBase* poller, size_t capacity = std::numeric_limits<size_t>::max()) {
    return MakeChannel<T>(std::make_shared<TWaitSlot>(poller), capacity);
}

template<typename T>
struct TOneshotState {
    explicit TOneshotState(TPollerBase* poller)
        : Slot(poller)
    { }

    TWaitSlot Slot;
    std::optional<T> Value;
    bool SenderAlive = true;
    bool ReceiverAlive = true;
};

template<typename T>
class TOneshotSender {
public:
    TOneshotSender() = default;

    explicit TOneshotSender(std::shared_ptr<TOneshotState<T>> state)
        : State_(std::move(state))
    { }

    TOneshotSender(TOneshotSender&&) = default;
    TOneshotSender& operator=(TOneshotSender&& other) {
        if (this != &other) {
            Drop();
            State_ = std::move(other.State_);
        }
        return *this;
    }
    TOneshotSender(const TOneshotSender&) = delete;
    TOneshotSender& operator=(const TOneshotSender&) = delete;

    ~TOneshotSender() {
        Drop();
    }

    /// Delivers the value; silently discarded if nobody waits for it any more.
    void Send(T value) {
        if (!State_) {
            throw TFatalError("reply sent twice");
        }
        if (State_->ReceiverAlive) {
            State_->Value = std::move(value);
        }
        Drop();
    }

private:
    void Drop() {
        if (State_) {
            State_->SenderAlive = false;
            State_->Slot.Notify();
            State_.reset();
        }
    }

    std::shared_ptr<TOneshotState<T>> State_;
};

template<typename T>
class TOneshotReceiver {
public:
    TOneshotReceiver() = default;

    explicit TOneshotReceiver(std::shared_ptr<TOneshotState<T>> state)
        : State_(std::move(state))
    { }

    TOneshotReceiver(TOneshotReceiver&&) = default;
    TOneshotReceiver& operator=(TOneshotReceiver&&) = default;
    TOneshotReceiver(const TOneshotReceiver&) = delete;
    TOneshotReceiver& operator=(const TOneshotReceiver&) = delete;

    ~TOneshotReceiver() {
        if (State_) {
            State_->ReceiverAlive = false;
        }
    }

    /**
     * @brief Waits for the value.
     * @throws TFatalError if the sender was destroyed without sending.
     */
    TFuture<T> Receive() {
        auto state = State_;
        if (!state) {
            throw TFatalError("reply awaited twice");
        }
        if (!state->Value && state->SenderAlive) {
            co_await state->Slot.Wait();
        }
        if (!state->Value) {
            throw TFatalError("reply channel dropped");
        }
        co_return std::move(*state->Value);
    }

private:
    std::shared_ptr<TOneshotState<T>> State_;
};

template<typename T>
std::pair<TOneshotSender<T>, TOneshotReceiver<T>> MakeOneshot(TPollerBase* poller) {
    auto state = std::make_shared<TOneshotState<T>>(poller);
    return {TOneshotSender<T>(state), TOneshotReceiver<T>(state)};
}

/// Outcome of a request: nullptr on success, the error otherwise.
using TReplyResult = std::exception_ptr;
using TReplySender = TOneshotSender<TReplyResult>;
using TReplyReceiver = TOneshotReceiver<TReplyResult>;

/// Awaits a reply and rethrows the error it carries.
inline TFuture<void> WaitReply(TReplyReceiver receiver) {
    auto error = co_await receiver.Receive();
    if (error) {
        std::rethrow_exception(error);
    }
    co_return;
}

/**
 * @brief Sends the request built by @p makeRequest and waits for its reply.
 *
 * @p makeRequest receives the reply sender and returns the request to enqueue.
 */
template<typename TRequest, typename TMaker>
TFuture<void> Ask(TSender<TRequest> to, TMaker makeRequest) {
    auto [replySender, replyReceiver] = MakeOneshot<TReplyResult>(to.Poller());
    co_await to.Send(makeRequest(std::move(replySender)));
    co_await WaitReply(std::move(replyReceiver));
    co_return;
}

} // namespace NRelay
