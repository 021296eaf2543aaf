#pragma once

/**
 * @file corochain.hpp
 * @brief Eager coroutine futures used by every worker of the relay.
 *
 * A coroutine returning TFuture<T> starts running immediately and keeps either
 * its result or the exception it terminated with. Awaiting the future from
 * another coroutine suspends the awaiter until the result is ready and then
 * returns the value or rethrows the exception.
 *
 * @code
 * TFuture<int> answer() {
 *     co_return 42;
 * }
 *
 * TFuture<void> caller() {
 *     int value = co_await answer();
 *     co_return;
 * }
 * @endcode
 *
 * Outside of a coroutine a future is driven by stepping the loop until done():
 * @code
 * auto future = caller();
 * while (!future.done()) {
 *     loop.Step();
 * }
 * future.await_resume(); // rethrows on failure
 * @endcode
 */

#include <coroutine>
#include <exception>
#include <expected>
#include <optional>
#include <utility>

namespace NRelay {

template<typename T> struct TFinalAwaiter;

template<typename T> struct TFuture;

template<typename T>
struct TPromiseBase {
    std::suspend_never initial_suspend() { return {}; }
    TFinalAwaiter<T> final_suspend() noexcept;
    /// Coroutine waiting for this one, resumed from final_suspend.
    std::coroutine_handle<> Caller = std::noop_coroutine();
};

template<typename T>
struct TPromise: public TPromiseBase<T> {
    TFuture<T> get_return_object();

    void return_value(const T& t) {
        ErrorOr = t;
    }

    void return_value(T&& t) {
        ErrorOr = std::move(t);
    }

    void unhandled_exception() {
        ErrorOr = std::unexpected(std::current_exception());
    }

    std::optional<std::expected<T, std::exception_ptr>> ErrorOr;
};

template<>
struct TPromise<void>: public TPromiseBase<void> {
    TFuture<void> get_return_object();

    void return_void() {
        ErrorOr = nullptr;
    }

    void unhandled_exception() {
        ErrorOr = std::current_exception();
    }

    std::optional<std::exception_ptr> ErrorOr;
};

/**
 * @brief Owner of a running coroutine frame.
 *
 * Destroying the future destroys the frame, even if the coroutine is still
 * suspended somewhere; whoever holds its handle must not resume it afterwards.
 */
template<typename T>
struct TFutureBase {
    TFutureBase() = default;
    TFutureBase(TPromise<T>& promise)
        : Coro(std::coroutine_handle<TPromise<T>>::from_promise(promise))
    { }
    TFutureBase(TFutureBase&& other)
    {
        *this = std::move(other);
    }
    TFutureBase(const TFutureBase&) = delete;
    TFutureBase& operator=(const TFutureBase&) = delete;
    TFutureBase& operator=(TFutureBase&& other) {
        if (this != &other) {
            if (Coro) {
                Coro.destroy();
            }
            Coro = std::exchange(other.Coro, nullptr);
        }
        return *this;
    }

    ~TFutureBase() { if (Coro) { Coro.destroy(); } }

    bool await_ready() const {
        return Coro.promise().ErrorOr.has_value();
    }

    bool done() const {
        return Coro.done();
    }

    bool valid() const {
        return !!Coro;
    }

    void await_suspend(std::coroutine_handle<> caller) {
        Coro.promise().Caller = caller;
    }

    using promise_type = TPromise<T>;

protected:
    std::coroutine_handle<TPromise<T>> Coro = nullptr;
};

template<typename T>
struct TFuture : public TFutureBase<T> {
    T await_resume() {
        auto& errorOr = *this->Coro.promise().ErrorOr;
        if (errorOr.has_value()) {
            return std::move(errorOr.value());
        } else {
            std::rethrow_exception(errorOr.error());
        }
    }
};

template<>
struct TFuture<void> : public TFutureBase<void> {
    void await_resume() {
        auto& errorOr = *this->Coro.promise().ErrorOr;
        if (errorOr) {
            std::rethrow_exception(errorOr);
        }
    }
};

template<typename T>
struct TFinalAwaiter {
    bool await_ready() noexcept { return false; }
    std::coroutine_handle<> await_suspend(std::coroutine_handle<TPromise<T>> h) noexcept {
        return h.promise().Caller;
    }
    void await_resume() noexcept { }
};

inline TFuture<void> TPromise<void>::get_return_object() { return { TFuture<void>{*this} }; }
template<typename T>
TFuture<T> TPromise<T>::get_return_object() { return { TFuture<T>{*this} }; }

template<typename T>
TFinalAwaiter<T> TPromiseBase<T>::final_suspend() noexcept { return {}; }

} // namespace NRelay
