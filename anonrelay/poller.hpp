#pragma once

#include <chrono>
#include <queue>
#include <vector>

#include "base.hpp"

namespace NRelay {

/**
 * @class TPollerBase
 * @brief Timers, deferred wake-ups and read readiness for the relay's event loop.
 *
 * Everything in the relay runs as coroutines on one loop. A coroutine suspends
 * by handing its handle to the poller: with a deadline (@ref Sleep), for the next
 * iteration (@ref Post) or until a descriptor becomes readable
 * (@ref AddRead). The concrete backend implements Poll() and fills ReadyEvents_.
 *
 * Deferred wake-ups are zero-deadline timers, so they run in FIFO order on the
 * next Step() and never inside the call stack of the coroutine that posted them.
 */
class TPollerBase {
public:
    TPollerBase() = default;

    TPollerBase(const TPollerBase& ) = delete;
    TPollerBase& operator=(const TPollerBase& ) = delete;

    unsigned AddTimer(TTime deadline, THandle h) {
        Timers_.emplace(TTimer{deadline, TimerId_, h});
        return TimerId_++;
    }

    /**
     * @brief Cancels a timer that has not fired yet.
     * @return true if the timer had already fired.
     */
    bool RemoveTimer(unsigned timerId, TTime deadline) {
        bool fired = timerId == LastFiredTimer_;
        if (!fired) {
            Timers_.emplace(TTimer{deadline, timerId, {}}); // shadows the original entry
        }
        return fired;
    }

    /// Resumes @p h on the next loop iteration.
    void Post(THandle h) {
        AddTimer(TTime{}, h);
    }

    void AddRead(int fd, THandle h) {
        MaxFd_ = std::max(MaxFd_, fd);
        Changes_.emplace_back(TPollEvent{fd, TPollEvent::READ, h});
    }

    void RemoveEvent(int fd) {
        MaxFd_ = std::max(MaxFd_, fd);
        Changes_.emplace_back(TPollEvent{fd, TPollEvent::READ, {}});
    }

    auto Sleep(TTime until) {
        struct TAwaitableSleep {
            TAwaitableSleep(TPollerBase* poller, TTime n)
                : poller(poller)
                , n(n)
            { }
            ~TAwaitableSleep() {
                if (poller) {
                    poller->RemoveTimer(timerId, n);
                }
            }

            TAwaitableSleep(TAwaitableSleep&& other)
                : poller(other.poller)
                , n(other.n)
            {
                other.poller = nullptr;
            }

            TAwaitableSleep(const TAwaitableSleep&) = delete;
            TAwaitableSleep& operator=(const TAwaitableSleep&) = delete;

            bool await_ready() {
                return false;
            }

            void await_suspend(std::coroutine_handle<> h) {
                timerId = poller->AddTimer(n, h);
            }

            void await_resume() { poller = nullptr; }

            TPollerBase* poller;
            TTime n;
            unsigned timerId = 0;
        };

        return TAwaitableSleep{this,until};
    }

    template<typename Rep, typename Period>
    auto Sleep(std::chrono::duration<Rep,Period> duration) {
        return Sleep(TClock::now() + duration);
    }

    /**
     * @brief Resumes the coroutine waiting for @p change.
     *
     * If the resumed coroutine did not register interest in the same descriptor
     * again, the descriptor is dropped from the backend on the next Poll().
     */
    void Wakeup(TPollEvent&& change) {
        auto index = Changes_.size();
        change.Handle.resume();
        if (change.Fd >= 0) {
            bool matched = false;
            for (; index < Changes_.size() && !matched; index++) {
                matched = Changes_[index].Match(change);
            }
            if (!matched) {
                change.Handle = {};
                Changes_.emplace_back(std::move(change));
            }
        }
    }

    void WakeupReadyHandles() {
        for (auto&& ev : ReadyEvents_) {
            Wakeup(std::move(ev));
        }
    }

protected:
    timespec GetTimeout() const {
        return Timers_.empty()
            ? GetTimespec(TTime{}, TTime{} + MaxDuration_, MaxDuration_)
            : Timers_.top().Deadline == TTime{}
                ? timespec {0, 0}
                : GetTimespec(TClock::now(), Timers_.top().Deadline, MaxDuration_);
    }

    void Reset() {
        ReadyEvents_.clear();
        Changes_.clear();
        MaxFd_ = 0;
    }

    void ProcessTimers() {
        auto now = TClock::now();
        bool first = true;
        unsigned prevId = 0;

        while (!Timers_.empty() && Timers_.top().Deadline <= now) {
            TTimer timer = Timers_.top(); Timers_.pop();

            if ((first || prevId != timer.Id) && timer.Handle) { // skip removed timers
                LastFiredTimer_ = timer.Id;
                timer.Handle.resume();
            }

            first = false;
            prevId = timer.Id;
        }
    }

    int MaxFd_ = -1;
    std::vector<TPollEvent> Changes_;
    std::vector<TPollEvent> ReadyEvents_;
    unsigned TimerId_ = 0;
    std::priority_queue<TTimer> Timers_;
    unsigned LastFiredTimer_ = (unsigned)(-1);
    std::chrono::milliseconds MaxDuration_ = std::chrono::milliseconds(100);
};

} // namespace NRelay
