#pragma once

#include <chrono>
#include <coroutine>
#include <cstdint>
#include <tuple>

#include <time.h>

namespace NRelay {

using TClock = std::chrono::steady_clock;
using TTime = TClock::time_point;
using THandle = std::coroutine_handle<>;

struct TTimer {
    TTime Deadline;
    unsigned Id;
    THandle Handle;
    bool operator<(const TTimer& e) const {
        return std::tuple(Deadline, Id, static_cast<bool>(Handle)) > std::tuple(e.Deadline, e.Id, static_cast<bool>(e.Handle));
    }
};

struct TPollEvent {
    int Fd;
    enum {
        READ = 1,
    };
    int Type;
    THandle Handle;

    bool Match(const TPollEvent& other) const {
        return Fd == other.Fd && (Type & other.Type);
    }
};

inline timespec GetTimespec(TTime now, TTime deadline, std::chrono::milliseconds maxDuration)
{
    timespec ret{0, 0};
    if (now > deadline) {
        return ret;
    }
    auto duration = deadline - now;
    if (duration > maxDuration) {
        duration = maxDuration;
    }
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(duration);
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(duration - seconds);
    ret.tv_sec = seconds.count();
    ret.tv_nsec = nanos.count();
    return ret;
}

} // namespace NRelay
