#pragma once

namespace NRelay {

/**
 * @class TLoop
 * @brief Drives a poller: one Step() polls descriptors, resumes ready readers and due timers.
 *
 * @code{.cpp}
 * TLoop<TPoll> loop;
 * auto future = relay.Run();
 * while (!future.done()) {
 *     loop.Step();
 * }
 * @endcode
 */
template<typename TPoller>
class TLoop {
public:
    void Step() {
        Poller_.Poll();
        Poller_.WakeupReadyHandles();
    }

    TPoller& Poller() {
        return Poller_;
    }

private:
    TPoller Poller_;
};

} // namespace NRelay
