#include "poll.hpp"

#include <cerrno>
#include <system_error>

namespace NRelay {

void TPoll::Poll() {
    auto ts = GetTimeout();

    if (static_cast<int>(InEvents_.size()) <= MaxFd_) {
        InEvents_.resize(MaxFd_+1, std::make_tuple(THandle{}, -1));
    }

    for (const auto& ch : Changes_) {
        int fd = ch.Fd;
        auto& [reader, idx] = InEvents_[fd];
        if (ch.Handle) {
            if (idx == -1) {
                idx = Fds_.size();
                Fds_.emplace_back(pollfd{});
            }
            pollfd& pev = Fds_[idx];
            pev.fd = fd;
            pev.events |= POLLIN;
            reader = ch.Handle;
        } else if (idx != -1) {
            Fds_[idx].events &= ~POLLIN;
            reader = {};
            if (Fds_[idx].events == 0) {
                std::swap(Fds_[idx], Fds_.back());
                std::get<1>(InEvents_[Fds_[idx].fd]) = idx;
                Fds_.pop_back();
                idx = -1;
            }
        }
    }

    Reset();
    if (ppoll(Fds_.data(), Fds_.size(), &ts, nullptr) < 0) {
        if (errno != EINTR) {
            throw std::system_error(errno, std::generic_category(), "poll");
        }
    } else {
        for (auto& pev : Fds_) {
            auto& [reader, _] = InEvents_[pev.fd];
            if ((pev.revents & (POLLIN|POLLHUP|POLLERR)) && reader) {
                ReadyEvents_.emplace_back(TPollEvent{pev.fd, TPollEvent::READ, reader});
                reader = {};
            }
        }
    }

    ProcessTimers();
}

} // namespace NRelay
