#pragma once

#include <poll.h>

#include <tuple>
#include <vector>

#include "base.hpp"
#include "poller.hpp"

namespace NRelay {

/**
 * @brief Poller backend over ppoll(2).
 *
 * The relay watches very few descriptors (the console input at most), so the
 * portable poll interface is all it needs.
 */
class TPoll: public TPollerBase {
public:
    void Poll();

private:
    std::vector<std::tuple<THandle,int>> InEvents_; // reader + index in Fds_
    std::vector<pollfd> Fds_;
};

} // namespace NRelay
