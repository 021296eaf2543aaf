#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace NRelay {

struct TConfig {
    std::string LogPath = "events.log";
    /// The only login allowed to /broadcast.
    std::string OperatorLogin = "sergio_4min";
    size_t MailboxCapacity = 100;
    size_t MaxBatch = 1000;
    /// Pause after each owner command; keeps an actor under the transport's rate limit.
    std::chrono::milliseconds CommandDelay{250};
    bool Fsync = false;
    bool Verbose = false;
    bool Help = false;
};

/// @throws std::invalid_argument on an unknown option or a bad value.
TConfig ParseArgs(int argc, char** argv);

void Usage(const char* name);

} // namespace NRelay
