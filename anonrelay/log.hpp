#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace NRelay {

enum class ELogLevel {
    Debug,
    Info,
    Error,
};

/// Optional log sink. Components hold one and stay silent when it is empty.
using TLogger = std::function<void(ELogLevel, const std::string&)>;

std::string_view ToString(ELogLevel level);

/// Writes "[level] message" lines to std::cerr; debug lines only when @p verbose.
TLogger MakeStderrLogger(bool verbose);

inline void Log(const TLogger& logger, ELogLevel level, const std::string& message) {
    if (logger) {
        logger(level, message);
    }
}

} // namespace NRelay
