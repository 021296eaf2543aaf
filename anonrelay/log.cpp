#include "log.hpp"

#include <iostream>

namespace NRelay {

std::string_view ToString(ELogLevel level) {
    switch (level) {
    case ELogLevel::Debug:
        return "debug";
    case ELogLevel::Info:
        return "info";
    case ELogLevel::Error:
        return "error";
    }
    return "unknown";
}

TLogger MakeStderrLogger(bool verbose) {
    return [verbose](ELogLevel level, const std::string& message) {
        if (level == ELogLevel::Debug && !verbose) {
            return;
        }
        std::cerr << "[" << ToString(level) << "] " << message << "\n";
    };
}

} // namespace NRelay
