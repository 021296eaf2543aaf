#include "config.hpp"

#include <cstring>
#include <iostream>
#include <stdexcept>

namespace NRelay {

namespace {

const char* Value(int argc, char** argv, int& i) {
    if (i + 1 >= argc) {
        throw std::invalid_argument(std::string(argv[i]) + " requires a value");
    }
    return argv[++i];
}

size_t Number(const char* option, const char* value) {
    try {
        size_t pos = 0;
        auto number = std::stoull(value, &pos);
        if (pos != std::strlen(value)) {
            throw std::invalid_argument(value);
        }
        return number;
    } catch (const std::logic_error&) {
        throw std::invalid_argument(std::string(option) + ": not a number: " + value);
    }
}

} // namespace

TConfig ParseArgs(int argc, char** argv) {
    TConfig config;
    for (int i = 1; i < argc; i++) {
        if (!strcmp(argv[i], "--log")) {
            config.LogPath = Value(argc, argv, i);
        } else if (!strcmp(argv[i], "--operator")) {
            config.OperatorLogin = Value(argc, argv, i);
        } else if (!strcmp(argv[i], "--mailbox")) {
            config.MailboxCapacity = Number(argv[i], Value(argc, argv, i));
            if (config.MailboxCapacity == 0) {
                throw std::invalid_argument("--mailbox must be positive");
            }
        } else if (!strcmp(argv[i], "--batch")) {
            config.MaxBatch = Number(argv[i], Value(argc, argv, i));
            if (config.MaxBatch == 0) {
                throw std::invalid_argument("--batch must be positive");
            }
        } else if (!strcmp(argv[i], "--delay")) {
            config.CommandDelay = std::chrono::milliseconds(Number(argv[i], Value(argc, argv, i)));
        } else if (!strcmp(argv[i], "--fsync")) {
            config.Fsync = true;
        } else if (!strcmp(argv[i], "--verbose")) {
            config.Verbose = true;
        } else if (!strcmp(argv[i], "--help")) {
            config.Help = true;
        } else {
            throw std::invalid_argument(std::string("unknown option: ") + argv[i]);
        }
    }
    return config;
}

void Usage(const char* name) {
    std::cerr << name << " [--log <path>] [--operator <login>] [--mailbox <n>] [--batch <n>]"
        " [--delay <ms>] [--fsync] [--verbose] [--help]\n";
    std::cerr << "Reads '<login>[ <first name>] [^<message id>]: <text>' lines from stdin.\n";
}

} // namespace NRelay
