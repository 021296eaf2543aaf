#pragma once

#include <stdexcept>
#include <string>

namespace NRelay {

/**
 * @brief Base of every error that is reported back to the user who issued a command.
 *
 * Recoverable errors never stop an actor. The front end renders them as
 * "Error: <what()>.".
 */
class TRelayError: public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Invalid request: unknown thread, wrong thread mode, self-targeting, banned, stopped.
class TUserError: public TRelayError {
public:
    using TRelayError::TRelayError;
};

/// A peer already owns a thread with the id proposed for its side.
class TThreadIdTakenError: public TUserError {
public:
    using TUserError::TUserError;
};

class TParseError: public TRelayError {
public:
    using TRelayError::TRelayError;
};

/**
 * @brief The event log could not be written.
 *
 * One instance is copied to every caller whose events were part of the failed batch.
 */
class TPersistenceError: public TRelayError {
public:
    explicit TPersistenceError(const std::string& reason)
        : TRelayError("persistence error: " + reason)
    { }
};

class TTransportError: public TRelayError {
public:
    using TRelayError::TRelayError;
};

/// The event log is corrupt or inconsistent. Startup aborts on it.
class TReplayError: public TRelayError {
public:
    TReplayError(size_t line, const std::string& reason);

    size_t Line() const {
        return Line_;
    }

private:
    size_t Line_;
};

/**
 * @brief Broken internal invariant: a dead mailbox, a dropped reply channel.
 *
 * Not a TRelayError: nothing in the relay catches it, it ends the process.
 */
class TFatalError: public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/// Rethrows the current TRelayError with @p context prepended, keeping its type.
[[noreturn]] void RethrowWithContext(const std::string& context);

} // namespace NRelay
