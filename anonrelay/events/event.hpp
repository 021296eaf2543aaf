#pragma once

#include <string>
#include <string_view>
#include <variant>

#include <anonrelay/data.hpp>

namespace NRelay {
namespace NEvents {

struct TUserConnected {
    TUser User;
    TChatId ChatId = 0;
};

struct TThreadStarted {
    std::string Login;
    std::string OtherLogin;
    TThreadId MyThreadId;
    TThreadId OtherThreadId;
    EAnonymityMode AnonMode = EAnonymityMode::Both;
};

struct TThreadMessageReceived {
    std::string Login;
    TMessageId MessageId = 0;
    TThreadId ThreadId;
};

struct TThreadTerminated {
    std::string Login;
    std::string OtherLogin;
    TThreadId MyThreadId;
    TThreadId OtherThreadId;
};

struct TUserBanned {
    std::string Login;
    std::string BannedLogin;
    TThreadId BannedThreadId;
    /// Mirror thread held by the banned user; empty in logs written before it was recorded.
    TThreadId OtherThreadId;
};

struct TUserUnbanned {
    std::string Login;
    std::string UnbannedLogin;
};

struct TUserStopped {
    std::string Login;
};

struct TUserStarted {
    std::string Login;
};

/**
 * @brief One durable fact of the relay's history.
 *
 * The log is the only source of truth; in-memory actor state is the left fold
 * of these events.
 */
using TEvent = std::variant<
    TUserConnected,
    TThreadStarted,
    TThreadMessageReceived,
    TThreadTerminated,
    TUserBanned,
    TUserUnbanned,
    TUserStopped,
    TUserStarted>;

/// Tag used for the variant in the serialized form, e.g. "ThreadStarted".
std::string_view EventName(const TEvent& event);

/// Single-line JSON object {"<EventName>": {...}} without the trailing newline.
std::string Serialize(const TEvent& event);

/// @throws std::invalid_argument if @p line is not a well-formed event.
TEvent Deserialize(const std::string& line);

} // namespace NEvents
} // namespace NRelay
