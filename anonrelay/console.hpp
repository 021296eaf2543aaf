#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "data.hpp"

namespace NRelay {

/// One stdin line of the console front end.
struct TConsoleInput {
    TUser User;
    std::optional<TMessageId> ReplyTo;
    std::string Text;
};

/**
 * @brief Parses "<login>[ <first name>...] [^<message id>]: <text>".
 *
 * A leading '@' of the login is dropped; the first name defaults to the login.
 * @throws TParseError if there is no login or no ':' separator.
 */
TConsoleInput ParseConsoleLine(std::string_view line);

/// Stable chat id of a console user.
TChatId ConsoleChatId(std::string_view login);

} // namespace NRelay
