#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "data.hpp"

namespace NRelay {

struct TStartCommand { };
struct THelpCommand { };
struct TUsersCommand { };
struct TThreadsCommand { };

struct TRandomCommand {
    TMessageId MessageId = 0;
    std::string Text;
};

struct TSendCommand {
    TThreadId ThreadId;
    TMessageId MessageId = 0;
    std::string Text;
};

/// Any message sent as a reply to another message.
struct TReplyCommand {
    TMessageId ReplyMessageId = 0;
    TMessageId MessageId = 0;
    std::string Text;
};

struct TCloseCommand {
    TThreadId ThreadId;
};

struct TBanCommand {
    TThreadId ThreadId;
};

struct TUnbanCommand {
    TThreadId ThreadId;
};

struct TBanlistCommand { };
struct TStopCommand { };

/// Operator only.
struct TBroadcastCommand {
    std::string Text;
};

using TCommand = std::variant<
    TStartCommand,
    THelpCommand,
    TUsersCommand,
    TThreadsCommand,
    TRandomCommand,
    TSendCommand,
    TReplyCommand,
    TCloseCommand,
    TBanCommand,
    TUnbanCommand,
    TBanlistCommand,
    TStopCommand,
    TBroadcastCommand>;

/// "/start", "/send", ... or "reply" for TReplyCommand.
std::string_view CommandName(const TCommand& command);

/**
 * @brief Parses the text of an incoming message.
 *
 * The first whitespace-delimited token selects the command; message text
 * arguments keep their inner spacing. A message sent as a reply to
 * @p replyTo is always a TReplyCommand.
 *
 * @throws TParseError on an empty message, an unknown command or a missing argument.
 */
TCommand ParseCommand(std::string_view text, TMessageId messageId, std::optional<TMessageId> replyTo = std::nullopt);

} // namespace NRelay
