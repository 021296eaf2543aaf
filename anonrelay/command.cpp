#include "command.hpp"

#include "errors.hpp"
#include "overloaded.hpp"

namespace NRelay {

namespace {

constexpr std::string_view Spaces = " \t\r\n";

std::string_view TrimLeft(std::string_view s) {
    auto pos = s.find_first_not_of(Spaces);
    return pos == std::string_view::npos ? std::string_view{} : s.substr(pos);
}

std::string_view TrimRight(std::string_view s) {
    auto pos = s.find_last_not_of(Spaces);
    return pos == std::string_view::npos ? std::string_view{} : s.substr(0, pos + 1);
}

/// Splits off the first token of @p s, leaving the rest (not trimmed) in @p s.
std::string_view NextToken(std::string_view& s) {
    s = TrimLeft(s);
    auto end = s.find_first_of(Spaces);
    auto token = s.substr(0, end);
    s = end == std::string_view::npos ? std::string_view{} : s.substr(end);
    return token;
}

std::string RequireText(std::string_view rest) {
    auto text = TrimRight(TrimLeft(rest));
    if (text.empty()) {
        throw TParseError("message text is empty");
    }
    return std::string(text);
}

TThreadId RequireThreadId(std::string_view& rest) {
    auto threadId = NextToken(rest);
    if (threadId.empty()) {
        throw TParseError("no thread specified");
    }
    return TThreadId(threadId);
}

} // namespace

std::string_view CommandName(const TCommand& command) {
    return std::visit(TOverloaded{
        [](const TStartCommand&) { return std::string_view("/start"); },
        [](const THelpCommand&) { return std::string_view("/help"); },
        [](const TUsersCommand&) { return std::string_view("/users"); },
        [](const TThreadsCommand&) { return std::string_view("/threads"); },
        [](const TRandomCommand&) { return std::string_view("/random"); },
        [](const TSendCommand&) { return std::string_view("/send"); },
        [](const TReplyCommand&) { return std::string_view("reply"); },
        [](const TCloseCommand&) { return std::string_view("/close"); },
        [](const TBanCommand&) { return std::string_view("/ban"); },
        [](const TUnbanCommand&) { return std::string_view("/unban"); },
        [](const TBanlistCommand&) { return std::string_view("/banlist"); },
        [](const TStopCommand&) { return std::string_view("/stop"); },
        [](const TBroadcastCommand&) { return std::string_view("/broadcast"); },
    }, command);
}

TCommand ParseCommand(std::string_view text, TMessageId messageId, std::optional<TMessageId> replyTo) {
    if (TrimLeft(text).empty()) {
        throw TParseError("empty message");
    }
    if (replyTo) {
        return TReplyCommand{*replyTo, messageId, std::string(text)};
    }

    auto rest = text;
    auto head = NextToken(rest);
    if (head == "/start") {
        return TStartCommand{};
    } else if (head == "/help") {
        return THelpCommand{};
    } else if (head == "/users") {
        return TUsersCommand{};
    } else if (head == "/threads") {
        return TThreadsCommand{};
    } else if (head == "/random") {
        return TRandomCommand{messageId, RequireText(rest)};
    } else if (head == "/send") {
        auto threadId = NextToken(rest);
        if (threadId.empty()) {
            throw TParseError("no receiver specified");
        }
        return TSendCommand{TThreadId(threadId), messageId, RequireText(rest)};
    } else if (head == "/close") {
        return TCloseCommand{RequireThreadId(rest)};
    } else if (head == "/ban") {
        return TBanCommand{RequireThreadId(rest)};
    } else if (head == "/unban") {
        return TUnbanCommand{RequireThreadId(rest)};
    } else if (head == "/banlist") {
        return TBanlistCommand{};
    } else if (head == "/stop") {
        return TStopCommand{};
    } else if (head == "/broadcast") {
        return TBroadcastCommand{RequireText(rest)};
    }
    throw TParseError("unknown command: " + std::string(head));
}

} // namespace NRelay
