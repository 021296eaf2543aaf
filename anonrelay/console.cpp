#include "console.hpp"

#include <charconv>
#include <cstdint>
#include <vector>

#include "errors.hpp"

namespace NRelay {

TConsoleInput ParseConsoleLine(std::string_view line) {
    auto colon = line.find(':');
    if (colon == std::string_view::npos) {
        throw TParseError("expected '<login>: <text>'");
    }
    auto header = line.substr(0, colon);
    auto text = line.substr(colon + 1);
    if (!text.empty() && text.front() == ' ') {
        text.remove_prefix(1);
    }

    std::vector<std::string_view> words;
    size_t pos = 0;
    while (pos < header.size()) {
        auto start = header.find_first_not_of(' ', pos);
        if (start == std::string_view::npos) {
            break;
        }
        auto end = header.find(' ', start);
        if (end == std::string_view::npos) {
            end = header.size();
        }
        words.push_back(header.substr(start, end - start));
        pos = end;
    }
    if (words.empty()) {
        throw TParseError("no login given");
    }

    TConsoleInput input;
    auto login = words.front();
    if (login.front() == '@') {
        login.remove_prefix(1);
    }
    if (login.empty()) {
        throw TParseError("no login given");
    }
    input.User.Login = std::string(login);

    std::string firstName;
    for (size_t i = 1; i < words.size(); ++i) {
        auto word = words[i];
        if (word.front() == '^') {
            TMessageId replyTo = 0;
            auto [ptr, ec] = std::from_chars(word.data() + 1, word.data() + word.size(), replyTo);
            if (ec != std::errc() || ptr != word.data() + word.size()) {
                throw TParseError("bad reply target: " + std::string(word));
            }
            input.ReplyTo = replyTo;
        } else {
            if (!firstName.empty()) {
                firstName += ' ';
            }
            firstName += word;
        }
    }
    input.User.FirstName = firstName.empty() ? input.User.Login : firstName;
    input.Text = std::string(text);
    return input;
}

TChatId ConsoleChatId(std::string_view login) {
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : login) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return static_cast<TChatId>(hash >> 1);
}

} // namespace NRelay
