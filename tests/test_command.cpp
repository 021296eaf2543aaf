#include <chrono>
#include <stdarg.h>
#include <stddef.h>
#include <setjmp.h>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

#include <anonrelay/command.hpp>
#include <anonrelay/config.hpp>
#include <anonrelay/console.hpp>
#include <anonrelay/errors.hpp>

#include "testlib.h"

extern "C" {
#include <cmocka.h>
}

using namespace NRelay;

namespace {

std::string ParseError(const std::string& text, std::optional<TMessageId> replyTo = std::nullopt) {
    try {
        ParseCommand(text, 1, replyTo);
    } catch (const TParseError& ex) {
        return ex.what();
    }
    return "";
}

TConfig Parse(std::vector<std::string> args) {
    args.insert(args.begin(), "anonrelay-bot");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    return ParseArgs(static_cast<int>(argv.size()), argv.data());
}

std::string ArgsError(std::vector<std::string> args) {
    try {
        Parse(std::move(args));
    } catch (const std::invalid_argument& ex) {
        return ex.what();
    }
    return "";
}

} // namespace

void test_simple_commands(void**) {
    assert_true(std::holds_alternative<TStartCommand>(ParseCommand("/start", 1)));
    assert_true(std::holds_alternative<THelpCommand>(ParseCommand("/help", 1)));
    assert_true(std::holds_alternative<TUsersCommand>(ParseCommand("  /users  ", 1)));
    assert_true(std::holds_alternative<TThreadsCommand>(ParseCommand("/threads", 1)));
    assert_true(std::holds_alternative<TBanlistCommand>(ParseCommand("/banlist", 1)));
    assert_true(std::holds_alternative<TStopCommand>(ParseCommand("/stop extra words", 1)));

    std::vector<std::pair<std::string, std::string>> names = {
        {"/start", "/start"}, {"/random hi", "/random"}, {"/send @a hi", "/send"},
        {"/close #t", "/close"}, {"/ban #t", "/ban"}, {"/unban #t", "/unban"},
        {"/broadcast hi", "/broadcast"},
    };
    for (const auto& [text, name] : names) {
        assert_string_equal(std::string(CommandName(ParseCommand(text, 1))).c_str(), name.c_str());
    }
}

void test_send_command(void**) {
    auto command = ParseCommand("/send @bob  hello   world ", 17);
    assert_true(std::holds_alternative<TSendCommand>(command));
    const auto& send = std::get<TSendCommand>(command);
    assert_string_equal(send.ThreadId.c_str(), "@bob");
    assert_int_equal(send.MessageId, 17);
    assert_string_equal(send.Text.c_str(), "hello   world");

    auto multiline = std::get<TSendCommand>(ParseCommand("/send #quiet_owl line one\nline two", 3));
    assert_string_equal(multiline.ThreadId.c_str(), "#quiet_owl");
    assert_string_equal(multiline.Text.c_str(), "line one\nline two");

    assert_string_equal(ParseError("/send").c_str(), "no receiver specified");
    assert_string_equal(ParseError("/send @bob").c_str(), "message text is empty");
    assert_string_equal(ParseError("/send @bob    ").c_str(), "message text is empty");
}

void test_random_and_broadcast(void**) {
    auto random = std::get<TRandomCommand>(ParseCommand("/random  anyone there?", 5));
    assert_int_equal(random.MessageId, 5);
    assert_string_equal(random.Text.c_str(), "anyone there?");
    assert_string_equal(ParseError("/random").c_str(), "message text is empty");

    auto broadcast = std::get<TBroadcastCommand>(ParseCommand("/broadcast maintenance at 5", 6));
    assert_string_equal(broadcast.Text.c_str(), "maintenance at 5");
    assert_string_equal(ParseError("/broadcast ").c_str(), "message text is empty");
}

void test_thread_commands(void**) {
    assert_string_equal(std::get<TCloseCommand>(ParseCommand("/close #t1", 1)).ThreadId.c_str(), "#t1");
    assert_string_equal(std::get<TBanCommand>(ParseCommand("/ban   #t2 please", 1)).ThreadId.c_str(), "#t2");
    assert_string_equal(std::get<TUnbanCommand>(ParseCommand("/unban @x", 1)).ThreadId.c_str(), "@x");
    assert_string_equal(ParseError("/close").c_str(), "no thread specified");
    assert_string_equal(ParseError("/ban  ").c_str(), "no thread specified");
    assert_string_equal(ParseError("/unban").c_str(), "no thread specified");
}

void test_reply_takes_precedence(void**) {
    auto command = ParseCommand("/start", 9, 4);
    assert_true(std::holds_alternative<TReplyCommand>(command));
    const auto& reply = std::get<TReplyCommand>(command);
    assert_int_equal(reply.ReplyMessageId, 4);
    assert_int_equal(reply.MessageId, 9);
    assert_string_equal(reply.Text.c_str(), "/start");
    assert_string_equal(std::string(CommandName(command)).c_str(), "reply");

    assert_string_equal(ParseError("   ", 4).c_str(), "empty message");
}

void test_parse_errors(void**) {
    assert_string_equal(ParseError("").c_str(), "empty message");
    assert_string_equal(ParseError(" \n\t").c_str(), "empty message");
    assert_string_equal(ParseError("/frobnicate now").c_str(), "unknown command: /frobnicate");
    assert_string_equal(ParseError("hello there").c_str(), "unknown command: hello");
    assert_string_equal(ParseError("/START").c_str(), "unknown command: /START");
}

void test_console_line(void**) {
    auto input = ParseConsoleLine("alice: /send @bob hi there");
    assert_string_equal(input.User.Login.c_str(), "alice");
    assert_string_equal(input.User.FirstName.c_str(), "alice");
    assert_false(input.User.LastName.has_value());
    assert_false(input.ReplyTo.has_value());
    assert_string_equal(input.Text.c_str(), "/send @bob hi there");

    auto named = ParseConsoleLine("@bob Bob Stone ^12:  with spaces");
    assert_string_equal(named.User.Login.c_str(), "bob");
    assert_string_equal(named.User.FirstName.c_str(), "Bob Stone");
    assert_true(named.ReplyTo.has_value());
    assert_int_equal(*named.ReplyTo, 12);
    assert_string_equal(named.Text.c_str(), " with spaces");

    auto colons = ParseConsoleLine("carol: time is 10:30");
    assert_string_equal(colons.Text.c_str(), "time is 10:30");

    std::vector<std::pair<std::string, std::string>> broken = {
        {"no separator", "expected '<login>: <text>'"},
        {": text", "no login given"},
        {"@ : text", "no login given"},
        {"dave ^x1: hi", "bad reply target: ^x1"},
    };
    for (const auto& [line, error] : broken) {
        std::string what;
        try {
            ParseConsoleLine(line);
        } catch (const TParseError& ex) {
            what = ex.what();
        }
        assert_string_equal(what.c_str(), error.c_str());
    }

    assert_true(ConsoleChatId("alice") == ConsoleChatId("alice"));
    assert_true(ConsoleChatId("alice") != ConsoleChatId("bob"));
    assert_true(ConsoleChatId("alice") >= 0);
}

void test_config(void**) {
    auto defaults = Parse({});
    assert_string_equal(defaults.LogPath.c_str(), "events.log");
    assert_string_equal(defaults.OperatorLogin.c_str(), "sergio_4min");
    assert_int_equal(defaults.MailboxCapacity, 100);
    assert_int_equal(defaults.MaxBatch, 1000);
    assert_true(defaults.CommandDelay == std::chrono::milliseconds(250));
    assert_false(defaults.Fsync);
    assert_false(defaults.Verbose);
    assert_false(defaults.Help);

    auto config = Parse({"--log", "/var/lib/relay/events.log", "--operator", "root", "--mailbox", "8",
        "--batch", "64", "--delay", "0", "--fsync", "--verbose"});
    assert_string_equal(config.LogPath.c_str(), "/var/lib/relay/events.log");
    assert_string_equal(config.OperatorLogin.c_str(), "root");
    assert_int_equal(config.MailboxCapacity, 8);
    assert_int_equal(config.MaxBatch, 64);
    assert_true(config.CommandDelay.count() == 0);
    assert_true(config.Fsync);
    assert_true(config.Verbose);
    assert_true(Parse({"--help"}).Help);

    assert_string_equal(ArgsError({"--bogus"}).c_str(), "unknown option: --bogus");
    assert_string_equal(ArgsError({"--log"}).c_str(), "--log requires a value");
    assert_string_equal(ArgsError({"--mailbox", "0"}).c_str(), "--mailbox must be positive");
    assert_string_equal(ArgsError({"--batch", "lots"}).c_str(), "--batch: not a number: lots");
    assert_string_equal(ArgsError({"--delay", "5ms"}).c_str(), "--delay: not a number: 5ms");
}

int main(int argc, char** argv) {
    std::vector<CMUnitTest> tests;
    std::unordered_set<std::string> filters;

    parse_filters(argc, argv, filters);

    ADD_TEST(cmocka_unit_test, test_simple_commands);
    ADD_TEST(cmocka_unit_test, test_send_command);
    ADD_TEST(cmocka_unit_test, test_random_and_broadcast);
    ADD_TEST(cmocka_unit_test, test_thread_commands);
    ADD_TEST(cmocka_unit_test, test_reply_takes_precedence);
    ADD_TEST(cmocka_unit_test, test_parse_errors);
    ADD_TEST(cmocka_unit_test, test_console_line);
    ADD_TEST(cmocka_unit_test, test_config);

    return _cmocka_run_group_tests("test_command", tests.data(), tests.size(), NULL, NULL);
}
