#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdarg.h>
#include <stddef.h>
#include <setjmp.h>
#include <string>
#include <system_error>
#include <sys/resource.h>
#include <sys/stat.h>
#include <unistd.h>
#include <unordered_set>
#include <utility>
#include <vector>

#include <anonrelay/channel.hpp>
#include <anonrelay/errors.hpp>
#include <anonrelay/events/event.hpp>
#include <anonrelay/events/event_log.hpp>
#include <anonrelay/events/event_service.hpp>
#include <anonrelay/file.hpp>
#include <anonrelay/log.hpp>
#include <anonrelay/loop.hpp>
#include <anonrelay/poll.hpp>
#include <anonrelay/queue.hpp>

#include "relay_fixture.h"
#include "testlib.h"

extern "C" {
#include <cmocka.h>
}

using namespace NRelay;
using namespace NRelay::NEvents;

namespace {

TFuture<void> Produce(TSender<int> sender, int count, std::vector<int>& produced) {
    for (int i = 0; i < count; ++i) {
        co_await sender.Send(int(i));
        produced.push_back(i);
    }
    sender = TSender<int>();
    co_return;
}

TFuture<void> Consume(TReceiver<int>& receiver, std::vector<int>& consumed) {
    while (auto item = co_await receiver.Receive()) {
        consumed.push_back(*item);
    }
    co_return;
}

struct TCheck {
    int Value = 0;
    TReplySender Reply;
};

TFuture<void> ServeChecks(TReceiver<TCheck>& inbox, int& served) {
    while (auto request = co_await inbox.Receive()) {
        ++served;
        TReplyResult result;
        if (request->Value < 0) {
            result = std::make_exception_ptr(TUserError("negative value"));
        }
        request->Reply.Send(result);
    }
    co_return;
}

std::string FatalError(TFuture<void>& future) {
    try {
        future.await_resume();
    } catch (const TFatalError& ex) {
        return ex.what();
    }
    return "";
}

std::string DeserializeError(const std::string& line) {
    try {
        Deserialize(line);
    } catch (const std::invalid_argument& ex) {
        return ex.what();
    }
    return "";
}

struct TTempFile {
    TTempFile() {
        char name[] = "/tmp/anonrelay-test-XXXXXX";
        int fd = mkstemp(name);
        if (fd < 0) {
            throw std::system_error(errno, std::generic_category(), "mkstemp");
        }
        ::close(fd);
        Path = name;
    }

    ~TTempFile() {
        ::unlink(Path.c_str());
    }

    std::string Path;
};

} // namespace

void test_ring_queue(void**) {
    TRingQueue<int> queue(2);
    for (int i = 0; i < 10; ++i) {
        queue.Push(int(i));
    }
    assert_true(queue.Size() == 10);

    int value = -1;
    for (int i = 0; i < 5; ++i) {
        assert_true(queue.TryPop(value));
        assert_true(value == i);
    }
    for (int i = 10; i < 15; ++i) {
        queue.Push(int(i));
    }
    for (int i = 5; i < 15; ++i) {
        assert_true(queue.TryPop(value));
        assert_true(value == i);
    }
    assert_true(queue.Empty());
    assert_false(queue.TryPop(value));
}

void test_channel_backpressure(void**) {
    TLoop<TPoll> loop;
    auto [sender, receiver] = MakeChannel<int>(&loop.Poller(), 2);

    std::vector<int> produced;
    std::vector<int> consumed;
    auto producer = Produce(std::move(sender), 5, produced);
    // the third Send waits for room
    assert_int_equal(produced.size(), 2);
    assert_int_equal(receiver.Size(), 2);
    assert_false(producer.done());

    auto consumer = Consume(receiver, consumed);
    drive(loop, consumer);

    assert_true(producer.done());
    std::vector<int> expected = {0, 1, 2, 3, 4};
    assert_true(produced == expected);
    assert_true(consumed == expected);
    assert_true(receiver.Exhausted());
}

void test_channel_closed_receiver(void**) {
    TLoop<TPoll> loop;
    auto [sender, receiver] = MakeChannel<int>(&loop.Poller(), 1);

    auto first = sender.Send(1);
    assert_true(first.done());
    auto blocked = sender.Send(2);
    assert_false(blocked.done());

    receiver.Close();
    drive(loop, blocked);
    assert_string_equal(FatalError(blocked).c_str(), "mailbox is closed");

    auto late = sender.Send(3);
    assert_true(late.done());
    assert_string_equal(FatalError(late).c_str(), "mailbox is closed");
    assert_int_equal(receiver.Size(), 0);
}

void test_dropped_reply(void**) {
    TLoop<TPoll> loop;
    auto [reply, receiver] = MakeOneshot<TReplyResult>(&loop.Poller());

    auto waiting = WaitReply(std::move(receiver));
    assert_false(waiting.done());
    {
        auto dropped = std::move(reply);
    }
    drive(loop, waiting);
    assert_string_equal(FatalError(waiting).c_str(), "reply channel dropped");
}

void test_ask(void**) {
    TLoop<TPoll> loop;
    auto [sender, receiver] = MakeChannel<TCheck>(&loop.Poller(), 1);
    int served = 0;
    auto server = ServeChecks(receiver, served);

    {
        auto ok = Ask(sender, [](TReplySender reply) {
            return TCheck{1, std::move(reply)};
        });
        drive(loop, ok);
        assert_string_equal(relay_error(ok).c_str(), "");
    }
    {
        auto failed = Ask(sender, [](TReplySender reply) {
            return TCheck{-1, std::move(reply)};
        });
        drive(loop, failed);
        assert_string_equal(relay_error(failed).c_str(), "negative value");
    }
    assert_int_equal(served, 2);

    sender = TSender<TCheck>();
    drive(loop, server);
    assert_true(receiver.Exhausted());
}

void test_event_json(void**) {
    auto event = Deserialize(R"({"UserConnected":{"user":{"login":"alice","first_name":"Alice","last_name":null},"chat_id":42}})");
    assert_true(std::holds_alternative<TUserConnected>(event));
    const auto& connected = std::get<TUserConnected>(event);
    assert_string_equal(connected.User.Login.c_str(), "alice");
    assert_string_equal(connected.User.FirstName.c_str(), "Alice");
    assert_false(connected.User.LastName.has_value());
    assert_true(connected.ChatId == 42);

    auto line = Serialize(event);
    assert_null(strchr(line.c_str(), '\n'));
    assert_non_null(strstr(line.c_str(), "{\"UserConnected\":{"));
    assert_non_null(strstr(line.c_str(), "\"last_name\":null"));
    assert_non_null(strstr(line.c_str(), "\"chat_id\":42"));

    auto started = Serialize(TThreadStarted{"alice", "bob", "@bob", "#t1", EAnonymityMode::Me});
    assert_non_null(strstr(started.c_str(), "\"anon_mode\":\"Me\""));
    assert_non_null(strstr(started.c_str(), "\"my_thread_id\":\"@bob\""));
    assert_non_null(strstr(started.c_str(), "\"other_thread_id\":\"#t1\""));
    assert_string_equal(std::string(EventName(Deserialize(started))).c_str(), "ThreadStarted");

    auto named = Deserialize(R"({"UserConnected":{"user":{"login":"bob","first_name":"Bob","last_name":"Стоун"},"chat_id":-7}})");
    assert_string_equal(std::get<TUserConnected>(named).User.LastName->c_str(), "Стоун");
    assert_non_null(strstr(Serialize(named).c_str(), "Стоун"));
}

void test_event_banned_mirror_is_optional(void**) {
    auto old = Deserialize(R"({"UserBanned":{"login":"bob","banned_login":"alice","banned_thread_id":"#t1"}})");
    assert_true(std::get<TUserBanned>(old).OtherThreadId.empty());
    assert_null(strstr(Serialize(old).c_str(), "other_thread_id"));

    auto recent = Deserialize(Serialize(TUserBanned{"bob", "alice", "#t1", "@bob"}));
    assert_string_equal(std::get<TUserBanned>(recent).OtherThreadId.c_str(), "@bob");
}

void test_event_decode_errors(void**) {
    assert_string_equal(DeserializeError("{}").c_str(), "event must be an object with exactly one key");
    assert_string_equal(DeserializeError(R"({"Bogus":{}})").c_str(), "unknown event: Bogus");
    assert_string_equal(DeserializeError(R"({"UserStopped":{}})").c_str(), "missing field 'login'");
    assert_string_equal(DeserializeError(R"({"UserStopped":{"login":5}})").c_str(), "field 'login' is not a string");
    assert_string_equal(DeserializeError(
        R"({"ThreadStarted":{"login":"a","other_login":"b","my_thread_id":"#x","other_thread_id":"#y","anon_mode":"Nobody"}})").c_str(),
        "unknown anonymity mode: Nobody");
    auto malformed = DeserializeError("not json");
    assert_true(malformed.rfind("malformed JSON: ", 0) == 0);
}

void test_event_log_reader(void**) {
    auto first = Serialize(TUserStarted{"alice"});
    auto second = Serialize(TUserStopped{"alice"});
    std::istringstream input("\n" + first + "\n  \n" + second + "\n");
    TEventLogReader reader(input);

    auto event = reader.Next();
    assert_true(event && std::holds_alternative<TUserStarted>(*event));
    assert_int_equal(reader.LineNumber(), 2);
    event = reader.Next();
    assert_true(event && std::holds_alternative<TUserStopped>(*event));
    assert_int_equal(reader.LineNumber(), 4);
    assert_false(reader.Next().has_value());

    std::istringstream broken(first + "\n" + first + "\n{\"UserStarted\":\n");
    TEventLogReader brokenReader(broken);
    assert_true(brokenReader.Next().has_value());
    assert_true(brokenReader.Next().has_value());
    size_t line = 0;
    try {
        brokenReader.Next();
    } catch (const TReplayError& ex) {
        line = ex.Line();
    }
    assert_int_equal(line, 3);
}

void test_file_event_writer(void**) {
    TTempFile file;
    {
        TFileEventWriter writer(file.Path, true);
        writer.Write({TUserConnected{MakeUser("alice"), 1}, TUserStarted{"alice"}});
    }
    {
        TFileEventWriter writer(file.Path, false);
        writer.Write({TUserStopped{"alice"}});
    }

    std::ifstream input(file.Path);
    TEventLogReader reader(input);
    std::vector<std::string> names;
    while (auto event = reader.Next()) {
        names.emplace_back(EventName(*event));
    }
    std::vector<std::string> expected = {"UserConnected", "UserStarted", "UserStopped"};
    assert_true(names == expected);
    assert_int_equal(reader.LineNumber(), 3);

    bool thrown = false;
    try {
        TFileEventWriter writer("/nonexistent-dir/events.log", false);
    } catch (const std::system_error&) {
        thrown = true;
    }
    assert_true(thrown);
}

void test_file_event_writer_drops_partial_batch(void**) {
    TTempFile file;
    auto fileSize = [&]() {
        struct stat st;
        assert_true(::stat(file.Path.c_str(), &st) == 0);
        return static_cast<size_t>(st.st_size);
    };

    TFileEventWriter writer(file.Path, false);
    writer.Write({TUserConnected{MakeUser("alice"), 1}});
    auto size = fileSize();

    // the file may grow by a few bytes only, so the next batch is cut short
    struct rlimit saved;
    assert_true(getrlimit(RLIMIT_FSIZE, &saved) == 0);
    auto oldHandler = signal(SIGXFSZ, SIG_IGN);
    struct rlimit limited = saved;
    limited.rlim_cur = size + 10;
    assert_true(setrlimit(RLIMIT_FSIZE, &limited) == 0);

    int code = 0;
    try {
        writer.Write({TUserStarted{"alice"}, TUserStopped{"alice"}});
    } catch (const std::system_error& ex) {
        code = ex.code().value();
    }

    assert_true(setrlimit(RLIMIT_FSIZE, &saved) == 0);
    signal(SIGXFSZ, oldHandler);

    assert_int_equal(code, EFBIG);
    assert_int_equal(fileSize(), size);

    writer.Write({TUserStopped{"alice"}});
    std::ifstream input(file.Path);
    TEventLogReader reader(input);
    std::vector<std::string> names;
    while (auto event = reader.Next()) {
        names.emplace_back(EventName(*event));
    }
    std::vector<std::string> expected = {"UserConnected", "UserStopped"};
    assert_true(names == expected);
}

void test_event_service_batches(void**) {
    TLoop<TPoll> loop;
    TMemoryEventWriter writer;
    TEventService service(&loop.Poller(), writer);
    auto handle = service.Handle();

    auto a = handle.Write(TUserStarted{"a"});
    auto b = handle.WriteBatch({TUserStopped{"b"}, TUserStarted{"b"}});
    auto c = handle.Write(TUserStopped{"c"});
    auto running = service.Run();

    for (auto* tracker : {&a, &b, &c}) {
        auto written = tracker->WaitWritten();
        drive(loop, written);
        assert_string_equal(relay_error(written).c_str(), "");
    }
    assert_int_equal(writer.Batches.size(), 1);
    std::vector<std::string> names;
    for (const auto& event : writer.Batches[0]) {
        names.emplace_back(EventName(event));
    }
    std::vector<std::string> expected = {"UserStarted", "UserStopped", "UserStarted", "UserStopped"};
    assert_true(names == expected);

    // requests written after the first batch go out on their own
    auto d = handle.Write(TUserStarted{"d"});
    auto written = d.WaitWritten();
    drive(loop, written);
    assert_string_equal(relay_error(written).c_str(), "");
    assert_int_equal(writer.Batches.size(), 2);

    assert_false(running.done());
    handle = TEventServiceHandle();
    drive(loop, running);
}

void test_event_service_max_batch(void**) {
    TLoop<TPoll> loop;
    TMemoryEventWriter writer;
    TEventService service(&loop.Poller(), writer, 2);
    auto handle = service.Handle();

    std::vector<TEventTracker> trackers;
    for (int i = 0; i < 3; ++i) {
        trackers.emplace_back(handle.Write(TUserStarted{std::to_string(i)}));
    }
    auto running = service.Run();
    for (auto& tracker : trackers) {
        auto written = tracker.WaitWritten();
        drive(loop, written);
    }

    assert_int_equal(writer.Batches.size(), 2);
    assert_int_equal(writer.Batches[0].size(), 2);
    assert_int_equal(writer.Batches[1].size(), 1);
    assert_string_equal(std::get<TUserStarted>(writer.Batches[1][0]).Login.c_str(), "2");
}

void test_event_service_failure_reaches_every_caller(void**) {
    TLoop<TPoll> loop;
    TMemoryEventWriter writer;
    std::vector<std::string> logged;
    TEventService service(&loop.Poller(), writer, 1000, [&](ELogLevel level, const std::string& message) {
        if (level == ELogLevel::Error) {
            logged.push_back(message);
        }
    });
    auto handle = service.Handle();

    writer.Fail = true;
    auto a = handle.Write(TUserStarted{"a"});
    auto b = handle.Write(TUserStarted{"b"});
    auto running = service.Run();

    for (auto* tracker : {&a, &b}) {
        auto written = tracker->WaitWritten();
        drive(loop, written);
        assert_string_equal(relay_error(written).c_str(), "persistence error: disk is full");
    }
    assert_int_equal(logged.size(), 1);
    assert_string_equal(logged[0].c_str(), "failed to write events: disk is full");

    // the service keeps going after a failed batch
    writer.Fail = false;
    auto c = handle.Write(TUserStarted{"c"});
    auto written = c.WaitWritten();
    drive(loop, written);
    assert_string_equal(relay_error(written).c_str(), "");
    assert_int_equal(writer.Count(), 1);
}

void test_disconnected_event_handle(void**) {
    TEventServiceHandle handle;
    std::string error;
    try {
        handle.Write(TUserStarted{"a"});
    } catch (const TFatalError& ex) {
        error = ex.what();
    }
    assert_string_equal(error.c_str(), "event service is not connected");
}

namespace {

/// Reads until end of input; lines that failed to read are recorded as "! <error>".
std::vector<std::string> read_lines(TLoop<TPoll>& loop, TLineReader& reader) {
    std::vector<std::string> lines;
    while (true) {
        auto next = reader.Read();
        drive(loop, next);
        try {
            auto line = next.await_resume();
            if (!line) {
                break;
            }
            lines.push_back(*line);
        } catch (const TParseError& ex) {
            lines.push_back(std::string("! ") + ex.what());
        }
    }
    return lines;
}

} // namespace

void test_line_reader(void**) {
    TLoop<TPoll> loop;
    int fds[2];
    assert_true(pipe(fds) == 0);
    std::string data = "alice: /start\r\nbob: hi\n0123456789\nabc: 12\r\nend";
    assert_true(write(fds[1], data.data(), data.size()) == static_cast<ssize_t>(data.size()));
    close(fds[1]);

    TFileHandle input(fds[0], loop.Poller());
    TLineReader reader(input, 8);
    std::vector<std::string> expected = {
        "! line is longer than 8 bytes", "bob: hi", "! line is longer than 8 bytes", "abc: 12", "end"
    };
    assert_true(read_lines(loop, reader) == expected);
}

void test_line_reader_skips_long_line(void**) {
    TLoop<TPoll> loop;
    int fds[2];
    assert_true(pipe(fds) == 0);
    std::string data = "alice: " + std::string(4989, 'x') + "bob: /stop\ncarol: /users\ndave: " + std::string(5000, 'y');
    assert_true(write(fds[1], data.data(), data.size()) == static_cast<ssize_t>(data.size()));
    close(fds[1]);

    TFileHandle input(fds[0], loop.Poller());
    TLineReader reader(input);
    std::vector<std::string> expected = {
        "! line is longer than 4096 bytes", "carol: /users", "! line is longer than 4096 bytes"
    };
    assert_true(read_lines(loop, reader) == expected);
}

void test_line_reader_waits_for_data(void**) {
    TLoop<TPoll> loop;
    int fds[2];
    assert_true(pipe(fds) == 0);

    TFileHandle input(fds[0], loop.Poller());
    TLineReader reader(input);
    auto next = reader.Read();
    loop.Step();
    assert_false(next.done());

    std::string data = "carol: /users\n";
    assert_true(write(fds[1], data.data(), data.size()) == static_cast<ssize_t>(data.size()));
    drive(loop, next);
    auto line = next.await_resume();
    assert_true(line.has_value());
    assert_string_equal(line->c_str(), "carol: /users");
    close(fds[1]);
}

int main(int argc, char** argv) {
    std::vector<CMUnitTest> tests;
    std::unordered_set<std::string> filters;

    parse_filters(argc, argv, filters);

    ADD_TEST(cmocka_unit_test, test_ring_queue);
    ADD_TEST(cmocka_unit_test, test_channel_backpressure);
    ADD_TEST(cmocka_unit_test, test_channel_closed_receiver);
    ADD_TEST(cmocka_unit_test, test_dropped_reply);
    ADD_TEST(cmocka_unit_test, test_ask);
    ADD_TEST(cmocka_unit_test, test_event_json);
    ADD_TEST(cmocka_unit_test, test_event_banned_mirror_is_optional);
    ADD_TEST(cmocka_unit_test, test_event_decode_errors);
    ADD_TEST(cmocka_unit_test, test_event_log_reader);
    ADD_TEST(cmocka_unit_test, test_file_event_writer);
    ADD_TEST(cmocka_unit_test, test_file_event_writer_drops_partial_batch);
    ADD_TEST(cmocka_unit_test, test_event_service_batches);
    ADD_TEST(cmocka_unit_test, test_event_service_max_batch);
    ADD_TEST(cmocka_unit_test, test_event_service_failure_reaches_every_caller);
    ADD_TEST(cmocka_unit_test, test_disconnected_event_handle);
    ADD_TEST(cmocka_unit_test, test_line_reader);
    ADD_TEST(cmocka_unit_test, test_line_reader_skips_long_line);
    ADD_TEST(cmocka_unit_test, test_line_reader_waits_for_data);

    return _cmocka_run_group_tests("test_relay", tests.data(), tests.size(), NULL, NULL);
}
