#include <cerrno>
#include <fstream>
#include <iostream>
#include <system_error>

#include <anonrelay/actors/dispatcher.hpp>
#include <anonrelay/command.hpp>
#include <anonrelay/config.hpp>
#include <anonrelay/console.hpp>
#include <anonrelay/errors.hpp>
#include <anonrelay/events/event_log.hpp>
#include <anonrelay/events/event_service.hpp>
#include <anonrelay/file.hpp>
#include <anonrelay/log.hpp>
#include <anonrelay/loop.hpp>
#include <anonrelay/names.hpp>
#include <anonrelay/poll.hpp>
#include <anonrelay/transport.hpp>

using namespace NRelay;
using namespace NRelay::NActors;
using namespace NRelay::NEvents;

TFuture<void> console(TLineReader& reader, TCommandDispatcher& dispatcher, TConsoleTransport& transport) {
    while (true) {
        std::string error;
        try {
            auto line = co_await reader.Read();
            if (!line) {
                break;
            }
            if (line->find_first_not_of(" \t") == std::string::npos) {
                continue;
            }
            auto input = ParseConsoleLine(*line);
            auto chatId = ConsoleChatId(input.User.Login);
            transport.RegisterChat(chatId, input.User.Login);
            auto messageId = transport.NextMessageId();
            std::cout << "<- @" << input.User.Login << " [" << messageId << "]\n";
            auto command = ParseCommand(input.Text, messageId, input.ReplyTo);
            co_await dispatcher.Dispatch(std::move(input.User), chatId, std::move(command));
        } catch (const TRelayError& ex) {
            error = ex.what();
        }
        if (!error.empty()) {
            std::cout << "Error: " << error << ".\n";
        }
    }
    co_return;
}

int run(const TConfig& config) {
    auto logger = MakeStderrLogger(config.Verbose);
    Log(logger, ELogLevel::Info, "Starting anonrelay...");

    TLoop<TPoll> loop;
    TFileEventWriter writer(config.LogPath, config.Fsync);
    TEventService eventService(&loop.Poller(), writer, config.MaxBatch, logger);
    TConsoleTransport transport(std::cout);
    TRandomThreadIdGenerator threadIds;

    TRelayOptions options;
    options.OperatorLogin = config.OperatorLogin;
    options.MailboxCapacity = config.MailboxCapacity;
    options.CommandDelay = config.CommandDelay;
    TCommandDispatcher dispatcher(&loop.Poller(), transport, eventService.Handle(), threadIds, options, logger);

    {
        std::ifstream log(config.LogPath);
        if (!log) {
            throw std::system_error(errno, std::generic_category(), "open " + config.LogPath);
        }
        TEventLogReader reader(log);
        transport.ContinueAfter(dispatcher.Restore(reader));
    }

    auto events = eventService.Run();
    TFileHandle input(0, loop.Poller());
    TLineReader reader(input);
    auto frontEnd = console(reader, dispatcher, transport);
    while (!frontEnd.done()) {
        loop.Step();
    }
    frontEnd.await_resume();
    Log(logger, ELogLevel::Info, "Input is closed, exiting");
    return 0;
}

int main(int argc, char** argv) {
    TConfig config;
    try {
        config = ParseArgs(argc, argv);
    } catch (const std::invalid_argument& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        Usage(argv[0]);
        return 1;
    }
    if (config.Help) {
        Usage(argv[0]);
        return 0;
    }

    try {
        return run(config);
    } catch (const TReplayError& ex) {
        std::cerr << "[error] cannot replay event log " << config.LogPath << ": " << ex.what() << "\n";
    } catch (const std::system_error& ex) {
        std::cerr << "[error] " << ex.what() << "\n";
    }
    return 1;
}
