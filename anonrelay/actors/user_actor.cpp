#include "user_actor.hpp"

#include <algorithm>
#include <exception>
#include <vector>

#include <anonrelay/errors.hpp>
#include <anonrelay/overloaded.hpp>
#include <anonrelay/texts.hpp>

namespace NRelay {
namespace NActors {

using namespace NEvents;

namespace {

std::string Join(const std::vector<std::string>& items, const std::string& separator) {
    std::string result;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            result += separator;
        }
        result += items[i];
    }
    return result;
}

std::string FormatIncoming(EAnonymityMode mode, const TThreadId& threadId, const std::string& text) {
    switch (mode) {
    case EAnonymityMode::Me:
        return ">>> Message from " + threadId + ":\n" + text;
    case EAnonymityMode::Them:
        return ">>> Message from anonymous " + threadId + ":\n" + text;
    case EAnonymityMode::Both:
        return ">>> Message from random chat " + threadId + ":\n" + text;
    }
    return text;
}

constexpr int MaxThreadIdAttempts = 16;

} // namespace

TMailboxes::TMailboxes(TPollerBase* poller, size_t capacity)
    : Slot(std::make_shared<TWaitSlot>(poller))
{
    auto [commandSender, commands] = MakeChannel<TCommandRequest>(Slot, capacity);
    CommandSender = std::move(commandSender);
    Commands = std::move(commands);
    auto [actionSender, actions] = MakeChannel<TActionRequest>(Slot, capacity);
    ActionSender = std::move(actionSender);
    Actions = std::move(actions);
}

TUserActor::TUserActor(const TRelayContext& context,
                       TUserHandlePtr self,
                       TChatId chatId,
                       TUserState state,
                       std::shared_ptr<TWaitSlot> slot,
                       TReceiver<TCommandRequest> commands,
                       TReceiver<TActionRequest> actions)
    : Context_(context)
    , Events_(context.Events)
    , Self_(std::move(self))
    , ChatId_(chatId)
    , State_(std::move(state))
    , Slot_(std::move(slot))
    , Commands_(std::move(commands))
    , Actions_(std::move(actions))
    , Random_(std::random_device{}())
{ }

TUserActor::~TUserActor() {
    Slot_->Reset();
}

TFuture<void> TUserActor::Run() {
    try {
        co_await Serve();
    } catch (const std::exception& ex) {
        Log(Context_.Logger, ELogLevel::Error, "user actor @" + Login() + " has crashed: " + ex.what());
        Commands_.Close();
        Actions_.Close();
        throw;
    }
    Log(Context_.Logger, ELogLevel::Debug, "user actor has terminated: @" + Login());
    co_return;
}

TFuture<void> TUserActor::Serve() {
    bool commandsFirst = true;
    while (!Commands_.Exhausted() || !Actions_.Exhausted()) {
        TCommandRequest command;
        TActionRequest action;
        if (commandsFirst && Commands_.TryReceive(command)) {
            co_await ServeCommand(std::move(command));
        } else if (Actions_.TryReceive(action)) {
            co_await ServeAction(std::move(action));
        } else if (Commands_.TryReceive(command)) {
            co_await ServeCommand(std::move(command));
        } else {
            co_await Slot_->Wait();
            continue;
        }
        commandsFirst = !commandsFirst;
    }
    co_return;
}

TFuture<void> TUserActor::ServeCommand(TCommandRequest request) {
    TReplyResult result;
    try {
        co_await HandleCommand(std::move(request.Command));
    } catch (const TRelayError&) {
        result = std::current_exception();
    }
    request.Reply.Send(result);
    if (Context_.Options.CommandDelay.count() > 0) {
        co_await Context_.Poller->Sleep(Context_.Options.CommandDelay);
    }
    co_return;
}

TFuture<void> TUserActor::ServeAction(TActionRequest request) {
    TReplyResult result;
    try {
        co_await HandleAction(std::move(request.Action));
    } catch (const TRelayError&) {
        result = std::current_exception();
    }
    request.Reply.Send(result);
    co_return;
}

TFuture<void> TUserActor::HandleCommand(TCommand command) {
    if (Self_->Stopped && !std::holds_alternative<TStartCommand>(command)) {
        throw TUserError("you have stopped the bot. Use `/start` to restart it");
    }
    Log(Context_.Logger, ELogLevel::Debug, "@" + Login() + ": " + std::string(CommandName(command)));
    co_await std::visit(TOverloaded{
        [&](TStartCommand&) { return Start(); },
        [&](THelpCommand&) { return Help(); },
        [&](TUsersCommand&) { return Users(); },
        [&](TThreadsCommand&) { return Threads(); },
        [&](TRandomCommand& c) { return Random(c.MessageId, std::move(c.Text)); },
        [&](TSendCommand& c) { return Send(std::move(c.ThreadId), c.MessageId, std::move(c.Text)); },
        [&](TReplyCommand& c) { return Reply(c.ReplyMessageId, c.MessageId, std::move(c.Text)); },
        [&](TCloseCommand& c) { return Close(std::move(c.ThreadId)); },
        [&](TBanCommand& c) { return Ban(std::move(c.ThreadId)); },
        [&](TUnbanCommand& c) { return Unban(std::move(c.ThreadId)); },
        [&](TBanlistCommand&) { return Banlist(); },
        [&](TStopCommand&) { return Stop(); },
        [&](TBroadcastCommand& c) { return Broadcast(std::move(c.Text)); },
    }, command);
    co_return;
}

TFuture<void> TUserActor::Start() {
    co_await Events_.Write(TUserStarted{Login()}).WaitWritten();
    Self_->Stopped = false;
    co_await SendToSelf(StartMessage);
    co_return;
}

TFuture<void> TUserActor::Stop() {
    co_await Events_.Write(TUserStopped{Login()}).WaitWritten();
    Self_->Stopped = true;
    co_await SendToSelf(StopMessage);
    co_return;
}

TFuture<void> TUserActor::Help() {
    co_await SendToSelf(HelpMessage);
    co_return;
}

TFuture<void> TUserActor::Users() {
    std::vector<std::string> names;
    for (const auto& handle : Context_.Directory->Snapshot()) {
        if (!handle->Stopped) {
            names.push_back(handle->User.DisplayName());
        }
    }
    std::sort(names.begin(), names.end());
    co_await SendToSelf("Available users:\n* " + Join(names, "\n* "));
    co_return;
}

TFuture<void> TUserActor::Threads() {
    std::vector<std::string> threadIds;
    for (const auto& [id, _] : State_.Threads) {
        if (IsRandomThreadId(id)) {
            threadIds.push_back(id);
        }
    }
    if (threadIds.empty()) {
        co_await SendToSelf("There are no active threads.");
    } else {
        co_await SendToSelf("Active threads:\n* " + Join(threadIds, "\n* "));
    }
    co_return;
}

TFuture<void> TUserActor::Random(TMessageId messageId, std::string text) {
    std::vector<std::string> candidates;
    for (const auto& handle : Context_.Directory->Snapshot()) {
        if (handle->User.Login != Login()) {
            candidates.push_back(handle->User.Login);
        }
    }
    if (candidates.empty()) {
        throw TUserError("there are currently no other users to chat with");
    }
    std::uniform_int_distribution<size_t> pick(0, candidates.size() - 1);
    auto otherLogin = candidates[pick(Random_)];

    auto myThreadId = FreshThreadId();
    auto otherThreadId = co_await CreateThread(myThreadId, otherLogin, EAnonymityMode::Both);
    State_.MessageIndex[messageId] = myThreadId;

    std::vector<TEvent> events;
    events.push_back(TThreadStarted{Login(), otherLogin, myThreadId, otherThreadId, EAnonymityMode::Both});
    events.push_back(TThreadMessageReceived{Login(), messageId, myThreadId});
    co_await Events_.WriteBatch(std::move(events)).WaitWritten();

    co_await State_.Threads.at(myThreadId).SendText(std::move(text));

    auto ackId = co_await SendToSelf("Started a new anonymous thread " + myThreadId + ".");
    State_.MessageIndex[ackId] = myThreadId;
    co_await Events_.Write(TThreadMessageReceived{Login(), ackId, myThreadId}).WaitWritten();
    co_return;
}

TFuture<void> TUserActor::Send(TThreadId threadId, TMessageId messageId, std::string text) {
    std::vector<TEvent> events;
    if (!State_.Threads.contains(threadId)) {
        if (!IsDirectThreadId(threadId)) {
            throw TUserError("unknown thread: " + threadId);
        }
        auto otherLogin = threadId.substr(1);
        if (otherLogin == Login()) {
            throw TUserError("cannot send a message to self");
        }
        auto otherThreadId = co_await CreateThread(threadId, otherLogin, EAnonymityMode::Me);
        events.emplace_back(TThreadStarted{Login(), otherLogin, threadId, otherThreadId, EAnonymityMode::Me});
    }

    State_.MessageIndex[messageId] = threadId;
    events.emplace_back(TThreadMessageReceived{Login(), messageId, threadId});
    co_await Events_.WriteBatch(std::move(events)).WaitWritten();

    co_await State_.Threads.at(threadId).SendText(std::move(text));
    co_return;
}

TFuture<void> TUserActor::Reply(TMessageId replyMessageId, TMessageId messageId, std::string text) {
    auto indexed = State_.MessageIndex.find(replyMessageId);
    if (indexed == State_.MessageIndex.end()) {
        throw TUserError("message you are replying to does not belong to a thread");
    }
    auto threadId = indexed->second;
    auto thread = State_.Threads.find(threadId);
    if (thread == State_.Threads.end()) {
        throw TUserError("thread does not exist anymore");
    }
    auto target = thread->second;

    State_.MessageIndex[messageId] = threadId;
    co_await Events_.Write(TThreadMessageReceived{Login(), messageId, threadId}).WaitWritten();

    co_await target.SendText(std::move(text));
    co_return;
}

TFuture<void> TUserActor::Close(TThreadId threadId) {
    auto it = State_.Threads.find(threadId);
    if (it == State_.Threads.end()) {
        throw TUserError("thread " + threadId + " does not exist");
    }
    if (it->second.AnonMode == EAnonymityMode::Them) {
        throw TUserError("cannot close a semi-anonimous thread; use `/ban` instead");
    }
    auto thread = it->second;

    try {
        co_await thread.Terminate();
    } catch (const TRelayError&) {
        RethrowWithContext("failed to terminate peer thread");
    }
    State_.Threads.erase(threadId);

    co_await Events_.Write(TThreadTerminated{
        Login(), thread.Other->User.Login, thread.Id, thread.OtherId,
    }).WaitWritten();
    co_return;
}

TFuture<void> TUserActor::Ban(TThreadId threadId) {
    auto it = State_.Threads.find(threadId);
    if (it == State_.Threads.end()) {
        throw TUserError("thread " + threadId + " does not exist");
    }
    if (it->second.AnonMode != EAnonymityMode::Them) {
        throw TUserError("cannot ban random or non-anonimous chat; use `/close` instead");
    }
    auto thread = it->second;

    try {
        co_await thread.Terminate();
    } catch (const TRelayError&) {
        RethrowWithContext("failed to terminate peer thread");
    }
    State_.Threads.erase(threadId);

    const auto& bannedLogin = thread.Other->User.Login;
    co_await Events_.Write(TUserBanned{Login(), bannedLogin, thread.Id, thread.OtherId}).WaitWritten();
    State_.Banlist[bannedLogin] = thread.Id;
    co_return;
}

TFuture<void> TUserActor::Unban(TThreadId threadId) {
    auto it = std::find_if(State_.Banlist.begin(), State_.Banlist.end(), [&](const auto& entry) {
        return entry.second == threadId;
    });
    if (it == State_.Banlist.end()) {
        throw TUserError("no " + threadId + " in your ban list");
    }
    auto login = it->first;

    co_await Events_.Write(TUserUnbanned{Login(), login}).WaitWritten();
    State_.Banlist.erase(login);
    co_return;
}

TFuture<void> TUserActor::Banlist() {
    std::vector<std::string> threadIds;
    for (const auto& [_, threadId] : State_.Banlist) {
        threadIds.push_back(threadId);
    }
    std::sort(threadIds.begin(), threadIds.end());
    if (threadIds.empty()) {
        co_await SendToSelf("You have not banned anybody.");
    } else {
        co_await SendToSelf("Banned threads:\n* " + Join(threadIds, "\n* "));
    }
    co_return;
}

TFuture<void> TUserActor::Broadcast(std::string text) {
    if (Login() != Context_.Options.OperatorLogin) {
        throw TUserError("you are not admin");
    }
    auto handles = Context_.Directory->Snapshot();
    co_await SendToSelf("Starting broadcast to " + std::to_string(handles.size()) + " users...");

    for (const auto& handle : handles) {
        std::string error;
        try {
            if (handle == Self_) {
                // our own mailbox is not served while this command runs
                co_await SendToSelf(text);
            } else {
                co_await handle->SendAction(TBroadcast{text});
            }
        } catch (const TRelayError& ex) {
            error = ex.what();
        }
        if (!error.empty()) {
            co_await SendToSelf("Failed to send broadcast to user @" + handle->User.Login + ": " + error);
        }
    }

    co_await SendToSelf("Broadcast is finished.");
    co_return;
}

TFuture<void> TUserActor::HandleAction(TAction action) {
    if (Self_->Stopped) {
        throw TUserError("user has stopped the bot");
    }
    co_await std::visit(TOverloaded{
        [&](TStartAnonymousThread& a) { return StartAnonymousThread(std::move(a.Thread)); },
        [&](TSendText& a) { return ReceiveText(std::move(a.ThreadId), std::move(a.Text)); },
        [&](TTerminateThread& a) { return TerminateThread(std::move(a.ThreadId)); },
        [&](TBroadcast& a) { return ReceiveBroadcast(std::move(a.Text)); },
    }, action);
    co_return;
}

TFuture<void> TUserActor::StartAnonymousThread(TThread thread) {
    if (State_.Threads.contains(thread.Id)) {
        throw TThreadIdTakenError("thread id " + thread.Id + " is already used");
    }
    const auto& otherLogin = thread.Other->User.Login;
    if (thread.AnonMode == EAnonymityMode::Them && State_.Banlist.contains(otherLogin)) {
        throw TUserError("you are banned by this user");
    }

    co_await Events_.Write(TThreadStarted{
        Login(), otherLogin, thread.Id, thread.OtherId, thread.AnonMode,
    }).WaitWritten();
    auto id = thread.Id;
    State_.Threads.emplace(std::move(id), std::move(thread));
    co_return;
}

TFuture<void> TUserActor::ReceiveText(TThreadId threadId, std::string text) {
    auto it = State_.Threads.find(threadId);
    if (it == State_.Threads.end()) {
        throw TUserError("thread " + threadId + " does not exist");
    }
    auto messageId = co_await SendToSelf(FormatIncoming(it->second.AnonMode, threadId, text));

    co_await Events_.Write(TThreadMessageReceived{Login(), messageId, threadId}).WaitWritten();
    State_.MessageIndex[messageId] = threadId;
    co_return;
}

TFuture<void> TUserActor::TerminateThread(TThreadId threadId) {
    if (!State_.Threads.erase(threadId)) {
        throw TUserError("thread " + threadId + " does not exist");
    }
    co_await SendToSelf("Thread " + threadId + " has been closed by the other side.");
    co_return;
}

TFuture<void> TUserActor::ReceiveBroadcast(std::string text) {
    co_await SendToSelf(std::move(text));
    co_return;
}

TFuture<TThreadId> TUserActor::CreateThread(TThreadId myThreadId, std::string otherLogin, EAnonymityMode mode) {
    auto other = Context_.Directory->Find(otherLogin);
    if (!other) {
        throw TUserError("user has not started this bot");
    }
    if (other == Self_) {
        throw TUserError("cannot send a message to self");
    }

    for (int attempt = 0; attempt < MaxThreadIdAttempts; ++attempt) {
        auto otherThreadId = Context_.ThreadIds->Generate();
        TThread theirs{otherThreadId, MirrorMode(mode), myThreadId, Self_};
        try {
            co_await other->SendAction(TStartAnonymousThread{std::move(theirs)});
        } catch (const TThreadIdTakenError&) {
            continue;
        }
        State_.Threads.emplace(myThreadId, TThread{myThreadId, mode, otherThreadId, std::move(other)});
        co_return otherThreadId;
    }
    throw TUserError("failed to pick a free thread id, try again");
}

TFuture<TMessageId> TUserActor::SendToSelf(std::string text) {
    Log(Context_.Logger, ELogLevel::Debug, "sending message to @" + Login() + ": " + text);
    TMessageId messageId = 0;
    try {
        messageId = co_await Context_.Transport->SendMessage(ChatId_, std::move(text));
    } catch (const TTransportError&) {
        RethrowWithContext("failed to send message to user");
    }
    co_return messageId;
}

TThreadId TUserActor::FreshThreadId() {
    for (int attempt = 0; attempt < MaxThreadIdAttempts; ++attempt) {
        auto id = Context_.ThreadIds->Generate();
        if (!State_.Threads.contains(id)) {
            return id;
        }
    }
    throw TUserError("failed to pick a free thread id, try again");
}

} // namespace NActors
} // namespace NRelay
