#include "event.hpp"

#include <memory>
#include <sstream>
#include <stdexcept>

#include <json/json.h>

#include <anonrelay/overloaded.hpp>

namespace NRelay {
namespace NEvents {

namespace {

Json::Value UserToJson(const TUser& user) {
    Json::Value value(Json::objectValue);
    value["login"] = user.Login;
    value["first_name"] = user.FirstName;
    value["last_name"] = user.LastName ? Json::Value(*user.LastName) : Json::Value(Json::nullValue);
    return value;
}

const Json::Value& Field(const Json::Value& object, const char* name) {
    if (!object.isObject() || !object.isMember(name)) {
        throw std::invalid_argument(std::string("missing field '") + name + "'");
    }
    return object[name];
}

std::string StringField(const Json::Value& object, const char* name) {
    const auto& value = Field(object, name);
    if (!value.isString()) {
        throw std::invalid_argument(std::string("field '") + name + "' is not a string");
    }
    return value.asString();
}

Json::Int64 IntField(const Json::Value& object, const char* name) {
    const auto& value = Field(object, name);
    if (!value.isIntegral()) {
        throw std::invalid_argument(std::string("field '") + name + "' is not an integer");
    }
    return value.asInt64();
}

TUser UserFromJson(const Json::Value& value) {
    TUser user;
    user.Login = StringField(value, "login");
    user.FirstName = StringField(value, "first_name");
    if (value.isMember("last_name") && !value["last_name"].isNull()) {
        user.LastName = StringField(value, "last_name");
    }
    return user;
}

std::pair<std::string, Json::Value> ToJson(const TEvent& event) {
    Json::Value body(Json::objectValue);
    std::visit(TOverloaded{
        [&](const TUserConnected& ev) {
            body["user"] = UserToJson(ev.User);
            body["chat_id"] = Json::Int64(ev.ChatId);
        },
        [&](const TThreadStarted& ev) {
            body["login"] = ev.Login;
            body["other_login"] = ev.OtherLogin;
            body["my_thread_id"] = ev.MyThreadId;
            body["other_thread_id"] = ev.OtherThreadId;
            body["anon_mode"] = std::string(ToString(ev.AnonMode));
        },
        [&](const TThreadMessageReceived& ev) {
            body["login"] = ev.Login;
            body["message_id"] = Json::Int(ev.MessageId);
            body["thread_id"] = ev.ThreadId;
        },
        [&](const TThreadTerminated& ev) {
            body["login"] = ev.Login;
            body["other_login"] = ev.OtherLogin;
            body["my_thread_id"] = ev.MyThreadId;
            body["other_thread_id"] = ev.OtherThreadId;
        },
        [&](const TUserBanned& ev) {
            body["login"] = ev.Login;
            body["banned_login"] = ev.BannedLogin;
            body["banned_thread_id"] = ev.BannedThreadId;
            if (!ev.OtherThreadId.empty()) {
                body["other_thread_id"] = ev.OtherThreadId;
            }
        },
        [&](const TUserUnbanned& ev) {
            body["login"] = ev.Login;
            body["unbanned_login"] = ev.UnbannedLogin;
        },
        [&](const TUserStopped& ev) {
            body["login"] = ev.Login;
        },
        [&](const TUserStarted& ev) {
            body["login"] = ev.Login;
        },
    }, event);
    return {std::string(EventName(event)), std::move(body)};
}

TEvent FromJson(const std::string& name, const Json::Value& body) {
    if (name == "UserConnected") {
        return TUserConnected{
            .User = UserFromJson(Field(body, "user")),
            .ChatId = IntField(body, "chat_id"),
        };
    } else if (name == "ThreadStarted") {
        return TThreadStarted{
            .Login = StringField(body, "login"),
            .OtherLogin = StringField(body, "other_login"),
            .MyThreadId = StringField(body, "my_thread_id"),
            .OtherThreadId = StringField(body, "other_thread_id"),
            .AnonMode = AnonymityModeFromString(StringField(body, "anon_mode")),
        };
    } else if (name == "ThreadMessageReceived") {
        return TThreadMessageReceived{
            .Login = StringField(body, "login"),
            .MessageId = static_cast<TMessageId>(IntField(body, "message_id")),
            .ThreadId = StringField(body, "thread_id"),
        };
    } else if (name == "ThreadTerminated") {
        return TThreadTerminated{
            .Login = StringField(body, "login"),
            .OtherLogin = StringField(body, "other_login"),
            .MyThreadId = StringField(body, "my_thread_id"),
            .OtherThreadId = StringField(body, "other_thread_id"),
        };
    } else if (name == "UserBanned") {
        return TUserBanned{
            .Login = StringField(body, "login"),
            .BannedLogin = StringField(body, "banned_login"),
            .BannedThreadId = StringField(body, "banned_thread_id"),
            .OtherThreadId = body.isMember("other_thread_id") ? StringField(body, "other_thread_id") : TThreadId{},
        };
    } else if (name == "UserUnbanned") {
        return TUserUnbanned{
            .Login = StringField(body, "login"),
            .UnbannedLogin = StringField(body, "unbanned_login"),
        };
    } else if (name == "UserStopped") {
        return TUserStopped{.Login = StringField(body, "login")};
    } else if (name == "UserStarted") {
        return TUserStarted{.Login = StringField(body, "login")};
    }
    throw std::invalid_argument("unknown event: " + name);
}

} // namespace

std::string_view EventName(const TEvent& event) {
    return std::visit(TOverloaded{
        [](const TUserConnected&) { return std::string_view("UserConnected"); },
        [](const TThreadStarted&) { return std::string_view("ThreadStarted"); },
        [](const TThreadMessageReceived&) { return std::string_view("ThreadMessageReceived"); },
        [](const TThreadTerminated&) { return std::string_view("ThreadTerminated"); },
        [](const TUserBanned&) { return std::string_view("UserBanned"); },
        [](const TUserUnbanned&) { return std::string_view("UserUnbanned"); },
        [](const TUserStopped&) { return std::string_view("UserStopped"); },
        [](const TUserStarted&) { return std::string_view("UserStarted"); },
    }, event);
}

std::string Serialize(const TEvent& event) {
    auto [name, body] = ToJson(event);
    Json::Value root(Json::objectValue);
    root[name] = std::move(body);

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, root);
}

TEvent Deserialize(const std::string& line) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(line.data(), line.data() + line.size(), &root, &errors)) {
        throw std::invalid_argument("malformed JSON: " + errors);
    }
    if (!root.isObject() || root.size() != 1) {
        throw std::invalid_argument("event must be an object with exactly one key");
    }
    auto name = root.getMemberNames().front();
    return FromJson(name, root[name]);
}

} // namespace NEvents
} // namespace NRelay
