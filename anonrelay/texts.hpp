#pragma once

namespace NRelay {

inline constexpr const char* StartMessage =
    "Hello! This is anonymous chatting bot. Quick start guide:\n"
    "\n"
    "* Use command `/send @login Hello!` to send an anonymous message to a particular user;\n"
    "* Use command `/random Hello!` to start a chat with a random user;\n"
    "* Use command `/users` to list all available users.\n"
    "\n"
    "For more commands, use `/help`.";

inline constexpr const char* HelpMessage =
    "Available commands:\n"
    "* `/send [receiver] [message]` - send a message. Receiver can either be a @username or a #thread.\n"
    "* `/random [message]` - start an anonymous thread with a random user.\n"
    "* `/users` - list available users.\n"
    "* `/threads` - list active anonymous threads.\n"
    "* `/close [thread]` - close a thread you started or a random one.\n"
    "* `/ban [thread]` - close a thread opened to you and block its author.\n"
    "* `/unban [thread]` - lift a ban.\n"
    "* `/banlist` - list banned threads.\n"
    "* `/stop` - stop receiving messages.\n"
    "* `/help` - show this message.\n"
    "\n"
    "Hints:\n"
    "* You can reply to a message instead of using `/send` command.";

inline constexpr const char* StopMessage =
    "You will not receive messages any more. Use `/start` to come back.";

} // namespace NRelay
