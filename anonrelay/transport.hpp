#pragma once

#include <algorithm>
#include <map>
#include <ostream>
#include <string>

#include "corochain.hpp"
#include "data.hpp"

namespace NRelay {

/**
 * @brief Outgoing side of the chat front end.
 *
 * SendMessage() delivers @p text to a chat and yields the id the delivered
 * message got there; replies to that id are resolved through it.
 * Implementations report delivery failures with TTransportError.
 */
class ITransport {
public:
    virtual ~ITransport() = default;
    virtual TFuture<TMessageId> SendMessage(TChatId chatId, std::string text) = 0;
};

/**
 * @brief Transport that prints to a stream.
 *
 * Incoming and outgoing messages share one id sequence, so an id shown for
 * a delivered message can be replied to from the console.
 */
class TConsoleTransport: public ITransport {
public:
    explicit TConsoleTransport(std::ostream& out)
        : Out_(out)
    { }

    TFuture<TMessageId> SendMessage(TChatId chatId, std::string text) override;

    /// Name printed for @p chatId, the login owning the chat.
    void RegisterChat(TChatId chatId, std::string name);

    TMessageId NextMessageId() {
        return NextId_++;
    }

    /// Moves numbering past @p lastId, the largest id a previous run used.
    void ContinueAfter(TMessageId lastId) {
        NextId_ = std::max(NextId_, lastId + 1);
    }

private:
    std::ostream& Out_;
    std::map<TChatId, std::string> Chats_;
    TMessageId NextId_ = 1;
};

} // namespace NRelay
