#include "transport.hpp"

#include "errors.hpp"

namespace NRelay {

void TConsoleTransport::RegisterChat(TChatId chatId, std::string name) {
    Chats_[chatId] = std::move(name);
}

TFuture<TMessageId> TConsoleTransport::SendMessage(TChatId chatId, std::string text) {
    auto it = Chats_.find(chatId);
    auto id = NextMessageId();
    if (it == Chats_.end()) {
        Out_ << "-> chat " << chatId;
    } else {
        Out_ << "-> @" << it->second;
    }
    Out_ << " [" << id << "]\n" << text << "\n";
    Out_.flush();
    if (!Out_) {
        throw TTransportError("failed to write message");
    }
    co_return id;
}

} // namespace NRelay
