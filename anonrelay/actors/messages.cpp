#include "messages.hpp"

namespace NRelay {
namespace NActors {

TFuture<void> TThread::SendText(std::string text) const {
    auto other = Other;
    co_await other->SendAction(TSendText{OtherId, std::move(text)});
    co_return;
}

TFuture<void> TThread::Terminate() const {
    auto other = Other;
    co_await other->SendAction(TTerminateThread{OtherId});
    co_return;
}

bool TThread::operator==(const TThread& other) const {
    return Id == other.Id
        && AnonMode == other.AnonMode
        && OtherId == other.OtherId
        && (Other && other.Other ? Other->User.Login == other.Other->User.Login : Other == other.Other);
}

TFuture<void> TUserHandle::SendAction(TAction action) {
    co_await Ask(Actions, [&](TReplySender reply) {
        return TActionRequest{std::move(action), std::move(reply)};
    });
    co_return;
}

} // namespace NActors
} // namespace NRelay
