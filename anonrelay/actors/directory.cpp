#include "directory.hpp"

#include <mutex>

namespace NRelay {
namespace NActors {

TUserHandlePtr TUserDirectory::Find(const std::string& login) const {
    std::shared_lock guard(Mutex_);
    auto it = Handles_.find(login);
    return it == Handles_.end() ? nullptr : it->second;
}

std::vector<TUserHandlePtr> TUserDirectory::Snapshot() const {
    std::shared_lock guard(Mutex_);
    std::vector<TUserHandlePtr> handles;
    handles.reserve(Handles_.size());
    for (const auto& [_, handle] : Handles_) {
        handles.push_back(handle);
    }
    return handles;
}

bool TUserDirectory::InsertIfAbsent(TUserHandlePtr handle) {
    std::unique_lock guard(Mutex_);
    auto login = handle->User.Login;
    return Handles_.emplace(std::move(login), std::move(handle)).second;
}

size_t TUserDirectory::Size() const {
    std::shared_lock guard(Mutex_);
    return Handles_.size();
}

} // namespace NActors
} // namespace NRelay
