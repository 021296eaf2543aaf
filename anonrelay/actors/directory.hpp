#pragma once

#include <map>
#include <shared_mutex>
#include <string>
#include <vector>

#include "messages.hpp"

namespace NRelay {
namespace NActors {

/**
 * @brief login -> handle map shared by every actor and the dispatcher.
 *
 * Readers (peer lookup, listings) share the lock; only actor creation takes
 * it exclusively. The lock is never held across a suspension point.
 */
class TUserDirectory {
public:
    TUserHandlePtr Find(const std::string& login) const;

    /// All handles, ordered by login.
    std::vector<TUserHandlePtr> Snapshot() const;

    /// @return false if @p handle's login is already registered.
    bool InsertIfAbsent(TUserHandlePtr handle);

    size_t Size() const;

private:
    mutable std::shared_mutex Mutex_;
    std::map<std::string, TUserHandlePtr> Handles_;
};

} // namespace NActors
} // namespace NRelay
