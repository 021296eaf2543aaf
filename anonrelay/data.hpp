#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace NRelay {

using TChatId = int64_t;
using TMessageId = int32_t;

/**
 * @brief Thread identifier, unique per owning actor.
 *
 * "@login" names a thread addressed directly to a login, "#words" a randomly
 * minted anonymous thread.
 */
using TThreadId = std::string;

inline bool IsDirectThreadId(std::string_view id) {
    return !id.empty() && id.front() == '@';
}

inline bool IsRandomThreadId(std::string_view id) {
    return !id.empty() && id.front() == '#';
}

struct TUser {
    std::string Login;
    std::string FirstName;
    std::optional<std::string> LastName;

    /// "First [Last] @login", the form used in user listings.
    std::string DisplayName() const;

    bool operator==(const TUser&) const = default;
};

/**
 * @brief Who is identified on a thread, fixed when the thread is created.
 *
 * Me   - I am visible to the peer, the peer is anonymous to me.
 * Them - the peer is visible to me, I am anonymous to them.
 * Both - neither side is identified (random pairing).
 *
 * A directed "/send @login" creates Me on the sender and Them on the receiver.
 */
enum class EAnonymityMode {
    Me,
    Them,
    Both,
};

std::string_view ToString(EAnonymityMode mode);
/// @throws std::invalid_argument on an unknown name.
EAnonymityMode AnonymityModeFromString(std::string_view name);
/// Mode of the peer's half of a thread created with @p mode.
EAnonymityMode MirrorMode(EAnonymityMode mode);

} // namespace NRelay
