#include "data.hpp"

#include <stdexcept>

namespace NRelay {

std::string TUser::DisplayName() const {
    std::string name = FirstName;
    if (LastName) {
        name += " " + *LastName;
    }
    return name + " @" + Login;
}

std::string_view ToString(EAnonymityMode mode) {
    switch (mode) {
    case EAnonymityMode::Me:
        return "Me";
    case EAnonymityMode::Them:
        return "Them";
    case EAnonymityMode::Both:
        return "Both";
    }
    return "Unknown";
}

EAnonymityMode AnonymityModeFromString(std::string_view name) {
    if (name == "Me") {
        return EAnonymityMode::Me;
    } else if (name == "Them") {
        return EAnonymityMode::Them;
    } else if (name == "Both") {
        return EAnonymityMode::Both;
    }
    throw std::invalid_argument("unknown anonymity mode: " + std::string(name));
}

EAnonymityMode MirrorMode(EAnonymityMode mode) {
    switch (mode) {
    case EAnonymityMode::Me:
        return EAnonymityMode::Them;
    case EAnonymityMode::Them:
        return EAnonymityMode::Me;
    case EAnonymityMode::Both:
        return EAnonymityMode::Both;
    }
    return mode;
}

} // namespace NRelay
