#include "core/types/ActivateStatus.hpp"

namespace portlock::core {

std::string activateStatusToString(ActivateStatus status) {
    switch (status) {
    case ActivateStatus::Activated:
        return "Activated";
    case ActivateStatus::NoInstance:
        return "NoInstance";
    case ActivateStatus::CannotActivate:
        return "CannotActivate";
    }
    return "NoInstance";
}

ActivateStatus activateStatusFromString(const std::string& str) {
    if (str == "Activated")
        return ActivateStatus::Activated;
    if (str == "CannotActivate")
        return ActivateStatus::CannotActivate;
    return ActivateStatus::NoInstance;
}

} // namespace portlock::core
