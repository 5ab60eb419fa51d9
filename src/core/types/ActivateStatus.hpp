/**
 * @file ActivateStatus.hpp
 * @brief Outcome of an attempt to hand startup arguments to a running instance.
 */

#pragma once

#include <string>

namespace portlock::core {

/**
 * @brief Result of SocketLock::lock() and of probing a single port.
 */
enum class ActivateStatus : int {
    Activated = 0,     ///< A running instance accepted the arguments; the caller should exit
    NoInstance = 1,    ///< No instance claims the path; the caller runs standalone
    CannotActivate = 2 ///< An instance claims the path but the handshake failed
};

/**
 * @brief Converts an ActivateStatus to a string.
 * @param status The status to convert.
 * @return "Activated", "NoInstance" or "CannotActivate".
 */
std::string activateStatusToString(ActivateStatus status);

/**
 * @brief Parses a string produced by activateStatusToString().
 * @param str The string to parse.
 * @return The matching status, NoInstance for unknown strings.
 */
ActivateStatus activateStatusFromString(const std::string& str);

} // namespace portlock::core
