/**
 * @file ILockNotifier.hpp
 * @brief Interface for user-facing notifications raised by the instance lock.
 */

#pragma once

#include <string>

namespace portlock::core {

/**
 * @brief Receives events that the user should be told about.
 *
 * The lock itself never presents anything; the host application decides how
 * these events reach the user.
 */
class ILockNotifier {
public:
    virtual ~ILockNotifier() = default;

    /**
     * @brief A peer sent an activation command with a wrong token.
     * @param peer Description of the remote endpoint.
     *
     * Called on the listener thread.
     */
    virtual void unauthorizedRequest(const std::string& peer) = 0;

    /**
     * @brief No port of the candidate range could be bound.
     *
     * Raised at most once per lock object.
     */
    virtual void lockUnavailable() = 0;

    /**
     * @brief The listener stopped on an unexpected error.
     * @param reason Description of the error.
     *
     * From this point on other processes can no longer find this instance.
     */
    virtual void listenerFailed(const std::string& reason) = 0;
};

} // namespace portlock::core
