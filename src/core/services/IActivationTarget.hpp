/**
 * @file IActivationTarget.hpp
 * @brief State the activation listener serves to connecting peers.
 */

#pragma once

#include <string>
#include <vector>

namespace portlock::core {

/**
 * @brief The instance state behind a listener.
 *
 * All methods are called on the listener thread and must synchronize with
 * the threads that modify the state.
 */
class IActivationTarget {
public:
    virtual ~IActivationTarget() = default;

    /**
     * @brief Gets a consistent snapshot of the locked paths.
     */
    virtual std::vector<std::string> lockedPaths() const = 0;

    /**
     * @brief Checks a token received in an activation command.
     * @param token The first field of the command.
     * @return True if it equals this process's secret token.
     */
    virtual bool isTokenValid(const std::string& token) const = 0;

    /**
     * @brief Handles an authenticated activation request.
     * @param args Working directory of the peer followed by its arguments.
     */
    virtual void activate(const std::vector<std::string>& args) = 0;
};

} // namespace portlock::core
