/**
 * @file IInstanceLock.hpp
 * @brief Interface for the single-instance lock.
 *
 * This file defines the abstract interface used by an application to claim
 * instance ownership of a path, or to forward its startup arguments to the
 * instance that already owns it.
 */

#pragma once

#include "core/types/ActivateStatus.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace portlock::core {

/**
 * @brief Interface for the single-instance lock.
 *
 * A lock object binds at most one lock socket for the lifetime of the
 * process, publishes the paths it has locked to peers, and accepts
 * authenticated activation requests from them.
 */
class IInstanceLock {
public:
    /**
     * @brief Callback invoked when a peer process asks this instance to activate.
     * @param args Working directory of the peer followed by its extra arguments.
     *
     * Called on the listener thread.
     */
    using ActivateCallback = std::function<void(const std::vector<std::string>& args)>;

    virtual ~IInstanceLock() = default;

    /**
     * @brief Locks a path or activates the instance that already holds it.
     * @param path Path this process wants to be responsible for.
     * @param tokenPath Directory holding the "token" file.
     * @param markPort Whether to write the acquired port to path/port.
     * @param args Arguments forwarded to a running instance.
     * @return Activated, CannotActivate, or NoInstance when this process keeps the lock.
     */
    virtual ActivateStatus lock(const std::string& path, const std::string& tokenPath,
                                bool markPort, const std::vector<std::string>& args) = 0;

    /**
     * @brief Same as lock(path, path, markPort, args).
     */
    virtual ActivateStatus lock(const std::string& path, bool markPort,
                                const std::vector<std::string>& args) = 0;

    /**
     * @brief Closes the lock socket. Subsequent calls have no effect.
     */
    virtual void dispose() = 0;

    /**
     * @brief Gets the port of the lock socket.
     * @return The port, or nullopt if no lock socket was acquired.
     */
    virtual std::optional<uint16_t> acquiredPort() const = 0;

    /**
     * @brief Checks whether this object currently holds a lock socket.
     */
    virtual bool isLocked() const = 0;

    /**
     * @brief Gets a snapshot of the locked paths in the order they were locked.
     */
    virtual std::vector<std::string> lockedPaths() const = 0;

    /**
     * @brief Sets the callback for accepted activation requests.
     * @param callback Callback to invoke, or nullptr to only acknowledge requests.
     */
    virtual void setActivateListener(ActivateCallback callback) = 0;
};

} // namespace portlock::core
