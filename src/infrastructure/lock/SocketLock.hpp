#pragma once

#include "core/services/IActivationTarget.hpp"
#include "core/services/IInstanceLock.hpp"
#include "core/services/ILockNotifier.hpp"
#include "core/types/CandidatePorts.hpp"
#include "infrastructure/network/ActivationListener.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace portlock::infra {

/**
 * @brief Tunables of the instance lock.
 */
struct LockOptions {
    core::PortRange range;                               ///< Candidate ports
    std::chrono::milliseconds probeTimeout{300};         ///< Read deadline when probing peers
    std::chrono::milliseconds listenerTimeout{800};      ///< Per-connection deadline of the listener
};

/**
 * @brief Single-instance lock backed by a loopback listening socket.
 *
 * The first lock() binds one port of the candidate range (the lock socket) and
 * starts an ActivationListener on it. lock() then probes every other candidate
 * port for an instance that already owns the path and asks it to activate. If
 * none does, this process keeps the lock and publishes the path to peers.
 *
 * One mutex guards the lock socket reference, the locked paths and the
 * activation callback; the listener thread takes it for every access.
 * Probing runs without the mutex so the listener keeps serving meanwhile.
 *
 * @note This class is non-copyable.
 */
class SocketLock : public core::IInstanceLock, public core::IActivationTarget {
public:
    /**
     * @brief Constructs a lock with a fresh random token.
     * @param options Port range and timeouts.
     * @param notifier Receives user-facing events, may be null. Must outlive the lock.
     */
    explicit SocketLock(LockOptions options = {}, core::ILockNotifier* notifier = nullptr);

    /**
     * @brief Destructor. Disposes the lock.
     */
    ~SocketLock() override;

    SocketLock(const SocketLock&) = delete;
    SocketLock& operator=(const SocketLock&) = delete;

    core::ActivateStatus lock(const std::string& path, const std::string& tokenPath, bool markPort,
                              const std::vector<std::string>& args) override;
    core::ActivateStatus lock(const std::string& path, bool markPort,
                              const std::vector<std::string>& args) override;

    /**
     * @brief Closes the lock socket, stops the listener and removes written token files.
     *
     * Only the first call has an effect. A disposed lock never binds again.
     */
    void dispose() override;

    std::optional<uint16_t> acquiredPort() const override;
    bool isLocked() const override;
    std::vector<std::string> lockedPaths() const override;
    void setActivateListener(ActivateCallback callback) override;

    bool isTokenValid(const std::string& token) const override;
    void activate(const std::vector<std::string>& args) override;

    /**
     * @brief Returns this process's secret token.
     */
    const std::string& token() const { return token_; }

    /**
     * @brief Returns the listener state, Idle if no lock socket is held.
     */
    ListenerState listenerState() const;

private:
    std::optional<uint16_t> acquireSocket();

    LockOptions options_;
    core::ILockNotifier* notifier_;
    const std::string token_;

    mutable std::mutex mutex_;
    std::unique_ptr<ActivationListener> listener_;
    std::vector<std::string> lockedPaths_;
    std::vector<std::filesystem::path> tokenDirs_;
    ActivateCallback activateListener_;
    bool disposed_{false};
    bool unavailableNotified_{false};
};

} // namespace portlock::infra
