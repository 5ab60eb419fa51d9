#include "infrastructure/lock/SocketLock.hpp"

#include "infrastructure/crypto/TokenStore.hpp"
#include "infrastructure/network/ActivationClient.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace portlock::infra {

SocketLock::SocketLock(LockOptions options, core::ILockNotifier* notifier)
    : options_(options), notifier_(notifier), token_(TokenStore::generateToken()) {}

SocketLock::~SocketLock() {
    dispose();
}

core::ActivateStatus SocketLock::lock(const std::string& path, bool markPort,
                                      const std::vector<std::string>& args) {
    return lock(path, path, markPort, args);
}

core::ActivateStatus SocketLock::lock(const std::string& path, const std::string& tokenPath,
                                      bool markPort, const std::vector<std::string>& args) {
    spdlog::debug("enter: lock(path='{}')", path);

    std::optional<uint16_t> acquired;
    std::optional<uint16_t> ownPort;
    bool notifyUnavailable = false;
    {
        std::lock_guard lock(mutex_);
        acquired = acquireSocket();
        if (listener_) {
            ownPort = listener_->port();
        } else if (!unavailableNotified_) {
            unavailableNotified_ = true;
            notifyUnavailable = true;
        }
    }

    if (!ownPort) {
        spdlog::error("No port in {}..{} could be bound, the instance lock is unavailable",
                      options_.range.first, options_.range.first + options_.range.size - 1);
        if (notifyUnavailable && notifier_) {
            notifier_->lockUnavailable();
        }
        return core::ActivateStatus::NoInstance;
    }

    auto peerToken = TokenStore::loadToken(tokenPath);
    ActivationClient client(options_.probeTimeout);

    for (uint16_t port : options_.range.candidates()) {
        if (port == *ownPort) {
            continue;
        }
        auto status = client.tryActivate(port, path, peerToken, args);
        if (status != core::ActivateStatus::NoInstance) {
            spdlog::info("lock({}) finished on port {}: {}", path, port,
                         core::activateStatusToString(status));
            return status;
        }
    }

    // Held across the file writes so dispose() either sees the new token dir or
    // has already run and this call backs out.
    std::lock_guard lock(mutex_);
    if (disposed_ || !listener_) {
        spdlog::debug("lock({}) abandoned, the lock was disposed while probing", path);
        return core::ActivateStatus::NoInstance;
    }

    if (markPort && acquired) {
        TokenStore::writePortMarker(path, *acquired);
    }

    if (TokenStore::writeToken(tokenPath, token_) &&
        std::find(tokenDirs_.begin(), tokenDirs_.end(), std::filesystem::path(tokenPath)) ==
            tokenDirs_.end()) {
        tokenDirs_.emplace_back(tokenPath);
    }
    lockedPaths_.push_back(path);

    spdlog::info("Locked {} on port {}", path, *ownPort);
    return core::ActivateStatus::NoInstance;
}

std::optional<uint16_t> SocketLock::acquireSocket() {
    if (listener_ || disposed_) {
        return std::nullopt;
    }

    auto listener = std::make_unique<ActivationListener>(*this, notifier_, options_.listenerTimeout);
    auto port = listener->bind(options_.range);
    if (!port) {
        return std::nullopt;
    }

    listener->start();
    listener_ = std::move(listener);
    return port;
}

void SocketLock::dispose() {
    spdlog::debug("enter: dispose()");

    std::unique_ptr<ActivationListener> listener;
    std::vector<std::filesystem::path> tokenDirs;
    {
        std::lock_guard lock(mutex_);
        if (disposed_) {
            return;
        }
        disposed_ = true;
        listener = std::move(listener_);
        tokenDirs.swap(tokenDirs_);
    }

    // The listener thread may be waiting for the mutex, so stop it outside.
    if (listener) {
        listener->stop();
    }

    for (const auto& dir : tokenDirs) {
        if (TokenStore::loadToken(dir) == token_) {
            TokenStore::removeToken(dir);
        }
    }
}

std::optional<uint16_t> SocketLock::acquiredPort() const {
    std::lock_guard lock(mutex_);
    if (!listener_) {
        return std::nullopt;
    }
    return listener_->port();
}

bool SocketLock::isLocked() const {
    std::lock_guard lock(mutex_);
    return listener_ != nullptr;
}

std::vector<std::string> SocketLock::lockedPaths() const {
    std::lock_guard lock(mutex_);
    return lockedPaths_;
}

void SocketLock::setActivateListener(ActivateCallback callback) {
    std::lock_guard lock(mutex_);
    activateListener_ = std::move(callback);
}

bool SocketLock::isTokenValid(const std::string& token) const {
    return token == token_;
}

void SocketLock::activate(const std::vector<std::string>& args) {
    ActivateCallback callback;
    {
        std::lock_guard lock(mutex_);
        callback = activateListener_;
    }

    if (callback) {
        callback(args);
    } else {
        spdlog::debug("Activation request acknowledged without a listener");
    }
}

ListenerState SocketLock::listenerState() const {
    std::lock_guard lock(mutex_);
    return listener_ ? listener_->state() : ListenerState::Idle;
}

} // namespace portlock::infra
