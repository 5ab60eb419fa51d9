#pragma once

#include "core/services/IActivationTarget.hpp"
#include "core/services/ILockNotifier.hpp"
#include "core/types/CandidatePorts.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace portlock::test {

/**
 * @brief Port range private to one test file.
 *
 * Below the Linux ephemeral range so outgoing connections never collide with it.
 */
inline core::PortRange testRange(uint16_t first, uint16_t size = 8) {
    return core::PortRange{first, size};
}

class TestDir {
public:
    explicit TestDir(const std::string& name)
        : path_(std::filesystem::temp_directory_path() / name) {
        cleanup();
        std::filesystem::create_directories(path_);
    }

    ~TestDir() { cleanup(); }

    std::filesystem::path path() const { return path_; }

private:
    void cleanup() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    std::filesystem::path path_;
};

class RecordingNotifier : public core::ILockNotifier {
public:
    void unauthorizedRequest(const std::string&) override { ++unauthorized; }
    void lockUnavailable() override { ++unavailable; }
    void listenerFailed(const std::string&) override { ++failed; }

    std::atomic<int> unauthorized{0};
    std::atomic<int> unavailable{0};
    std::atomic<int> failed{0};
};

class RecordingTarget : public core::IActivationTarget {
public:
    explicit RecordingTarget(std::string token, std::vector<std::string> paths = {})
        : token_(std::move(token)), paths_(std::move(paths)) {}

    std::vector<std::string> lockedPaths() const override {
        std::lock_guard lock(mutex_);
        return paths_;
    }

    bool isTokenValid(const std::string& token) const override { return token == token_; }

    void activate(const std::vector<std::string>& args) override {
        if (onActivate) {
            onActivate(args);
        }
        std::lock_guard lock(mutex_);
        activations_.push_back(args);
    }

    void addPath(const std::string& path) {
        std::lock_guard lock(mutex_);
        paths_.push_back(path);
    }

    std::vector<std::vector<std::string>> activations() const {
        std::lock_guard lock(mutex_);
        return activations_;
    }

    std::function<void(const std::vector<std::string>&)> onActivate;

private:
    std::string token_;
    mutable std::mutex mutex_;
    std::vector<std::string> paths_;
    std::vector<std::vector<std::string>> activations_;
};

/**
 * @brief Polls a condition until it holds or the timeout expires.
 */
inline bool waitFor(const std::function<bool()>& condition,
                    std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return condition();
}

} // namespace portlock::test
