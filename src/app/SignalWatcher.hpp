#pragma once

#include <asio.hpp>
#include <functional>
#include <optional>
#include <thread>

namespace portlock::app {

/**
 * @brief Waits for SIGINT/SIGTERM on a background thread.
 *
 * Runs an asio::io_context with a signal_set on its own thread and invokes the
 * handler once on the first signal. The handler runs on that thread.
 *
 * @note This class is non-copyable.
 */
class SignalWatcher {
public:
    explicit SignalWatcher(std::function<void(int)> handler);

    /**
     * @brief Destructor. Stops the watcher thread.
     */
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    void start();
    void stop();

private:
    asio::io_context ioContext_;
    asio::signal_set signals_;
    std::function<void(int)> handler_;
    std::thread thread_;
};

} // namespace portlock::app
