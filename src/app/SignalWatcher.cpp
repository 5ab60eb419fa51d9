#include "app/SignalWatcher.hpp"

#include <spdlog/spdlog.h>

#include <csignal>

namespace portlock::app {

SignalWatcher::SignalWatcher(std::function<void(int)> handler)
    : signals_(ioContext_, SIGINT, SIGTERM), handler_(std::move(handler)) {}

SignalWatcher::~SignalWatcher() {
    stop();
}

void SignalWatcher::start() {
    if (thread_.joinable()) {
        return;
    }

    signals_.async_wait([this](const asio::error_code& ec, int signal) {
        if (ec) {
            return;
        }
        spdlog::info("Received signal {}", signal);
        if (handler_) {
            handler_(signal);
        }
    });

    thread_ = std::thread([this]() { ioContext_.run(); });
}

void SignalWatcher::stop() {
    if (!thread_.joinable()) {
        return;
    }

    asio::error_code ec;
    signals_.cancel(ec);
    ioContext_.stop();
    thread_.join();
}

} // namespace portlock::app
