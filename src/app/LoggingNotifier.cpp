#include "app/LoggingNotifier.hpp"

#include <spdlog/spdlog.h>

namespace portlock::app {

void LoggingNotifier::unauthorizedRequest(const std::string& peer) {
    spdlog::warn("Security warning: a process at {} tried to activate this instance with an "
                 "invalid token. The request was ignored.",
                 peer);
}

void LoggingNotifier::lockUnavailable() {
    spdlog::error("Cannot lock: all candidate ports are in use. Close other instances and retry.");
}

void LoggingNotifier::listenerFailed(const std::string& reason) {
    spdlog::critical("Instance listener stopped ({}); new launches will start separate instances",
                     reason);
}

} // namespace portlock::app
