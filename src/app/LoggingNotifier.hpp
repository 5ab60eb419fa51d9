#pragma once

#include "core/services/ILockNotifier.hpp"

#include <string>

namespace portlock::app {

/**
 * @brief Reports lock events through the application log.
 */
class LoggingNotifier : public core::ILockNotifier {
public:
    void unauthorizedRequest(const std::string& peer) override;
    void lockUnavailable() override;
    void listenerFailed(const std::string& reason) override;
};

} // namespace portlock::app
