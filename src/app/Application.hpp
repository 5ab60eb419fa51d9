#pragma once

#include "app/LoggingNotifier.hpp"
#include "app/SignalWatcher.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/lock/SocketLock.hpp"

#include <QCoreApplication>
#include <QString>
#include <QStringList>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace portlock::app {

/**
 * @brief Exit codes of the portlock executable.
 */
enum ExitCode : int {
    ExitOk = 0,             ///< Ran as the instance, or activated a running one
    ExitCannotActivate = 1, ///< A running instance owns the path but did not acknowledge
    ExitLockUnavailable = 2 ///< No candidate port could be bound
};

class Application {
public:
    Application(int& argc, char** argv);
    ~Application();

    int run();

private:
    void parseArguments();
    void initializeLogging();
    void initializeComponents();
    void onActivated(const std::vector<std::string>& args);

    std::unique_ptr<QCoreApplication> qtApp_;
    std::filesystem::path configDir_;
    std::filesystem::path lockDir_;
    std::vector<std::string> forwardedArgs_;
    int holdMs_{0};

    std::unique_ptr<infra::ConfigManager> config_;
    std::unique_ptr<LoggingNotifier> notifier_;
    std::unique_ptr<infra::SocketLock> socketLock_;
    std::unique_ptr<SignalWatcher> signalWatcher_;
};

} // namespace portlock::app
