#include "app/Application.hpp"

#include <QCommandLineParser>
#include <QMetaObject>
#include <QStandardPaths>
#include <QTimer>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace portlock::app {

namespace {

std::filesystem::path standardLocation(QStandardPaths::StandardLocation location) {
    return std::filesystem::path(QStandardPaths::writableLocation(location).toStdString());
}

} // namespace

Application::Application(int& argc, char** argv) {
    qtApp_ = std::make_unique<QCoreApplication>(argc, argv);
    qtApp_->setApplicationName("portlock");
    qtApp_->setApplicationVersion("1.0.0");
    qtApp_->setOrganizationName("portlock");

    parseArguments();
    initializeLogging();
    initializeComponents();
}

Application::~Application() {
    spdlog::info("Application shutting down...");

    if (signalWatcher_) {
        signalWatcher_->stop();
    }

    if (socketLock_) {
        socketLock_->dispose();
    }
}

void Application::parseArguments() {
    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Runs as the single instance for a directory, or hands the arguments to the running one.");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configDirOption("config-dir", "Configuration and log directory.", "dir");
    QCommandLineOption lockDirOption("lock-dir", "Directory to lock (port and token files).",
                                     "dir");
    QCommandLineOption holdMsOption("hold-ms", "Quit after this many milliseconds (0 = never).",
                                    "ms", "0");
    parser.addOption(configDirOption);
    parser.addOption(lockDirOption);
    parser.addOption(holdMsOption);
    parser.addPositionalArgument("args", "Arguments forwarded to the running instance.",
                                 "[args...]");
    parser.process(*qtApp_);

    configDir_ = parser.isSet(configDirOption)
                     ? std::filesystem::path(parser.value(configDirOption).toStdString())
                     : standardLocation(QStandardPaths::AppConfigLocation);
    lockDir_ = parser.isSet(lockDirOption)
                   ? std::filesystem::path(parser.value(lockDirOption).toStdString())
                   : standardLocation(QStandardPaths::AppDataLocation);

    bool holdMsOk = false;
    holdMs_ = parser.value(holdMsOption).toInt(&holdMsOk);
    if (!holdMsOk || holdMs_ < 0) {
        holdMs_ = 0;
    }

    for (const auto& arg : parser.positionalArguments()) {
        forwardedArgs_.push_back(arg.toStdString());
    }
}

void Application::initializeLogging() {
    std::filesystem::create_directories(configDir_);

    auto logPath = configDir_ / "portlock.log";

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(spdlog::level::info);

    auto fileSink =
        std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logPath.string(), 5 * 1024 * 1024, 3);
    fileSink->set_level(spdlog::level::debug);

    auto logger =
        std::make_shared<spdlog::logger>("portlock", spdlog::sinks_init_list{consoleSink, fileSink});
    logger->set_level(spdlog::level::debug);
    spdlog::set_default_logger(logger);

    spdlog::info("portlock {} starting...", qtApp_->applicationVersion().toStdString());
    spdlog::info("Log file: {}", logPath.string());
}

void Application::initializeComponents() {
    // Configuration
    config_ = std::make_unique<infra::ConfigManager>(configDir_);
    config_->load();

    auto level = spdlog::level::from_str(config_->config().logLevel);
    auto logger = spdlog::default_logger();
    logger->sinks().front()->set_level(level);
    if (!config_->config().fileLogging) {
        logger->sinks().back()->set_level(spdlog::level::off);
    }

    // Instance lock
    notifier_ = std::make_unique<LoggingNotifier>();
    socketLock_ = std::make_unique<infra::SocketLock>(config_->lockOptions(), notifier_.get());

    // Activation requests arrive on the listener thread
    socketLock_->setActivateListener([this](const std::vector<std::string>& args) {
        QMetaObject::invokeMethod(
            qtApp_.get(), [this, args]() { onActivated(args); }, Qt::QueuedConnection);
    });

    signalWatcher_ = std::make_unique<SignalWatcher>([this](int) {
        QMetaObject::invokeMethod(qtApp_.get(), &QCoreApplication::quit, Qt::QueuedConnection);
    });

    spdlog::info("Application components initialized");
}

void Application::onActivated(const std::vector<std::string>& args) {
    if (args.empty()) {
        spdlog::info("Activated by another launch");
        return;
    }

    std::string forwarded;
    for (size_t i = 1; i < args.size(); ++i) {
        forwarded += (i > 1 ? " " : "") + args[i];
    }
    spdlog::info("Activated by a launch in {} with arguments [{}]", args.front(), forwarded);
}

int Application::run() {
    auto status = socketLock_->lock(lockDir_.string(), lockDir_.string(),
                                    config_->config().markPort, forwardedArgs_);

    switch (status) {
    case core::ActivateStatus::Activated:
        spdlog::info("Arguments handed to the running instance");
        return ExitOk;
    case core::ActivateStatus::CannotActivate:
        spdlog::error("An instance owns {} but did not respond", lockDir_.string());
        return ExitCannotActivate;
    case core::ActivateStatus::NoInstance:
        break;
    }

    if (!socketLock_->isLocked()) {
        return ExitLockUnavailable;
    }

    spdlog::info("Running as the instance for {} on port {}", lockDir_.string(),
                 socketLock_->acquiredPort().value_or(0));

    signalWatcher_->start();
    if (holdMs_ > 0) {
        QTimer::singleShot(holdMs_, qtApp_.get(), &QCoreApplication::quit);
    }

    int result = qtApp_->exec();
    socketLock_->dispose();
    return result;
}

} // namespace portlock::app
