#include "infrastructure/config/ConfigManager.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace portlock::infra {

ConfigManager::ConfigManager(const std::filesystem::path& configDir) : configDir_(configDir) {
    if (!std::filesystem::exists(configDir_)) {
        std::filesystem::create_directories(configDir_);
    }

    configPath_ = configDir_ / "config.json";
}

bool ConfigManager::load() {
    if (!std::filesystem::exists(configPath_)) {
        spdlog::info("Config file not found, using defaults");
        return save();
    }

    try {
        std::ifstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file: {}", configPath_.string());
            return false;
        }

        nlohmann::json j;
        file >> j;
        fromJson(j);

        spdlog::info("Loaded configuration from {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load config: {}", e.what());
        return false;
    }
}

bool ConfigManager::save() {
    try {
        auto j = toJson();

        std::ofstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file for writing: {}", configPath_.string());
            return false;
        }

        file << j.dump(2);
        spdlog::debug("Saved configuration to {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save config: {}", e.what());
        return false;
    }
}

nlohmann::json ConfigManager::toJson() const {
    nlohmann::json j;

    // Instance lock
    j["lock"]["first_port"] = config_.firstPort;
    j["lock"]["probe_timeout_ms"] = config_.probeTimeoutMs;
    j["lock"]["listener_timeout_ms"] = config_.listenerTimeoutMs;
    j["lock"]["mark_port"] = config_.markPort;

    // Logging
    j["logging"]["level"] = config_.logLevel;
    j["logging"]["file_enabled"] = config_.fileLogging;

    return j;
}

void ConfigManager::fromJson(const nlohmann::json& j) {
    if (j.contains("lock")) {
        const auto& l = j["lock"];
        config_.firstPort = l.value("first_port", static_cast<int>(core::PORT_RANGE_START));
        config_.probeTimeoutMs = l.value("probe_timeout_ms", 300);
        config_.listenerTimeoutMs = l.value("listener_timeout_ms", 800);
        config_.markPort = l.value("mark_port", true);
    }

    if (j.contains("logging")) {
        const auto& lg = j["logging"];
        config_.logLevel = lg.value("level", "info");
        config_.fileLogging = lg.value("file_enabled", true);
    }
}

LockOptions ConfigManager::lockOptions() const {
    LockOptions options;

    if (config_.firstPort > 0 && config_.firstPort <= 65536 - core::PORT_RANGE_SIZE) {
        options.range.first = static_cast<uint16_t>(config_.firstPort);
    } else {
        spdlog::warn("Ignoring invalid first_port {}", config_.firstPort);
    }

    if (config_.probeTimeoutMs > 0) {
        options.probeTimeout = std::chrono::milliseconds(config_.probeTimeoutMs);
    }
    if (config_.listenerTimeoutMs > 0) {
        options.listenerTimeout = std::chrono::milliseconds(config_.listenerTimeoutMs);
    }
    return options;
}

std::filesystem::path ConfigManager::logPath() const {
    return configDir_ / "portlock.log";
}

} // namespace portlock::infra
