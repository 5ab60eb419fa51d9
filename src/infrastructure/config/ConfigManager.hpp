#pragma once

#include "infrastructure/lock/SocketLock.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

namespace portlock::infra {

/**
 * @brief Application configuration settings.
 *
 * Contains the instance lock tunables and logging preferences.
 */
struct AppConfig {
    // Instance lock
    int firstPort{core::PORT_RANGE_START}; ///< First port of the candidate range.
    int probeTimeoutMs{300};              ///< Read timeout when probing other instances.
    int listenerTimeoutMs{800};           ///< Per-connection timeout of the listener.
    bool markPort{true};                  ///< Write the acquired port to the lock directory.

    // Logging
    std::string logLevel{"info"};         ///< Console log level ("debug", "info", ...).
    bool fileLogging{true};               ///< Also log to a rotating file.
};

/**
 * @brief Manages application configuration persistence.
 *
 * Handles loading and saving of application configuration from JSON files.
 */
class ConfigManager {
public:
    /**
     * @brief Constructs a ConfigManager for the specified config directory.
     * @param configDir Path to the configuration directory.
     */
    explicit ConfigManager(const std::filesystem::path& configDir);

    /**
     * @brief Loads configuration from disk.
     *
     * Writes the defaults if no configuration file exists yet.
     *
     * @return True if loaded successfully, false otherwise.
     */
    bool load();

    /**
     * @brief Saves configuration to disk.
     * @return True if saved successfully, false otherwise.
     */
    bool save();

    AppConfig& config() { return config_; }
    const AppConfig& config() const { return config_; }

    /**
     * @brief Builds the lock options from the configuration.
     *
     * Out-of-range values fall back to the defaults.
     */
    LockOptions lockOptions() const;

    std::filesystem::path configPath() const { return configPath_; }

    /**
     * @brief Returns the path to the log file.
     * @return Path to portlock.log.
     */
    std::filesystem::path logPath() const;

    std::string configDir() const { return configDir_.string(); }

private:
    nlohmann::json toJson() const;
    void fromJson(const nlohmann::json& j);

    std::filesystem::path configDir_;
    std::filesystem::path configPath_;
    AppConfig config_;
};

} // namespace portlock::infra
