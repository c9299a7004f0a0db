#pragma once

#include "core/types/ScanConfig.hpp"
#include "core/types/ScanSession.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

namespace lanwatch::infra {

/**
 * @brief Application configuration settings.
 *
 * Contains the active sweep configuration, scheduler settings, data
 * retention, logging and the locations of external tools.
 */
struct AppConfig {
    // Sweep configuration
    core::ScanConfig scan; ///< Validated sweep configuration.

    // Scheduler
    int scanIntervalSeconds{300};  ///< Periodic sweep interval (floor 60).
    bool periodicEnabled{true};    ///< Start the periodic loop at startup.
    core::ScanType defaultScanType{core::ScanType::Ping}; ///< Sweep kind used by the loop.

    // Data retention
    int dataRetentionDays{30};   ///< Days to retain scan records and sessions.
    bool autoCleanup{true};      ///< Prune old data at startup.

    // Logging
    std::string logLevel{"info"}; ///< Console log level (spdlog level name).

    // External tools
    std::string nmapPath{"nmap"};         ///< nmap program or path.
    std::string pingPath{"ping"};         ///< ping program or path.
    std::string arpScanPath{"arp-scan"};  ///< arp-scan program or path.
};

/**
 * @brief Manages application configuration persistence.
 *
 * Handles loading and saving of config.json in the configuration directory.
 * An invalid scan section is replaced by the balanced preset rather than
 * rejected, so the daemon always starts.
 */
class ConfigManager {
public:
    /// Smallest periodic interval accepted from disk or from the operator.
    static constexpr int MIN_SCAN_INTERVAL_SECONDS = 60;

    /**
     * @brief Constructs a ConfigManager for the specified config directory.
     * @param configDir Path to the configuration directory (created if missing).
     */
    explicit ConfigManager(const std::filesystem::path& configDir);

    /**
     * @brief Loads configuration from disk, writing defaults if the file is missing.
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
     * @brief Returns the path to the configuration file.
     * @return Path to config.json.
     */
    std::filesystem::path configPath() const { return configPath_; }

    /**
     * @brief Returns the path to the database file.
     * @return Path to the SQLite database.
     */
    std::filesystem::path databasePath() const;

    /**
     * @brief Returns the path to the rotating log file.
     */
    std::filesystem::path logPath() const;

    std::string configDir() const { return configDir_.string(); }

    /**
     * @brief Resolves the configuration directory from the environment.
     *
     * $LANWATCH_CONFIG_DIR, else $XDG_CONFIG_HOME/lanwatch, else
     * $HOME/.config/lanwatch, else ./lanwatch.
     */
    static std::filesystem::path defaultConfigDir();

    /**
     * @brief Serialises a sweep configuration with snake_case keys.
     */
    static nlohmann::json scanConfigToJson(const core::ScanConfig& config);

    /**
     * @brief Parses and validates a sweep configuration.
     *
     * Missing keys take balanced-preset defaults.
     *
     * @throws core::ConfigurationError on wrong types or invalid values.
     */
    static core::ScanConfig scanConfigFromJson(const nlohmann::json& j);

private:
    nlohmann::json toJson() const;
    void fromJson(const nlohmann::json& j);

    std::filesystem::path configDir_;
    std::filesystem::path configPath_;
    AppConfig config_;
};

} // namespace lanwatch::infra
