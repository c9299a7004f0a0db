#pragma once

#include "core/types/ScanSession.hpp"
#include "engine/MonitorService.hpp"
#include "engine/ScanOrchestrator.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/database/Database.hpp"
#include "infrastructure/database/DeviceRepository.hpp"
#include "infrastructure/database/ScanSessionRepository.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lanwatch::app {

/**
 * @brief Command line options of the daemon.
 */
struct Options {
    bool once{false};                          ///< Run one sweep and exit
    bool showHelp{false};                      ///< Print usage and exit
    std::optional<std::string> subnet;         ///< Explicit target for --once
    std::optional<core::ScanType> scanType;    ///< Sweep kind for --once
    std::optional<std::string> preset;         ///< Preset applied at startup
    std::optional<std::string> configDir;      ///< Overrides the config directory
};

class Application {
public:
    explicit Application(Options options);
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    /**
     * @brief Runs one sweep (--once) or the periodic loop until SIGINT/SIGTERM.
     * @return Process exit code.
     */
    int run();

    /**
     * @brief Parses the command line.
     * @throws core::ConfigurationError for unknown options or missing values.
     */
    static Options parseArguments(const std::vector<std::string>& args);

    static std::string usage();

    // Accessors
    infra::ConfigManager& config() { return *config_; }
    infra::Database& database() { return *database_; }
    engine::MonitorService& monitor() { return *monitor_; }

private:
    void initializeLogging();
    void initializeComponents();
    void performCleanup();
    int runOnce();
    int runDaemon();

    Options options_;
    std::shared_ptr<infra::ConfigManager> config_;
    std::shared_ptr<infra::Database> database_;
    std::shared_ptr<infra::DeviceRepository> deviceRepository_;
    std::shared_ptr<infra::ScanSessionRepository> sessionRepository_;
    std::unique_ptr<infra::AsioContext> asioContext_;
    std::shared_ptr<engine::ScanOrchestrator> orchestrator_;
    std::unique_ptr<engine::MonitorService> monitor_;
};

} // namespace lanwatch::app
