#include "app/Application.hpp"

#include "core/types/Errors.hpp"
#include "core/types/NetworkInterface.hpp"
#include "engine/DeviceLifecycleManager.hpp"
#include "engine/DiscoveryEngine.hpp"
#include "engine/ProbeStrategyChain.hpp"
#include "engine/VendorResolver.hpp"
#include "infrastructure/database/OuiRepository.hpp"
#include "infrastructure/network/IcmpPinger.hpp"
#include "infrastructure/network/NmapProbeBackend.hpp"
#include "infrastructure/network/PingSweepBackend.hpp"
#include "infrastructure/network/ReverseDnsResolver.hpp"
#include "infrastructure/process/ProcessRunner.hpp"

#include <asio/signal_set.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <csignal>
#include <future>

namespace lanwatch::app {

namespace {

constexpr const char* VERSION = "1.0.0";

std::string requireValue(const std::vector<std::string>& args, size_t& i) {
    if (i + 1 >= args.size()) {
        throw core::ConfigurationError("option " + args[i] + " requires a value");
    }
    return args[++i];
}

} // namespace

Application::Application(Options options) : options_(std::move(options)) {
    auto configDir = options_.configDir ? std::filesystem::path(*options_.configDir)
                                        : infra::ConfigManager::defaultConfigDir();
    config_ = std::make_shared<infra::ConfigManager>(configDir);

    initializeLogging();
    initializeComponents();
}

Application::~Application() {
    spdlog::info("Application shutting down...");

    if (orchestrator_) {
        orchestrator_->stopPeriodic();
        orchestrator_->waitUntilIdle(std::chrono::minutes(5));
    }

    if (asioContext_) {
        asioContext_->stop();
    }

    spdlog::default_logger()->flush();
}

Options Application::parseArguments(const std::vector<std::string>& args) {
    Options options;
    for (size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (arg == "--once") {
            options.once = true;
        } else if (arg == "-h" || arg == "--help") {
            options.showHelp = true;
        } else if (arg == "--subnet") {
            options.subnet = requireValue(args, i);
        } else if (arg == "--type") {
            auto value = requireValue(args, i);
            options.scanType = core::ScanSession::scanTypeFromString(value);
            if (!options.scanType) {
                throw core::ConfigurationError("unknown scan type '" + value + "'");
            }
        } else if (arg == "--preset") {
            options.preset = requireValue(args, i);
        } else if (arg == "--config-dir") {
            options.configDir = requireValue(args, i);
        } else {
            throw core::ConfigurationError("unknown option '" + arg + "'");
        }
    }
    return options;
}

std::string Application::usage() {
    return "Usage: lanwatch [options]\n"
           "  --once                 Run a single sweep and exit\n"
           "  --subnet <cidr>        Subnet to sweep (with --once)\n"
           "  --type <kind>          ping, arp or comprehensive\n"
           "  --preset <name>        Apply a sweep preset (fast, balanced, thorough, stealth)\n"
           "  --config-dir <path>    Configuration and data directory\n"
           "  -h, --help             Show this help\n";
}

void Application::initializeLogging() {
    auto logPath = config_->logPath();

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(spdlog::level::info);

    auto fileSink =
        std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logPath.string(), 5 * 1024 * 1024, 3);
    fileSink->set_level(spdlog::level::debug);

    auto logger =
        std::make_shared<spdlog::logger>("lanwatch", spdlog::sinks_init_list{consoleSink, fileSink});
    logger->set_level(spdlog::level::debug);
    spdlog::set_default_logger(logger);

    config_->load();
    consoleSink->set_level(spdlog::level::from_str(config_->config().logLevel));

    spdlog::info("LanWatch {} starting...", VERSION);
    spdlog::info("Log file: {}", logPath.string());
}

void Application::initializeComponents() {
    const auto& settings = config_->config();

    // Database
    database_ = std::make_shared<infra::Database>(config_->databasePath().string());
    database_->runMigrations();

    deviceRepository_ = std::make_shared<infra::DeviceRepository>(database_);
    sessionRepository_ = std::make_shared<infra::ScanSessionRepository>(database_);
    auto ouiRepository = std::make_shared<infra::OuiRepository>(database_);

    // Asio context
    asioContext_ = std::make_unique<infra::AsioContext>(4);
    asioContext_->start();

    // Probe strategies, in order of precedence
    auto runner = std::make_shared<infra::ProcessRunner>();
    auto pinger = std::make_shared<infra::IcmpPinger>(runner, settings.pingPath);

    infra::PingSweepBackend::Options sweepOptions;
    sweepOptions.arpScanPath = settings.arpScanPath;
    auto pingSweep = std::make_shared<infra::PingSweepBackend>(
        [pinger](const std::string& address, std::chrono::milliseconds timeout) {
            return pinger->ping(address, timeout);
        },
        runner, sweepOptions);

    auto chain = std::make_shared<engine::ProbeStrategyChain>(
        std::vector<std::shared_ptr<core::IProbeBackend>>{
            std::make_shared<infra::NmapProbeBackend>(runner, settings.nmapPath), pingSweep});

    // Engine
    auto vendorResolver = std::make_shared<engine::VendorResolver>(ouiRepository);
    auto discovery = std::make_shared<engine::DiscoveryEngine>(
        chain, vendorResolver, std::make_shared<infra::ReverseDnsResolver>(),
        &core::NetworkInterfaceEnumerator::detectLocalSubnet);
    auto lifecycle = std::make_shared<engine::DeviceLifecycleManager>(deviceRepository_);

    engine::ScanOrchestrator::Timing timing;
    timing.interval = std::chrono::seconds(settings.scanIntervalSeconds);
    orchestrator_ = std::make_shared<engine::ScanOrchestrator>(
        *asioContext_, discovery, lifecycle, sessionRepository_, settings.scan, timing);
    orchestrator_->setDefaultScanType(settings.defaultScanType);

    monitor_ = std::make_unique<engine::MonitorService>(deviceRepository_, sessionRepository_,
                                                        orchestrator_, vendorResolver, config_);

    if (options_.preset) {
        monitor_->loadPreset(*options_.preset);
    }

    spdlog::info("Probe strategies: {} (ICMP via {})", chain->name(),
                 pinger->usesRawSockets() ? "raw socket" : settings.pingPath);
    spdlog::info("Application components initialized");
}

void Application::performCleanup() {
    if (!config_->config().autoCleanup) {
        return;
    }

    auto maxAge = std::chrono::hours(config_->config().dataRetentionDays * 24);
    int records = deviceRepository_->cleanupOldRecords(maxAge);
    int sessions = sessionRepository_->cleanupOldSessions(maxAge);

    spdlog::info("Performed data cleanup ({} scan records, {} sessions removed)", records,
                 sessions);
}

int Application::run() {
    performCleanup();
    return options_.once ? runOnce() : runDaemon();
}

int Application::runOnce() {
    auto scanType = options_.scanType.value_or(config_->config().defaultScanType);
    auto outcome = monitor_->sweepNow(options_.subnet, scanType);

    if (outcome.status != core::SweepStatus::Success) {
        spdlog::error("Sweep {}: {}", core::SweepOutcome::statusToString(outcome.status),
                      outcome.message);
        return 1;
    }

    for (const auto& device : monitor_->onlineDevices()) {
        spdlog::info("  {:<15}  {:<17}  {:<24}  {}", device.ipAddress,
                     device.macAddress.value_or("-"), device.displayName(),
                     device.vendor.value_or(""));
    }
    return 0;
}

int Application::runDaemon() {
    if (config_->config().periodicEnabled) {
        orchestrator_->startPeriodic();
    } else {
        spdlog::info("Periodic sweeps disabled in configuration");
    }

    std::promise<int> stopSignal;
    auto stopped = stopSignal.get_future();

    asio::signal_set signals(asioContext_->ioContext(), SIGINT, SIGTERM);
    signals.async_wait([&stopSignal](const asio::error_code& ec, int signalNumber) {
        if (ec) {
            return;
        }
        spdlog::info("Received signal {}, stopping", signalNumber);
        stopSignal.set_value(signalNumber);
    });

    stopped.wait();
    orchestrator_->stopPeriodic();
    return 0;
}

} // namespace lanwatch::app
