#include "infrastructure/config/ConfigManager.hpp"

#include "core/types/Errors.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>

namespace lanwatch::infra {

namespace {

std::filesystem::path envPath(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return {};
    }
    return std::filesystem::path(value);
}

} // namespace

ConfigManager::ConfigManager(const std::filesystem::path& configDir) : configDir_(configDir) {
    if (!std::filesystem::exists(configDir_)) {
        std::filesystem::create_directories(configDir_);
    }

    configPath_ = configDir_ / "config.json";
}

std::filesystem::path ConfigManager::defaultConfigDir() {
    if (auto dir = envPath("LANWATCH_CONFIG_DIR"); !dir.empty()) {
        return dir;
    }
    if (auto xdg = envPath("XDG_CONFIG_HOME"); !xdg.empty()) {
        return xdg / "lanwatch";
    }
    if (auto home = envPath("HOME"); !home.empty()) {
        return home / ".config" / "lanwatch";
    }
    return std::filesystem::path("lanwatch");
}

std::filesystem::path ConfigManager::databasePath() const {
    return configDir_ / "lanwatch.db";
}

std::filesystem::path ConfigManager::logPath() const {
    return configDir_ / "lanwatch.log";
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

nlohmann::json ConfigManager::scanConfigToJson(const core::ScanConfig& config) {
    nlohmann::json j;
    j["subnet"] = config.subnetCidr ? nlohmann::json(*config.subnetCidr) : nlohmann::json(nullptr);
    j["auto_detect_subnet"] = config.autoDetectSubnet;
    j["exclude_ips"] = config.excludeIps;
    j["scan_rate"] = config.scanRate;
    j["max_workers"] = config.maxWorkers;
    j["scan_timeout"] = config.scanTimeout;
    j["max_retries"] = config.maxRetries;
    j["resolve_hostnames"] = config.resolveHostnames;
    j["fetch_vendor_info"] = config.fetchVendorInfo;
    j["arp_lookup_enabled"] = config.arpLookupEnabled;
    j["fallback_enabled"] = config.fallbackEnabled;

    nlohmann::json methods = nlohmann::json::array();
    for (auto method : config.pingMethods) {
        methods.push_back(core::ScanConfig::methodToString(method));
    }
    j["ping_methods"] = methods;
    j["tcp_ping_ports"] = config.tcpPingPorts;
    j["ack_ping_ports"] = config.ackPingPorts;
    j["enable_port_scan"] = config.enablePortScan;
    j["port_range"] = config.portRange;
    return j;
}

core::ScanConfig ConfigManager::scanConfigFromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw core::ConfigurationError("scan configuration must be a JSON object");
    }

    core::ScanConfig config = core::ScanPresets::balanced();
    try {
        if (j.contains("subnet")) {
            const auto& subnet = j.at("subnet");
            if (subnet.is_null()) {
                config.subnetCidr.reset();
            } else {
                config.subnetCidr = subnet.get<std::string>();
            }
        }
        config.autoDetectSubnet = j.value("auto_detect_subnet", config.autoDetectSubnet);
        config.excludeIps = j.value("exclude_ips", config.excludeIps);
        config.scanRate = j.value("scan_rate", config.scanRate);
        config.maxWorkers = j.value("max_workers", config.maxWorkers);
        config.scanTimeout = j.value("scan_timeout", config.scanTimeout);
        config.maxRetries = j.value("max_retries", config.maxRetries);
        config.resolveHostnames = j.value("resolve_hostnames", config.resolveHostnames);
        config.fetchVendorInfo = j.value("fetch_vendor_info", config.fetchVendorInfo);
        config.arpLookupEnabled = j.value("arp_lookup_enabled", config.arpLookupEnabled);
        config.fallbackEnabled = j.value("fallback_enabled", config.fallbackEnabled);

        if (j.contains("ping_methods")) {
            config.pingMethods.clear();
            for (const auto& name : j.at("ping_methods").get<std::vector<std::string>>()) {
                auto method = core::ScanConfig::methodFromString(name);
                if (!method) {
                    throw core::ConfigurationError("unknown ping method '" + name + "'");
                }
                config.pingMethods.push_back(*method);
            }
        }

        config.tcpPingPorts = j.value("tcp_ping_ports", config.tcpPingPorts);
        config.ackPingPorts = j.value("ack_ping_ports", config.ackPingPorts);
        config.enablePortScan = j.value("enable_port_scan", config.enablePortScan);
        config.portRange = j.value("port_range", config.portRange);
    } catch (const nlohmann::json::exception& e) {
        throw core::ConfigurationError(std::string("malformed scan configuration: ") + e.what());
    }

    config.validate();
    return config;
}

nlohmann::json ConfigManager::toJson() const {
    nlohmann::json j;

    j["scan"] = scanConfigToJson(config_.scan);

    // Scheduler
    j["scheduler"]["interval_seconds"] = config_.scanIntervalSeconds;
    j["scheduler"]["periodic_enabled"] = config_.periodicEnabled;
    j["scheduler"]["default_scan_type"] = core::ScanSession::scanTypeToString(config_.defaultScanType);

    // Data retention
    j["data"]["retention_days"] = config_.dataRetentionDays;
    j["data"]["auto_cleanup"] = config_.autoCleanup;

    // Logging
    j["logging"]["level"] = config_.logLevel;

    // External tools
    j["tools"]["nmap_path"] = config_.nmapPath;
    j["tools"]["ping_path"] = config_.pingPath;
    j["tools"]["arp_scan_path"] = config_.arpScanPath;

    return j;
}

void ConfigManager::fromJson(const nlohmann::json& j) {
    bool repaired = false;

    // Scan
    if (j.contains("scan")) {
        try {
            config_.scan = scanConfigFromJson(j["scan"]);
        } catch (const core::ConfigurationError& e) {
            spdlog::error("Invalid scan configuration ({}), falling back to the balanced preset",
                          e.what());
            config_.scan = core::ScanPresets::balanced();
            repaired = true;
        }
    }

    // Scheduler
    if (j.contains("scheduler")) {
        const auto& s = j["scheduler"];
        config_.scanIntervalSeconds = s.value("interval_seconds", 300);
        if (config_.scanIntervalSeconds < MIN_SCAN_INTERVAL_SECONDS) {
            spdlog::warn("Scan interval {}s is below the {}s minimum, using the minimum",
                         config_.scanIntervalSeconds, MIN_SCAN_INTERVAL_SECONDS);
            config_.scanIntervalSeconds = MIN_SCAN_INTERVAL_SECONDS;
            repaired = true;
        }
        config_.periodicEnabled = s.value("periodic_enabled", true);

        auto typeName = s.value("default_scan_type", std::string("ping"));
        if (auto type = core::ScanSession::scanTypeFromString(typeName)) {
            config_.defaultScanType = *type;
        } else {
            spdlog::warn("Unknown default scan type '{}', using ping", typeName);
            config_.defaultScanType = core::ScanType::Ping;
            repaired = true;
        }
    }

    // Data
    if (j.contains("data")) {
        const auto& d = j["data"];
        config_.dataRetentionDays = d.value("retention_days", 30);
        config_.autoCleanup = d.value("auto_cleanup", true);
    }

    // Logging
    if (j.contains("logging")) {
        config_.logLevel = j["logging"].value("level", std::string("info"));
    }

    // External tools
    if (j.contains("tools")) {
        const auto& t = j["tools"];
        config_.nmapPath = t.value("nmap_path", std::string("nmap"));
        config_.pingPath = t.value("ping_path", std::string("ping"));
        config_.arpScanPath = t.value("arp_scan_path", std::string("arp-scan"));
    }

    if (repaired) {
        save();
    }
}

} // namespace lanwatch::infra
