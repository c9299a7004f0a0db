#include "engine/MonitorService.hpp"

#include "core/types/Errors.hpp"
#include "core/types/MacAddress.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <ctime>
#include <regex>

namespace lanwatch::engine {

namespace {

constexpr auto ONE_DAY = std::chrono::hours(24);

std::string trim(const std::string& text) {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

void validateTarget(const std::optional<std::string>& subnet) {
    if (subnet && !subnet->empty()) {
        core::Subnet::parse(*subnet);
    }
}

} // namespace

MonitorService::MonitorService(std::shared_ptr<core::IDeviceRepository> devices,
                               std::shared_ptr<core::IScanSessionRepository> sessions,
                               std::shared_ptr<ScanOrchestrator> orchestrator,
                               std::shared_ptr<VendorResolver> vendorResolver,
                               std::shared_ptr<infra::ConfigManager> configManager)
    : devices_(std::move(devices)),
      sessions_(std::move(sessions)),
      orchestrator_(std::move(orchestrator)),
      vendorResolver_(std::move(vendorResolver)),
      configManager_(std::move(configManager)),
      timeline_(devices_) {}

core::SweepOutcome MonitorService::sweepNow(const std::optional<std::string>& subnet,
                                            core::ScanType scanType) {
    validateTarget(subnet);
    return orchestrator_->triggerScan(subnet, scanType);
}

core::SweepOutcome MonitorService::sweepInBackground(const std::optional<std::string>& subnet,
                                                     core::ScanType scanType) {
    validateTarget(subnet);
    return orchestrator_->triggerScanAsync(subnet, scanType);
}

core::ScanStatus MonitorService::getScanStatus() const {
    return orchestrator_->status();
}

void MonitorService::setScanInterval(int seconds) {
    orchestrator_->setInterval(seconds);
    if (configManager_) {
        configManager_->config().scanIntervalSeconds = seconds;
        persist();
    }
}

void MonitorService::applyConfig(const core::ScanConfig& config) {
    config.validate();
    orchestrator_->setConfig(config);
    if (configManager_) {
        configManager_->config().scan = config;
        persist();
    }
    spdlog::info("Applied new sweep configuration");
}

core::ScanConfig MonitorService::getConfig() const {
    return orchestrator_->config();
}

core::ScanConfig MonitorService::loadPreset(const std::string& name) {
    auto config = core::ScanPresets::byName(name);
    applyConfig(config);
    spdlog::info("Loaded sweep preset '{}'", name);
    return config;
}

std::vector<core::ScanPreset> MonitorService::availablePresets() const {
    return core::ScanPresets::all();
}

std::chrono::system_clock::time_point MonitorService::parseDay(const std::string& date) {
    static const std::regex pattern(R"(^(\d{4})-(\d{2})-(\d{2})$)");
    std::smatch match;
    if (!std::regex_match(date, match, pattern)) {
        throw core::ConfigurationError("invalid date '" + date + "', expected YYYY-MM-DD");
    }

    std::tm tm{};
    tm.tm_year = std::stoi(match[1].str()) - 1900;
    tm.tm_mon = std::stoi(match[2].str()) - 1;
    tm.tm_mday = std::stoi(match[3].str());
    int month = tm.tm_mon;
    int day = tm.tm_mday;

    std::time_t time = timegm(&tm);
    // timegm normalises out-of-range fields, so an impossible date changes them.
    if (time == static_cast<std::time_t>(-1) || tm.tm_mon != month || tm.tm_mday != day) {
        throw core::ConfigurationError("invalid date '" + date + "'");
    }
    return std::chrono::system_clock::from_time_t(time);
}

std::vector<core::OnlineInterval> MonitorService::reconstructTimeline(int64_t deviceId,
                                                                      const std::string& date) {
    auto dayStart = parseDay(date);
    if (!devices_->getById(deviceId)) {
        throw core::NotFoundError("device " + std::to_string(deviceId) + " not found");
    }
    return timeline_.forDevice(deviceId, dayStart, dayStart + ONE_DAY - std::chrono::seconds(1));
}

std::vector<core::DeviceTimeline> MonitorService::dayTimeline(const std::string& date) {
    auto dayStart = parseDay(date);
    auto dayEnd = dayStart + ONE_DAY - std::chrono::seconds(1);

    std::vector<core::DeviceTimeline> timelines;
    for (const auto& device : devices_->listAll()) {
        auto intervals = timeline_.forDevice(device.id, dayStart, dayEnd);
        if (intervals.empty()) {
            continue;
        }
        timelines.push_back({device.id, device.displayName(), device.ipAddress,
                             std::move(intervals)});
    }
    return timelines;
}

std::vector<core::Device> MonitorService::listDevices() {
    return devices_->listAll();
}

std::vector<core::Device> MonitorService::onlineDevices() {
    return devices_->listOnline();
}

std::optional<core::Device> MonitorService::getDevice(int64_t deviceId) {
    return devices_->getById(deviceId);
}

std::vector<core::ScanRecord> MonitorService::deviceHistory(int64_t deviceId, int hours) {
    if (!devices_->getById(deviceId)) {
        throw core::NotFoundError("device " + std::to_string(deviceId) + " not found");
    }
    auto now = std::chrono::system_clock::now();
    auto records = devices_->history(deviceId, now - std::chrono::hours(hours), now);
    std::stable_sort(records.begin(), records.end(),
                     [](const core::ScanRecord& a, const core::ScanRecord& b) {
                         return a.scanTime > b.scanTime;
                     });
    return records;
}

std::vector<core::Device> MonitorService::searchDevices(const std::string& query) {
    auto needle = trim(query);
    if (needle.empty()) {
        return devices_->listAll();
    }
    return devices_->search(needle);
}

core::Device MonitorService::updateDeviceAlias(int64_t deviceId, const std::string& name) {
    auto alias = trim(name);
    std::optional<std::string> value;
    if (!alias.empty()) {
        value = alias;
    }

    if (!devices_->updateCustomName(deviceId, value)) {
        throw core::NotFoundError("device " + std::to_string(deviceId) + " not found");
    }

    auto device = devices_->getById(deviceId);
    if (!device) {
        throw core::NotFoundError("device " + std::to_string(deviceId) + " not found");
    }
    spdlog::info("Alias of {} set to '{}'", device->ipAddress, alias);
    return *device;
}

core::Device MonitorService::updateDeviceAliasByMac(const std::string& macAddress,
                                                    const std::string& name) {
    auto normalized = core::MacAddress::normalize(macAddress);
    std::optional<core::Device> device;
    if (normalized) {
        device = devices_->getByMac(*normalized);
    }
    if (!device) {
        throw core::NotFoundError("no device with hardware address " + macAddress);
    }
    return updateDeviceAlias(device->id, name);
}

std::vector<core::ScanSession> MonitorService::recentSessions(int limit) {
    return sessions_->recent(limit);
}

core::NetworkStats MonitorService::networkStats() {
    auto all = devices_->listAll();
    core::NetworkStats stats;
    stats.totalDevices = static_cast<int>(all.size());
    stats.onlineDevices = static_cast<int>(
        std::count_if(all.begin(), all.end(), [](const core::Device& d) { return d.isOnline; }));
    stats.offlineDevices = stats.totalDevices - stats.onlineDevices;
    stats.sessionsLast24h = sessions_->countSince(std::chrono::system_clock::now() - ONE_DAY);
    return stats;
}

std::optional<std::string> MonitorService::lookupVendor(const std::string& macAddress) {
    return vendorResolver_->resolve(macAddress);
}

core::Subnet MonitorService::describeSubnet(const std::string& cidr) const {
    return core::Subnet::parse(cidr);
}

void MonitorService::persist() {
    if (!configManager_->save()) {
        spdlog::warn("Configuration change applied but could not be saved to {}",
                     configManager_->configPath().string());
    }
}

} // namespace lanwatch::engine
