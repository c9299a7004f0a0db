/**
 * @file MonitorService.hpp
 * @brief Operator-facing facade over sweeps, devices, history and configuration.
 */

#pragma once

#include "core/services/IDeviceRepository.hpp"
#include "core/services/IScanSessionRepository.hpp"
#include "core/types/ScanConfig.hpp"
#include "core/types/ScanSession.hpp"
#include "core/types/Subnet.hpp"
#include "core/types/Timeline.hpp"
#include "engine/ScanOrchestrator.hpp"
#include "engine/TimelineReconstructor.hpp"
#include "engine/VendorResolver.hpp"
#include "infrastructure/config/ConfigManager.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lanwatch::engine {

/**
 * @brief Single entry point for everything an operator surface needs.
 *
 * Configuration changes are validated, applied to the orchestrator and, when
 * a ConfigManager is attached, persisted to config.json.
 */
class MonitorService {
public:
    MonitorService(std::shared_ptr<core::IDeviceRepository> devices,
                   std::shared_ptr<core::IScanSessionRepository> sessions,
                   std::shared_ptr<ScanOrchestrator> orchestrator,
                   std::shared_ptr<VendorResolver> vendorResolver,
                   std::shared_ptr<infra::ConfigManager> configManager = nullptr);

    // Sweeps

    /**
     * @brief Runs a sweep and waits for it.
     * @throws core::ConfigurationError if an explicit subnet is not a valid CIDR.
     */
    core::SweepOutcome sweepNow(const std::optional<std::string>& subnet,
                                core::ScanType scanType);

    /**
     * @brief Starts a sweep on the worker pool and returns immediately.
     * @throws core::ConfigurationError if an explicit subnet is not a valid CIDR.
     */
    core::SweepOutcome sweepInBackground(const std::optional<std::string>& subnet,
                                         core::ScanType scanType);

    [[nodiscard]] core::ScanStatus getScanStatus() const;

    /**
     * @brief Changes and persists the periodic interval.
     * @throws core::ConfigurationError below 60 seconds.
     */
    void setScanInterval(int seconds);

    // Configuration

    /**
     * @brief Validates, applies and persists a sweep configuration.
     * @throws core::ConfigurationError if the configuration is invalid.
     */
    void applyConfig(const core::ScanConfig& config);

    [[nodiscard]] core::ScanConfig getConfig() const;

    /**
     * @brief Applies a built-in preset.
     * @return The configuration now in effect.
     * @throws core::ConfigurationError for an unknown preset.
     */
    core::ScanConfig loadPreset(const std::string& name);

    [[nodiscard]] std::vector<core::ScanPreset> availablePresets() const;

    // Timelines

    /**
     * @brief Online intervals of one device over a UTC day.
     * @param date Day as "YYYY-MM-DD".
     * @throws core::NotFoundError for an unknown device.
     * @throws core::ConfigurationError for a malformed date.
     */
    std::vector<core::OnlineInterval> reconstructTimeline(int64_t deviceId,
                                                          const std::string& date);

    /**
     * @brief Timelines of every device that was online during a UTC day.
     * @throws core::ConfigurationError for a malformed date.
     */
    std::vector<core::DeviceTimeline> dayTimeline(const std::string& date);

    // Devices

    std::vector<core::Device> listDevices();
    std::vector<core::Device> onlineDevices();
    std::optional<core::Device> getDevice(int64_t deviceId);

    /**
     * @brief Presence records of a device over the last hours, newest first.
     * @throws core::NotFoundError for an unknown device.
     */
    std::vector<core::ScanRecord> deviceHistory(int64_t deviceId, int hours = 24);

    std::vector<core::Device> searchDevices(const std::string& query);

    /**
     * @brief Sets the operator alias of a device; an empty name clears it.
     * @return The updated device.
     * @throws core::NotFoundError for an unknown device.
     */
    core::Device updateDeviceAlias(int64_t deviceId, const std::string& name);

    /**
     * @brief Same as updateDeviceAlias, addressing the device by hardware address.
     * @throws core::NotFoundError if no device has that hardware address.
     */
    core::Device updateDeviceAliasByMac(const std::string& macAddress, const std::string& name);

    // Sessions and statistics

    std::vector<core::ScanSession> recentSessions(int limit = 10);
    core::NetworkStats networkStats();

    // Utilities

    std::optional<std::string> lookupVendor(const std::string& macAddress);

    /**
     * @brief Parses a subnet and reports its boundaries.
     * @throws core::ConfigurationError for an invalid CIDR.
     */
    [[nodiscard]] core::Subnet describeSubnet(const std::string& cidr) const;

    /**
     * @brief Parses "YYYY-MM-DD" as the start of that UTC day.
     * @throws core::ConfigurationError for a malformed or impossible date.
     */
    static std::chrono::system_clock::time_point parseDay(const std::string& date);

private:
    void persist();

    std::shared_ptr<core::IDeviceRepository> devices_;
    std::shared_ptr<core::IScanSessionRepository> sessions_;
    std::shared_ptr<ScanOrchestrator> orchestrator_;
    std::shared_ptr<VendorResolver> vendorResolver_;
    std::shared_ptr<infra::ConfigManager> configManager_;
    TimelineReconstructor timeline_;
};

} // namespace lanwatch::engine
