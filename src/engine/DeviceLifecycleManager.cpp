#include "engine/DeviceLifecycleManager.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace lanwatch::engine {

namespace {

void backfill(std::optional<std::string>& target, const std::optional<std::string>& value) {
    if ((!target || target->empty()) && value && !value->empty()) {
        target = value;
    }
}

} // namespace

DeviceLifecycleManager::DeviceLifecycleManager(
    std::shared_ptr<core::IDeviceRepository> repository)
    : repository_(std::move(repository)) {}

std::vector<core::ProbeObservation> DeviceLifecycleManager::coalesce(
    const std::vector<core::ProbeObservation>& batch) {
    std::vector<core::ProbeObservation> merged;
    std::unordered_map<std::string, size_t> indexByAddress;

    for (const auto& observation : batch) {
        auto [it, inserted] = indexByAddress.try_emplace(observation.address, merged.size());
        if (inserted) {
            merged.push_back(observation);
            continue;
        }

        auto& target = merged[it->second];
        target.isAlive = target.isAlive || observation.isAlive;
        backfill(target.macAddress, observation.macAddress);
        backfill(target.hostname, observation.hostname);
        backfill(target.vendor, observation.vendor);
        backfill(target.osHint, observation.osHint);
        backfill(target.deviceType, observation.deviceType);
        if (!target.latencyMs) {
            target.latencyMs = observation.latencyMs;
        }
        for (uint16_t port : observation.openPorts) {
            if (std::find(target.openPorts.begin(), target.openPorts.end(), port) ==
                target.openPorts.end()) {
                target.openPorts.push_back(port);
            }
        }
        std::sort(target.openPorts.begin(), target.openPorts.end());
        target.services.insert(target.services.end(), observation.services.begin(),
                               observation.services.end());
    }
    return merged;
}

void DeviceLifecycleManager::mergeInto(core::Device& device,
                                       const core::ProbeObservation& observation,
                                       std::chrono::system_clock::time_point sweepTime) {
    if (device.id == 0) {
        device.ipAddress = observation.address;
        device.firstSeen = sweepTime;
    }
    device.isOnline = observation.isAlive;
    device.lastSeen = sweepTime;

    backfill(device.macAddress, observation.macAddress);
    backfill(device.hostname, observation.hostname);
    backfill(device.vendor, observation.vendor);

    if (!observation.openPorts.empty()) {
        device.openPorts = observation.openPorts;
    }
    if (observation.deviceType) {
        device.deviceType = observation.deviceType;
    }
}

LifecycleSummary DeviceLifecycleManager::applyObservations(
    const std::vector<core::ProbeObservation>& batch,
    std::chrono::system_clock::time_point sweepTime) {
    LifecycleSummary summary;
    std::vector<core::Device> created;
    std::vector<core::Device> wentOffline;

    // A sweep is merged whole or not at all.
    repository_->inTransaction([&] {
        std::unordered_set<std::string> liveAddresses;

        for (const auto& observation : coalesce(batch)) {
            auto existing = repository_->getByAddress(observation.address);
            core::Device device = existing.value_or(core::Device{});
            mergeInto(device, observation, sweepTime);

            auto stored = repository_->upsert(device);
            if (existing) {
                ++summary.updated;
            } else {
                ++summary.created;
                created.push_back(stored);
            }

            core::ScanRecord record;
            record.deviceId = stored.id;
            record.scanTime = sweepTime;
            record.isOnline = observation.isAlive;
            record.latencyMs = observation.isAlive ? observation.latencyMs : std::nullopt;
            repository_->appendHistory(record);

            if (observation.isAlive) {
                liveAddresses.insert(observation.address);
            }
        }
        summary.live = static_cast<int>(liveAddresses.size());

        for (auto device : repository_->listOnline()) {
            if (liveAddresses.contains(device.ipAddress)) {
                continue;
            }
            device.isOnline = false;
            device.lastSeen = sweepTime;
            repository_->upsert(device);

            core::ScanRecord record;
            record.deviceId = device.id;
            record.scanTime = sweepTime;
            record.isOnline = false;
            repository_->appendHistory(record);

            ++summary.markedOffline;
            wentOffline.push_back(device);
        }
    });

    for (const auto& device : created) {
        spdlog::info("New device {} ({})", device.ipAddress,
                     device.macAddress.value_or("no hardware address"));
    }
    for (const auto& device : wentOffline) {
        spdlog::info("Device {} went offline", device.displayName());
    }

    spdlog::debug("Applied {} observations: {} created, {} updated, {} marked offline",
                  batch.size(), summary.created, summary.updated, summary.markedOffline);
    return summary;
}

} // namespace lanwatch::engine
