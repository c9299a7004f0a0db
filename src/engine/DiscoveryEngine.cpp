#include "engine/DiscoveryEngine.hpp"

#include "core/types/Errors.hpp"
#include "core/types/Subnet.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace lanwatch::engine {

namespace {

// Detail results replace the discovery observation; identity the detail pass
// did not report is carried over.
core::ProbeObservation mergeDetail(const core::ProbeObservation& discovered,
                                   core::ProbeObservation detailed) {
    detailed.isAlive = true;
    if (!detailed.macAddress) {
        detailed.macAddress = discovered.macAddress;
    }
    if (!detailed.hostname) {
        detailed.hostname = discovered.hostname;
    }
    if (!detailed.vendor) {
        detailed.vendor = discovered.vendor;
    }
    if (!detailed.latencyMs) {
        detailed.latencyMs = discovered.latencyMs;
    }
    return detailed;
}

} // namespace

DiscoveryEngine::DiscoveryEngine(std::shared_ptr<core::IProbeBackend> backend,
                                 std::shared_ptr<VendorResolver> vendorResolver,
                                 std::shared_ptr<core::IHostnameResolver> hostnameResolver,
                                 SubnetDetector subnetDetector)
    : backend_(std::move(backend)),
      vendorResolver_(std::move(vendorResolver)),
      hostnameResolver_(std::move(hostnameResolver)),
      subnetDetector_(std::move(subnetDetector)) {}

std::string DiscoveryEngine::resolveSubnet(const std::optional<std::string>& target,
                                           const core::ScanConfig& config) const {
    if (target && !target->empty()) {
        return core::Subnet::parse(*target).cidr();
    }

    if (config.subnetCidr) {
        return core::Subnet::parse(*config.subnetCidr).cidr();
    }

    if (config.autoDetectSubnet && subnetDetector_) {
        if (auto detected = subnetDetector_()) {
            if (auto subnet = core::Subnet::tryParse(*detected)) {
                spdlog::debug("Auto-detected local subnet {}", subnet->cidr());
                return subnet->cidr();
            }
            spdlog::warn("Ignoring unparsable detected subnet '{}'", *detected);
        } else {
            spdlog::warn("Could not detect the local subnet, using {}", FALLBACK_SUBNET);
        }
    }

    return FALLBACK_SUBNET;
}

std::vector<core::ProbeObservation> DiscoveryEngine::sweep(const std::string& cidr,
                                                           core::ScanType scanType,
                                                           const core::ScanConfig& config) {
    spdlog::info("Starting {} sweep of {} via {}", core::ScanSession::scanTypeToString(scanType),
                 cidr, backend_->name());

    auto observations = backend_->discoverSubnet(cidr, scanType, config);

    std::unordered_set<std::string> excluded(config.excludeIps.begin(), config.excludeIps.end());
    std::erase_if(observations, [&excluded](const core::ProbeObservation& o) {
        return excluded.contains(o.address);
    });

    if (scanType == core::ScanType::Comprehensive) {
        runDetailPass(observations, config);
    }

    for (auto& observation : observations) {
        enrich(observation, scanType, config);
    }

    auto live = std::count_if(observations.begin(), observations.end(),
                              [](const core::ProbeObservation& o) { return o.isAlive; });
    spdlog::info("Sweep of {} observed {} live hosts", cidr, live);
    return observations;
}

void DiscoveryEngine::runDetailPass(std::vector<core::ProbeObservation>& observations,
                                    const core::ScanConfig& config) {
    std::vector<std::string> live;
    for (const auto& observation : observations) {
        if (observation.isAlive) {
            live.push_back(observation.address);
        }
    }

    std::unordered_map<std::string, core::ProbeObservation> detailed;
    for (size_t begin = 0; begin < live.size(); begin += DETAIL_CHUNK_SIZE) {
        auto end = std::min(begin + DETAIL_CHUNK_SIZE, live.size());
        std::vector<std::string> chunk(live.begin() + static_cast<std::ptrdiff_t>(begin),
                                       live.begin() + static_cast<std::ptrdiff_t>(end));
        try {
            for (auto& observation : backend_->probeHosts(chunk, config)) {
                auto address = observation.address;
                detailed.insert_or_assign(address, std::move(observation));
            }
        } catch (const std::exception& e) {
            spdlog::error("Detail probe of hosts {}..{} failed, skipping chunk: {}",
                          chunk.front(), chunk.back(), e.what());
        }
    }

    for (auto& observation : observations) {
        auto it = detailed.find(observation.address);
        if (it != detailed.end() && observation.isAlive) {
            observation = mergeDetail(observation, std::move(it->second));
        }
    }
    spdlog::debug("Detail pass returned {} of {} live hosts", detailed.size(), live.size());
}

void DiscoveryEngine::enrich(core::ProbeObservation& observation, core::ScanType scanType,
                             const core::ScanConfig& config) {
    if (config.resolveHostnames && !observation.hostname && hostnameResolver_) {
        observation.hostname = hostnameResolver_->resolve(observation.address);
    }

    if (config.fetchVendorInfo && !observation.vendor && observation.macAddress &&
        vendorResolver_) {
        observation.vendor = vendorResolver_->resolve(*observation.macAddress);
    }

    if (scanType == core::ScanType::Comprehensive && !observation.deviceType) {
        observation.deviceType = classifier_.classify(observation);
    }
}

} // namespace lanwatch::engine
