#include "infrastructure/network/PingSweepBackend.hpp"

#include "core/types/Errors.hpp"
#include "core/types/Subnet.hpp"

#include <asio/post.hpp>
#include <asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>
#include <unordered_map>
#include <unordered_set>

#include <arpa/inet.h>

namespace lanwatch::infra {

namespace {

constexpr auto ARP_SCAN_TIMEOUT = std::chrono::seconds(60);

uint32_t addressKey(const std::string& address) {
    struct in_addr addr {};
    inet_pton(AF_INET, address.c_str(), &addr);
    return ntohl(addr.s_addr);
}

void sortByAddress(std::vector<core::ProbeObservation>& observations) {
    std::sort(observations.begin(), observations.end(),
              [](const core::ProbeObservation& a, const core::ProbeObservation& b) {
                  return addressKey(a.address) < addressKey(b.address);
              });
}

std::vector<uint16_t> detailPorts(const core::ScanConfig& config) {
    if (config.enablePortScan) {
        return core::ScanConfig::expandPortRange(config.portRange);
    }
    return core::ServiceCatalog::signaturePorts();
}

} // namespace

PingSweepBackend::PingSweepBackend(Pinger pinger, std::shared_ptr<core::IProcessRunner> runner,
                                   Options options)
    : pinger_(std::move(pinger)), runner_(std::move(runner)), options_(std::move(options)) {}

std::vector<core::ProbeObservation> PingSweepBackend::discoverSubnet(
    const std::string& cidr, core::ScanType scanType, const core::ScanConfig& config) {
    auto subnet = core::Subnet::parse(cidr);
    if (subnet.prefixLength < options_.minPrefixLength) {
        throw core::ProbeBackendError(name(), "subnet " + subnet.cidr() +
                                                  " is too large for an echo sweep (limit /" +
                                                  std::to_string(options_.minPrefixLength) + ")");
    }

    if (scanType == core::ScanType::Arp) {
        return arpSweep(subnet.cidr(), config);
    }

    std::unordered_set<std::string> excluded(config.excludeIps.begin(), config.excludeIps.end());
    auto hosts = subnet.hostAddresses();
    std::erase_if(hosts, [&excluded](const std::string& ip) { return excluded.contains(ip); });

    spdlog::info("Echo sweep of {} ({} hosts, {} workers)", subnet.cidr(), hosts.size(),
                 config.maxWorkers);
    auto observations = echoSweep(hosts, config);

    if (config.arpLookupEnabled) {
        attachHardwareAddresses(observations);
    }
    return observations;
}

std::vector<core::ProbeObservation> PingSweepBackend::probeHosts(
    const std::vector<std::string>& addresses, const core::ScanConfig& config) {
    std::vector<core::ProbeObservation> observations;
    if (addresses.empty()) {
        return observations;
    }

    auto ports = detailPorts(config);
    auto timeout = config.timeout();
    std::mutex resultsMutex;

    {
        asio::thread_pool pool(
            static_cast<size_t>(std::min<int>(config.maxWorkers, static_cast<int>(addresses.size()))));

        for (const auto& address : addresses) {
            asio::post(pool, [&, address]() {
                core::ProbeObservation observation;
                observation.address = address;
                observation.openPorts = portProbe_.openPorts(address, ports, timeout);
                observation.latencyMs = pingWithRetries(address, config);
                observation.isAlive = observation.latencyMs.has_value() ||
                                      !observation.openPorts.empty();

                for (uint16_t port : observation.openPorts) {
                    observation.services.push_back(
                        {port, "tcp", core::ServiceCatalog::serviceForPort(port), ""});
                }

                if (observation.isAlive) {
                    std::lock_guard lock(resultsMutex);
                    observations.push_back(std::move(observation));
                }
            });
        }
        pool.join();
    }

    if (config.arpLookupEnabled) {
        attachHardwareAddresses(observations);
    }
    sortByAddress(observations);
    return observations;
}

std::vector<core::ProbeObservation> PingSweepBackend::echoSweep(
    const std::vector<std::string>& hosts, const core::ScanConfig& config) {
    std::vector<core::ProbeObservation> observations;
    if (hosts.empty()) {
        return observations;
    }

    std::mutex resultsMutex;
    auto workers = std::min<size_t>(static_cast<size_t>(config.maxWorkers), hosts.size());
    asio::thread_pool pool(workers);

    for (const auto& host : hosts) {
        asio::post(pool, [&, host]() {
            auto latency = pingWithRetries(host, config);
            if (!latency) {
                return;
            }

            core::ProbeObservation observation;
            observation.address = host;
            observation.isAlive = true;
            observation.latencyMs = latency;

            std::lock_guard lock(resultsMutex);
            observations.push_back(std::move(observation));
        });
    }
    pool.join();

    sortByAddress(observations);
    spdlog::info("Echo sweep found {} live hosts", observations.size());
    return observations;
}

std::vector<core::ProbeObservation> PingSweepBackend::arpSweep(const std::string& cidr,
                                                               const core::ScanConfig& config) {
    auto subnet = core::Subnet::parse(cidr);
    std::vector<ArpEntry> entries;

    if (runner_->isAvailable(options_.arpScanPath)) {
        auto result = runner_->run({options_.arpScanPath, "-l"}, ARP_SCAN_TIMEOUT);
        if (result.succeeded()) {
            entries = ArpTable::parseArpScan(result.stdoutText);
        } else {
            spdlog::warn("arp-scan failed (exit {}), using the kernel ARP cache", result.exitCode);
        }
    }

    if (entries.empty()) {
        entries = ArpTable::readKernelCache(options_.arpCachePath);
    }

    std::vector<core::ProbeObservation> observations;
    for (const auto& entry : entries) {
        if (!subnet.contains(entry.ipAddress)) {
            continue;
        }
        if (std::find(config.excludeIps.begin(), config.excludeIps.end(), entry.ipAddress) !=
            config.excludeIps.end()) {
            continue;
        }
        auto duplicate = std::find_if(observations.begin(), observations.end(),
                                      [&entry](const core::ProbeObservation& o) {
                                          return o.address == entry.ipAddress;
                                      });
        if (duplicate != observations.end()) {
            continue;
        }

        core::ProbeObservation observation;
        observation.address = entry.ipAddress;
        observation.macAddress = entry.macAddress;
        observation.vendor = entry.vendor;
        observation.isAlive = true;
        observations.push_back(std::move(observation));
    }

    sortByAddress(observations);
    spdlog::info("ARP sweep of {} found {} hosts", cidr, observations.size());
    return observations;
}

void PingSweepBackend::attachHardwareAddresses(
    std::vector<core::ProbeObservation>& observations) const {
    auto entries = ArpTable::readKernelCache(options_.arpCachePath);
    if (entries.empty()) {
        return;
    }

    std::unordered_map<std::string, std::string> macByAddress;
    for (const auto& entry : entries) {
        macByAddress.emplace(entry.ipAddress, entry.macAddress);
    }

    for (auto& observation : observations) {
        if (observation.macAddress) {
            continue;
        }
        auto it = macByAddress.find(observation.address);
        if (it != macByAddress.end()) {
            observation.macAddress = it->second;
        }
    }
}

std::optional<double> PingSweepBackend::pingWithRetries(const std::string& address,
                                                        const core::ScanConfig& config) const {
    auto timeout = config.timeout();
    for (int attempt = 0; attempt <= config.maxRetries; ++attempt) {
        if (auto latency = pinger_(address, timeout)) {
            return latency;
        }
    }
    return std::nullopt;
}

} // namespace lanwatch::infra
