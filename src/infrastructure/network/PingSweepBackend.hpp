#pragma once

#include "core/services/IProbeBackend.hpp"
#include "core/services/IProcessRunner.hpp"
#include "infrastructure/network/ArpTable.hpp"
#include "infrastructure/network/TcpPortProbe.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace lanwatch::infra {

/**
 * @brief Fallback discovery strategy built from ICMP echo, ARP and TCP connect.
 *
 * Host discovery sends one echo per address (plus maxRetries retries) across
 * a pool of maxWorkers threads. Hardware addresses come from the kernel ARP
 * cache. ARP sweeps use arp-scan when installed and the kernel cache
 * otherwise. The detail pass probes open ports with TCP connect.
 */
class PingSweepBackend : public core::IProbeBackend {
public:
    /**
     * @brief Sends one echo and returns the round trip in milliseconds.
     */
    using Pinger =
        std::function<std::optional<double>(const std::string&, std::chrono::milliseconds)>;

    struct Options {
        std::string arpScanPath{"arp-scan"};               ///< arp-scan program
        std::string arpCachePath{ArpTable::KERNEL_CACHE_PATH}; ///< Kernel ARP cache file
        int minPrefixLength{16};                           ///< Largest subnet swept
    };

    PingSweepBackend(Pinger pinger, std::shared_ptr<core::IProcessRunner> runner,
                     Options options);

    PingSweepBackend(Pinger pinger, std::shared_ptr<core::IProcessRunner> runner)
        : PingSweepBackend(std::move(pinger), std::move(runner), Options{}) {}

    std::string name() const override { return "ping-sweep"; }

    std::vector<core::ProbeObservation> discoverSubnet(const std::string& cidr,
                                                       core::ScanType scanType,
                                                       const core::ScanConfig& config) override;

    std::vector<core::ProbeObservation> probeHosts(const std::vector<std::string>& addresses,
                                                   const core::ScanConfig& config) override;

private:
    std::vector<core::ProbeObservation> echoSweep(const std::vector<std::string>& hosts,
                                                  const core::ScanConfig& config);
    std::vector<core::ProbeObservation> arpSweep(const std::string& cidr,
                                                 const core::ScanConfig& config);
    void attachHardwareAddresses(std::vector<core::ProbeObservation>& observations) const;
    std::optional<double> pingWithRetries(const std::string& address,
                                          const core::ScanConfig& config) const;

    Pinger pinger_;
    std::shared_ptr<core::IProcessRunner> runner_;
    Options options_;
    TcpPortProbe portProbe_;
};

} // namespace lanwatch::infra
