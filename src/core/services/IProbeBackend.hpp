/**
 * @file IProbeBackend.hpp
 * @brief Interface for host discovery strategies.
 *
 * A probe backend wraps one external discovery mechanism (nmap, ICMP echo,
 * ARP) and translates its raw output into ProbeObservation values.
 */

#pragma once

#include "core/types/ProbeObservation.hpp"
#include "core/types/ScanConfig.hpp"
#include "core/types/ScanSession.hpp"

#include <optional>
#include <string>
#include <vector>

namespace lanwatch::core {

/**
 * @brief Interface for a host discovery strategy.
 *
 * Backend-level failures (tool missing, non-zero exit, timeout) are thrown as
 * ProbeBackendError. An unparsable report is not a failure: it yields an
 * empty result and is logged.
 */
class IProbeBackend {
public:
    virtual ~IProbeBackend() = default;

    /**
     * @brief Returns the strategy name used in logs.
     */
    virtual std::string name() const = 0;

    /**
     * @brief Discovers live hosts in a subnet.
     * @param cidr Subnet to sweep.
     * @param scanType Ping or ARP discovery. Comprehensive behaves like Ping here.
     * @param config Sweep configuration; excludeIps are never probed.
     * @return One observation per live host.
     * @throws ProbeBackendError if the mechanism is unavailable or fails.
     */
    virtual std::vector<ProbeObservation> discoverSubnet(const std::string& cidr,
                                                         ScanType scanType,
                                                         const ScanConfig& config) = 0;

    /**
     * @brief Runs the detail pass (ports, services, OS) over a batch of hosts.
     * @param addresses Hosts to probe.
     * @param config Sweep configuration.
     * @return Observations for the hosts that answered.
     * @throws ProbeBackendError if the mechanism is unavailable or fails.
     */
    virtual std::vector<ProbeObservation> probeHosts(const std::vector<std::string>& addresses,
                                                     const ScanConfig& config) = 0;

    /**
     * @brief Runs the detail pass over a single host.
     * @return The observation, or nullopt if the host did not answer.
     */
    virtual std::optional<ProbeObservation> probeHost(const std::string& address,
                                                      const ScanConfig& config) {
        auto results = probeHosts({address}, config);
        if (results.empty()) {
            return std::nullopt;
        }
        return results.front();
    }
};

} // namespace lanwatch::core
