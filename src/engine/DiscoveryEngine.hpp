#pragma once

#include "core/services/IHostnameResolver.hpp"
#include "core/services/IProbeBackend.hpp"
#include "engine/DeviceTypeClassifier.hpp"
#include "engine/VendorResolver.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lanwatch::engine {

/**
 * @brief Turns a sweep request into a batch of enriched observations.
 *
 * Resolves the effective subnet, runs discovery through the probe backend,
 * optionally runs the detail pass in chunks, then back-fills hostnames,
 * vendors and device types. Enrichment never changes liveness.
 */
class DiscoveryEngine {
public:
    /// Returns the local subnet in CIDR notation, if one can be detected.
    using SubnetDetector = std::function<std::optional<std::string>()>;

    static constexpr const char* FALLBACK_SUBNET = "192.168.1.0/24";
    static constexpr size_t DETAIL_CHUNK_SIZE = 10;

    DiscoveryEngine(std::shared_ptr<core::IProbeBackend> backend,
                    std::shared_ptr<VendorResolver> vendorResolver,
                    std::shared_ptr<core::IHostnameResolver> hostnameResolver,
                    SubnetDetector subnetDetector);

    /**
     * @brief Picks the subnet a sweep will cover.
     *
     * Explicit target first, then the configured subnet, then the detected
     * local subnet when auto-detection is on, then 192.168.1.0/24.
     *
     * @return Subnet in canonical CIDR form (host bits cleared).
     * @throws core::ConfigurationError if the explicit target is not a valid CIDR.
     */
    std::string resolveSubnet(const std::optional<std::string>& target,
                              const core::ScanConfig& config) const;

    /**
     * @brief Runs one sweep.
     * @param cidr Resolved subnet.
     * @param scanType Ping, ARP or comprehensive.
     * @param config Configuration snapshot for this sweep.
     * @return Observations, never including excluded addresses.
     */
    std::vector<core::ProbeObservation> sweep(const std::string& cidr, core::ScanType scanType,
                                              const core::ScanConfig& config);

private:
    void runDetailPass(std::vector<core::ProbeObservation>& observations,
                       const core::ScanConfig& config);
    void enrich(core::ProbeObservation& observation, core::ScanType scanType,
                const core::ScanConfig& config);

    std::shared_ptr<core::IProbeBackend> backend_;
    std::shared_ptr<VendorResolver> vendorResolver_;
    std::shared_ptr<core::IHostnameResolver> hostnameResolver_;
    SubnetDetector subnetDetector_;
    DeviceTypeClassifier classifier_;
};

} // namespace lanwatch::engine
