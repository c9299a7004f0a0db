#pragma once

#include "core/services/IProbeBackend.hpp"
#include "core/services/IProcessRunner.hpp"

#include <memory>
#include <string>
#include <vector>

namespace lanwatch::infra {

/**
 * @brief Primary discovery strategy driving the external nmap tool.
 *
 * Each call runs one nmap process with XML output on stdout and translates
 * the report through NmapXmlParser. A missing binary, a non-zero exit or a
 * timeout is raised as core::ProbeBackendError.
 */
class NmapProbeBackend : public core::IProbeBackend {
public:
    /**
     * @brief Constructs the backend.
     * @param runner Process runner used to spawn nmap.
     * @param nmapPath Program name or absolute path of nmap.
     */
    explicit NmapProbeBackend(std::shared_ptr<core::IProcessRunner> runner,
                              std::string nmapPath = "nmap");

    std::string name() const override { return "nmap"; }

    std::vector<core::ProbeObservation> discoverSubnet(const std::string& cidr,
                                                       core::ScanType scanType,
                                                       const core::ScanConfig& config) override;

    std::vector<core::ProbeObservation> probeHosts(const std::vector<std::string>& addresses,
                                                   const core::ScanConfig& config) override;

    /**
     * @brief Builds the host discovery argument list (without the program name).
     *
     * ARP sweeps use -PR; other sweeps translate pingMethods into -PE, -PS,
     * -PA and -PU flags. Rate, retries, host timeout and exclusions follow
     * the config.
     */
    static std::vector<std::string> discoveryArguments(const std::string& cidr,
                                                       core::ScanType scanType,
                                                       const core::ScanConfig& config);

    /**
     * @brief Builds the detail pass argument list (service and OS detection).
     */
    static std::vector<std::string> detailArguments(const std::vector<std::string>& addresses,
                                                    const core::ScanConfig& config);

    /**
     * @brief Ports scanned by the detail pass when port scanning is not enabled.
     */
    static constexpr const char* DEFAULT_DETAIL_PORTS = "1-1000,8080,8443,9000";

private:
    std::vector<core::ProbeObservation> runNmap(std::vector<std::string> args,
                                                std::chrono::milliseconds timeout);

    std::shared_ptr<core::IProcessRunner> runner_;
    std::string nmapPath_;
};

} // namespace lanwatch::infra
