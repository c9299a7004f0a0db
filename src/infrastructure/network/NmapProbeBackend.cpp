#include "infrastructure/network/NmapProbeBackend.hpp"

#include "core/types/Errors.hpp"
#include "core/types/Subnet.hpp"
#include "infrastructure/network/NmapXmlParser.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace lanwatch::infra {

namespace {

constexpr auto MIN_PROCESS_TIMEOUT = std::chrono::seconds(30);
constexpr auto MAX_PROCESS_TIMEOUT = std::chrono::minutes(30);

std::string joinPorts(const std::vector<int>& ports) {
    std::string joined;
    for (size_t i = 0; i < ports.size(); ++i) {
        if (i > 0) {
            joined += ',';
        }
        joined += std::to_string(ports[i]);
    }
    return joined;
}

std::string joinAddresses(const std::vector<std::string>& addresses) {
    std::string joined;
    for (const auto& address : addresses) {
        if (!joined.empty()) {
            joined += ',';
        }
        joined += address;
    }
    return joined;
}

void appendPerformanceOptions(std::vector<std::string>& args, const core::ScanConfig& config) {
    args.insert(args.end(), {"--max-retries", std::to_string(config.maxRetries)});
    args.insert(args.end(), {"--min-rate", std::to_string(config.scanRate)});
    args.insert(args.end(),
                {"--host-timeout", std::to_string(config.timeout().count()) + "ms"});
}

std::chrono::milliseconds processTimeout(const core::ScanConfig& config, uint64_t hosts) {
    auto perHost = config.timeout() * (config.maxRetries + 1);
    auto total = perHost * static_cast<int64_t>(std::max<uint64_t>(hosts, 1));
    return std::clamp<std::chrono::milliseconds>(total, MIN_PROCESS_TIMEOUT, MAX_PROCESS_TIMEOUT);
}

} // namespace

NmapProbeBackend::NmapProbeBackend(std::shared_ptr<core::IProcessRunner> runner,
                                   std::string nmapPath)
    : runner_(std::move(runner)), nmapPath_(std::move(nmapPath)) {}

std::vector<std::string> NmapProbeBackend::discoveryArguments(const std::string& cidr,
                                                              core::ScanType scanType,
                                                              const core::ScanConfig& config) {
    std::vector<std::string> args{"-sn"};

    if (scanType == core::ScanType::Arp) {
        args.emplace_back("-PR");
    } else {
        for (auto method : config.pingMethods) {
            switch (method) {
            case core::ProbeMethod::Icmp:
                args.emplace_back("-PE");
                break;
            case core::ProbeMethod::TcpSyn:
                if (!config.tcpPingPorts.empty()) {
                    args.push_back("-PS" + joinPorts(config.tcpPingPorts));
                }
                break;
            case core::ProbeMethod::TcpAck:
                if (!config.ackPingPorts.empty()) {
                    args.push_back("-PA" + joinPorts(config.ackPingPorts));
                }
                break;
            case core::ProbeMethod::Udp:
                args.emplace_back("-PU");
                break;
            }
        }
    }

    appendPerformanceOptions(args, config);

    if (!config.excludeIps.empty()) {
        args.insert(args.end(), {"--exclude", joinAddresses(config.excludeIps)});
    }

    args.insert(args.end(), {"-oX", "-", cidr});
    return args;
}

std::vector<std::string> NmapProbeBackend::detailArguments(
    const std::vector<std::string>& addresses, const core::ScanConfig& config) {
    std::vector<std::string> args{"-sS", "-sV", "-O", "--version-intensity", "5"};

    args.insert(args.end(),
                {"-p", config.enablePortScan ? config.portRange : DEFAULT_DETAIL_PORTS});
    appendPerformanceOptions(args, config);
    args.insert(args.end(), {"-oX", "-"});
    args.insert(args.end(), addresses.begin(), addresses.end());
    return args;
}

std::vector<core::ProbeObservation> NmapProbeBackend::discoverSubnet(
    const std::string& cidr, core::ScanType scanType, const core::ScanConfig& config) {
    auto subnet = core::Subnet::parse(cidr);
    auto args = discoveryArguments(subnet.cidr(), scanType, config);

    spdlog::info("nmap {} sweep of {}", core::ScanSession::scanTypeToString(scanType),
                 subnet.cidr());
    auto observations = runNmap(std::move(args), processTimeout(config, subnet.usableHosts));

    // nmap honours --exclude, but the report is filtered anyway
    std::erase_if(observations, [&config](const core::ProbeObservation& o) {
        return std::find(config.excludeIps.begin(), config.excludeIps.end(), o.address) !=
               config.excludeIps.end();
    });
    return observations;
}

std::vector<core::ProbeObservation> NmapProbeBackend::probeHosts(
    const std::vector<std::string>& addresses, const core::ScanConfig& config) {
    if (addresses.empty()) {
        return {};
    }

    spdlog::info("nmap detail pass over {} hosts", addresses.size());
    return runNmap(detailArguments(addresses, config), processTimeout(config, addresses.size()));
}

std::vector<core::ProbeObservation> NmapProbeBackend::runNmap(
    std::vector<std::string> args, std::chrono::milliseconds timeout) {
    args.insert(args.begin(), nmapPath_);

    auto result = runner_->run(args, timeout);
    if (result.spawnFailed) {
        throw core::ProbeBackendError(name(), "nmap is not available: " + result.stderrText);
    }
    if (result.timedOut) {
        throw core::ProbeBackendError(name(),
                                      "timed out after " + std::to_string(timeout.count()) + "ms");
    }
    if (result.exitCode != 0) {
        auto message = result.stderrText.empty() ? std::string("no diagnostics")
                                                 : result.stderrText;
        throw core::ProbeBackendError(
            name(), "exited with code " + std::to_string(result.exitCode) + ": " + message);
    }

    return NmapXmlParser::parse(result.stdoutText);
}

} // namespace lanwatch::infra
