#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace lanwatch::infra {

/**
 * @brief TCP connect probe for a single host.
 *
 * Runs its own asio::io_context on the calling thread, keeping at most
 * maxConcurrency connection attempts in flight. Each attempt is bounded by
 * the timeout; a port counts as open only if the connect succeeds.
 */
class TcpPortProbe {
public:
    /**
     * @brief Probes a list of ports on one host.
     * @param address IPv4 address of the target.
     * @param ports Ports to try.
     * @param timeout Per-connection timeout.
     * @param maxConcurrency Maximum simultaneous connection attempts.
     * @return Open ports in ascending order; empty for an invalid address.
     */
    std::vector<uint16_t> openPorts(const std::string& address,
                                    const std::vector<uint16_t>& ports,
                                    std::chrono::milliseconds timeout,
                                    int maxConcurrency = 64) const;
};

} // namespace lanwatch::infra
