/**
 * @file ProbeObservation.hpp
 * @brief Uniform result shape produced by every probe backend.
 *
 * Observations are transient: the lifecycle manager folds them into
 * persistent Device records and then discards them.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lanwatch::core {

/**
 * @brief A service identified on an open port.
 */
struct ServiceInfo {
    uint16_t port{0};           ///< Port the service listens on
    std::string protocol{"tcp"}; ///< Transport protocol ("tcp" or "udp")
    std::string name;           ///< Service name (e.g. "http", "ssh")
    std::string version;        ///< Product/version string when known

    bool operator==(const ServiceInfo& other) const = default;
};

/**
 * @brief What one probe learned about one address.
 */
struct ProbeObservation {
    std::string address;                   ///< IPv4 address of the host
    std::optional<std::string> macAddress; ///< Hardware address, when visible
    std::optional<std::string> hostname;   ///< Resolved or reported hostname
    std::optional<std::string> vendor;     ///< Hardware vendor name
    bool isAlive{false};                   ///< Whether the host answered
    std::optional<double> latencyMs;       ///< Round-trip time in milliseconds
    std::vector<uint16_t> openPorts;       ///< Open ports found by the detail pass
    std::vector<ServiceInfo> services;     ///< Services found by the detail pass
    std::optional<std::string> osHint;     ///< Operating system guess
    std::optional<std::string> deviceType; ///< Inferred device category

    bool operator==(const ProbeObservation& other) const = default;
};

/**
 * @brief Well-known service names by port number.
 *
 * Used when a backend sees an open port but cannot fingerprint the service.
 */
class ServiceCatalog {
public:
    /**
     * @brief Looks up the conventional service name for a port.
     * @return Service name if known, empty string otherwise.
     */
    static std::string serviceForPort(uint16_t port);

    /**
     * @brief Ports probed by the connect-based detail pass when no explicit
     *        range is configured.
     *
     * Covers every port the device-type rules inspect.
     */
    static const std::vector<uint16_t>& signaturePorts();

    static const std::unordered_map<uint16_t, std::string>& knownServices();
};

} // namespace lanwatch::core
