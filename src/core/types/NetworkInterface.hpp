/**
 * @file NetworkInterface.hpp
 * @brief Local IPv4 interface enumeration and subnet detection.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace lanwatch::core {

/**
 * @brief An IPv4 address bound to a local interface.
 */
struct NetworkInterface {
    std::string name;      ///< System name of the interface (e.g. "eth0")
    std::string ipAddress; ///< IPv4 address assigned to the interface
    std::string netmask;   ///< Dotted-quad netmask
    bool isUp{false};      ///< Whether the interface is up
    bool isLoopback{false}; ///< Whether this is a loopback interface

    /**
     * @brief Returns the prefix length encoded by the netmask.
     */
    [[nodiscard]] int prefixLength() const;

    /**
     * @brief Returns the subnet this interface sits on, e.g. "192.168.1.0/24".
     * @return The CIDR, or nullopt if the address or netmask is malformed.
     */
    [[nodiscard]] std::optional<std::string> subnetCidr() const;

    bool operator==(const NetworkInterface& other) const = default;
};

/**
 * @brief Utility class for enumerating network interfaces.
 */
class NetworkInterfaceEnumerator {
public:
    /**
     * @brief Enumerates all IPv4 interface addresses on the system.
     */
    static std::vector<NetworkInterface> enumerate();

    /**
     * @brief Picks the subnet of the first up, non-loopback interface.
     * @param interfaces Interfaces to choose from.
     * @return The subnet CIDR, or nullopt if no interface qualifies.
     */
    static std::optional<std::string> selectLocalSubnet(
        const std::vector<NetworkInterface>& interfaces);

    /**
     * @brief Detects the subnet of the machine's primary LAN interface.
     */
    static std::optional<std::string> detectLocalSubnet();
};

} // namespace lanwatch::core
