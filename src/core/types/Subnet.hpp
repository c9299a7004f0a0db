/**
 * @file Subnet.hpp
 * @brief IPv4 subnet parsing and host enumeration.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lanwatch::core {

/**
 * @brief A parsed IPv4 network in CIDR notation.
 *
 * Host bits in the input are tolerated and cleared, so "192.168.1.17/24"
 * describes the same subnet as "192.168.1.0/24". A bare address is a /32.
 */
struct Subnet {
    std::string network;   ///< Network address with host bits cleared
    std::string broadcast; ///< Broadcast address
    int prefixLength{32};  ///< Prefix length, [0, 32]
    uint64_t usableHosts{1}; ///< Number of assignable host addresses

    /**
     * @brief Returns the canonical "network/prefix" form.
     */
    [[nodiscard]] std::string cidr() const;

    /**
     * @brief Checks whether an IPv4 address falls inside this subnet.
     */
    [[nodiscard]] bool contains(const std::string& address) const;

    /**
     * @brief Lists assignable host addresses in ascending order.
     *
     * Network and broadcast addresses are skipped except for /31 and /32.
     */
    [[nodiscard]] std::vector<std::string> hostAddresses() const;

    /**
     * @brief Parses a CIDR string.
     * @throws ConfigurationError if the string is not an IPv4 network.
     */
    static Subnet parse(const std::string& cidr);

    static std::optional<Subnet> tryParse(const std::string& cidr);

    /**
     * @brief Checks whether a string is a dotted-quad IPv4 address.
     */
    static bool isValidAddress(const std::string& address);

    bool operator==(const Subnet& other) const = default;
};

} // namespace lanwatch::core
