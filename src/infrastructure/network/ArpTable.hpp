#pragma once

#include <optional>
#include <string>
#include <vector>

namespace lanwatch::infra {

/**
 * @brief One address-to-hardware mapping learned from ARP.
 */
struct ArpEntry {
    std::string ipAddress;
    std::string macAddress;           ///< Canonical "AA:BB:CC:DD:EE:FF"
    std::optional<std::string> vendor; ///< Vendor column reported by arp-scan
    std::string interfaceName;        ///< Device column of /proc/net/arp

    bool operator==(const ArpEntry& other) const = default;
};

/**
 * @brief Parsers for the kernel ARP cache and arp-scan output.
 */
class ArpTable {
public:
    static constexpr const char* KERNEL_CACHE_PATH = "/proc/net/arp";

    /**
     * @brief Parses the contents of /proc/net/arp.
     *
     * Incomplete entries (flags 0x0 or an all-zero address) are skipped.
     */
    static std::vector<ArpEntry> parseKernelCache(const std::string& content);

    /**
     * @brief Parses "arp-scan -l" output (tab separated ip, mac, vendor).
     */
    static std::vector<ArpEntry> parseArpScan(const std::string& output);

    /**
     * @brief Reads and parses the kernel cache from disk.
     * @return Entries, or an empty list if the file cannot be read.
     */
    static std::vector<ArpEntry> readKernelCache(const std::string& path = KERNEL_CACHE_PATH);
};

} // namespace lanwatch::infra
