/**
 * @file Device.hpp
 * @brief Persistent device identity and its per-sweep presence records.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lanwatch::core {

/**
 * @brief A network device, unique by IP address.
 *
 * Devices are created on first sighting and never deleted by normal
 * operation. Hostname, vendor and hardware address are back-filled once and
 * then kept; liveness and lastSeen change on every sweep.
 */
struct Device {
    int64_t id{0};                          ///< Unique identifier
    std::string ipAddress;                  ///< IPv4 address (unique key)
    std::optional<std::string> macAddress;  ///< Hardware address
    std::optional<std::string> hostname;    ///< Reverse-resolved or reported name
    std::optional<std::string> vendor;      ///< Hardware vendor
    std::optional<std::string> customName;  ///< Operator-assigned alias
    std::optional<std::string> deviceType;  ///< Inferred category (e.g. "Network Printer")
    std::chrono::system_clock::time_point firstSeen; ///< First sweep that saw the device
    std::chrono::system_clock::time_point lastSeen;  ///< Last sweep that touched the device
    bool isOnline{false};                   ///< Liveness as of the last sweep
    std::vector<uint16_t> openPorts;        ///< Open ports from the last detail pass

    /**
     * @brief Returns the name to show for this device.
     * @return customName if set, otherwise hostname, otherwise the IP address.
     */
    [[nodiscard]] std::string displayName() const;

    bool operator==(const Device& other) const = default;
};

/**
 * @brief One device's presence as observed by one sweep. Append-only.
 */
struct ScanRecord {
    int64_t id{0};                                   ///< Unique identifier
    int64_t deviceId{0};                             ///< Owning device
    std::chrono::system_clock::time_point scanTime;  ///< Sweep timestamp
    bool isOnline{false};                            ///< Whether the device answered
    std::optional<double> latencyMs;                 ///< Round-trip time, when measured

    bool operator==(const ScanRecord& other) const = default;
};

} // namespace lanwatch::core
