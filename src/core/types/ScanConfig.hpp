/**
 * @file ScanConfig.hpp
 * @brief Sweep configuration, validation and named presets.
 *
 * A ScanConfig is copied at the start of every sweep and never mutated while
 * the sweep runs. Every path that produces one (presets, operator updates,
 * loading from disk) validates it eagerly.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lanwatch::core {

/**
 * @brief Host discovery probe kinds understood by the probe backends.
 */
enum class ProbeMethod : int {
    Icmp = 0,   ///< ICMP echo request
    TcpSyn = 1, ///< TCP SYN to tcpPingPorts
    TcpAck = 2, ///< TCP ACK to ackPingPorts
    Udp = 3     ///< UDP ping
};

/**
 * @brief Configuration applied to a single sweep.
 */
struct ScanConfig {
    std::optional<std::string> subnetCidr;   ///< Manually configured subnet (IPv4 CIDR)
    bool autoDetectSubnet{true};             ///< Detect the local subnet when none is configured
    std::vector<std::string> excludeIps;     ///< Addresses never probed nor recorded
    int scanRate{100};                       ///< Packets per second, [1, 1000]
    int maxWorkers{50};                      ///< Concurrent probe workers, [1, 200]
    std::string scanTimeout{"3s"};           ///< Per-host timeout, "<number>[ms|s|m|h]"
    int maxRetries{2};                       ///< Probe retries, [0, 5]
    bool resolveHostnames{true};             ///< Back-fill hostnames by reverse lookup
    bool fetchVendorInfo{true};              ///< Back-fill vendors from the OUI table
    bool arpLookupEnabled{true};             ///< Recover hardware addresses from ARP
    bool fallbackEnabled{true};              ///< Fall through to the next probe strategy on failure
    std::vector<ProbeMethod> pingMethods{ProbeMethod::Icmp}; ///< Discovery probe kinds
    std::vector<int> tcpPingPorts{22, 80, 443};              ///< Ports used by TcpSyn probes
    std::vector<int> ackPingPorts{80};                       ///< Ports used by TcpAck probes
    bool enablePortScan{false};              ///< Use portRange for the detail pass
    std::string portRange{"1-1000"};         ///< Ports for the detail pass, e.g. "22,80,8000-8100"

    /**
     * @brief Checks every field against its allowed range.
     * @throws ConfigurationError naming the first offending field.
     */
    void validate() const;

    /**
     * @brief Returns the per-host timeout as a duration.
     * @throws ConfigurationError if scanTimeout is malformed.
     */
    [[nodiscard]] std::chrono::milliseconds timeout() const;

    /**
     * @brief Parses a timeout string such as "3s", "1.5s", "500ms" or "2m".
     *
     * A bare number is interpreted as seconds.
     *
     * @return The duration, or nullopt if the string does not match the grammar.
     */
    static std::optional<std::chrono::milliseconds> parseTimeout(const std::string& text);

    /**
     * @brief Expands a port range expression into individual ports.
     * @param text Comma separated ports or "lo-hi" ranges.
     * @return Ports in ascending order without duplicates.
     * @throws ConfigurationError on malformed input or ports outside [1, 65535].
     */
    static std::vector<uint16_t> expandPortRange(const std::string& text);

    static std::string methodToString(ProbeMethod method);
    static std::optional<ProbeMethod> methodFromString(const std::string& str);

    bool operator==(const ScanConfig& other) const = default;
};

/**
 * @brief A named, documented configuration shipped with the application.
 */
struct ScanPreset {
    std::string name;        ///< Key used by loadPreset ("fast", "balanced", ...)
    std::string displayName; ///< Human-readable name
    std::string description; ///< What the preset trades off
    ScanConfig config;       ///< The configuration itself
};

/**
 * @brief Factory for the built-in presets.
 */
class ScanPresets {
public:
    static ScanConfig fast();
    static ScanConfig balanced();
    static ScanConfig thorough();
    static ScanConfig stealth();

    /**
     * @brief Looks up a preset by its key.
     * @throws ConfigurationError for an unknown name.
     */
    static ScanConfig byName(const std::string& name);

    /**
     * @brief Returns all presets in display order.
     */
    static std::vector<ScanPreset> all();
};

} // namespace lanwatch::core
