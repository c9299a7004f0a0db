/**
 * @file Timeline.hpp
 * @brief Online intervals reconstructed from scan history.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lanwatch::core {

/**
 * @brief A contiguous span during which a device was observed online.
 */
struct OnlineInterval {
    std::chrono::system_clock::time_point start;              ///< First live observation
    std::optional<std::chrono::system_clock::time_point> end; ///< First non-live observation after start

    /**
     * @brief Whether the interval was still open at the last observation.
     */
    [[nodiscard]] bool isOngoing() const { return !end.has_value(); }

    bool operator==(const OnlineInterval& other) const = default;
};

/**
 * @brief All online intervals of one device within a time window.
 */
struct DeviceTimeline {
    int64_t deviceId{0};
    std::string displayName;
    std::string ipAddress;
    std::vector<OnlineInterval> intervals;
};

} // namespace lanwatch::core
