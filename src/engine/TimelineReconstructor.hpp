#pragma once

#include "core/services/IDeviceRepository.hpp"
#include "core/types/Timeline.hpp"

#include <chrono>
#include <memory>
#include <vector>

namespace lanwatch::engine {

/**
 * @brief Rebuilds online intervals from a device's presence records.
 */
class TimelineReconstructor {
public:
    explicit TimelineReconstructor(std::shared_ptr<core::IDeviceRepository> repository);

    /**
     * @brief Fetches the device's records in [from, to] and reconstructs them.
     */
    std::vector<core::OnlineInterval> forDevice(int64_t deviceId,
                                                std::chrono::system_clock::time_point from,
                                                std::chrono::system_clock::time_point to);

    /**
     * @brief Folds presence records into online intervals.
     *
     * Records are sorted by scan time first (stable). An interval opens on a
     * not-live to live transition and closes on the next live to not-live
     * one. An interval still open after the last record has no end.
     */
    static std::vector<core::OnlineInterval> reconstruct(std::vector<core::ScanRecord> records);

private:
    std::shared_ptr<core::IDeviceRepository> repository_;
};

} // namespace lanwatch::engine
