#pragma once

#include "core/services/IDeviceRepository.hpp"
#include "core/types/ProbeObservation.hpp"

#include <chrono>
#include <memory>
#include <vector>

namespace lanwatch::engine {

/**
 * @brief Counters describing what one batch did to the device store.
 */
struct LifecycleSummary {
    int created{0};       ///< Devices seen for the first time
    int updated{0};       ///< Existing devices observed by this sweep
    int markedOffline{0}; ///< Online devices absent from this sweep
    int live{0};          ///< Distinct live addresses in the batch

    bool operator==(const LifecycleSummary& other) const = default;
};

/**
 * @brief Merges sweep observations into persistent devices and history.
 *
 * Every device touched by a sweep gets exactly one ScanRecord stamped with
 * the sweep time, including devices flipped offline because they were absent.
 */
class DeviceLifecycleManager {
public:
    explicit DeviceLifecycleManager(std::shared_ptr<core::IDeviceRepository> repository);

    LifecycleSummary applyObservations(const std::vector<core::ProbeObservation>& batch,
                                       std::chrono::system_clock::time_point sweepTime);

    /**
     * @brief Collapses observations of the same address into one.
     *
     * Live if any is live; identity fields take the first value present;
     * ports are unioned; the first latency and device type win.
     */
    static std::vector<core::ProbeObservation> coalesce(
        const std::vector<core::ProbeObservation>& batch);

    /**
     * @brief Applies one observation to a stored device (or a new one).
     */
    static void mergeInto(core::Device& device, const core::ProbeObservation& observation,
                          std::chrono::system_clock::time_point sweepTime);

private:
    std::shared_ptr<core::IDeviceRepository> repository_;
};

} // namespace lanwatch::engine
