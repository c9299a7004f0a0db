#include "engine/TimelineReconstructor.hpp"

#include <algorithm>
#include <optional>

namespace lanwatch::engine {

TimelineReconstructor::TimelineReconstructor(std::shared_ptr<core::IDeviceRepository> repository)
    : repository_(std::move(repository)) {}

std::vector<core::OnlineInterval> TimelineReconstructor::forDevice(
    int64_t deviceId, std::chrono::system_clock::time_point from,
    std::chrono::system_clock::time_point to) {
    return reconstruct(repository_->history(deviceId, from, to));
}

std::vector<core::OnlineInterval> TimelineReconstructor::reconstruct(
    std::vector<core::ScanRecord> records) {
    std::stable_sort(records.begin(), records.end(),
                     [](const core::ScanRecord& a, const core::ScanRecord& b) {
                         return a.scanTime < b.scanTime;
                     });

    std::vector<core::OnlineInterval> intervals;
    std::optional<bool> previousLiveness;
    std::chrono::system_clock::time_point intervalStart{};

    for (const auto& record : records) {
        bool wasLive = previousLiveness.value_or(false);
        if (record.isOnline && !wasLive) {
            intervalStart = record.scanTime;
        } else if (!record.isOnline && wasLive) {
            intervals.push_back({intervalStart, record.scanTime});
        }
        previousLiveness = record.isOnline;
    }

    if (previousLiveness.value_or(false)) {
        intervals.push_back({intervalStart, std::nullopt});
    }
    return intervals;
}

} // namespace lanwatch::engine
