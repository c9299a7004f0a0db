#pragma once

#include "core/services/IScanSessionRepository.hpp"
#include "core/types/ScanConfig.hpp"
#include "core/types/ScanSession.hpp"
#include "engine/DeviceLifecycleManager.hpp"
#include "engine/DiscoveryEngine.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace lanwatch::engine {

/**
 * @brief Runs sweeps one at a time, on demand and on a periodic timer.
 *
 * A single scanning flag, claimed by compare-and-set, is shared by manual
 * triggers and the periodic loop. A request that finds it claimed is
 * rejected, never queued. Every accepted sweep writes one session.
 *
 * Must be owned by a std::shared_ptr: timer and background handlers hold
 * weak references to it.
 */
class ScanOrchestrator : public std::enable_shared_from_this<ScanOrchestrator> {
public:
    struct Timing {
        std::chrono::milliseconds interval{std::chrono::seconds(300)};        ///< Periodic interval
        std::chrono::milliseconds minimumInterval{std::chrono::seconds(60)}; ///< Floor for setInterval
        std::chrono::milliseconds errorCooldown{std::chrono::seconds(60)};   ///< Delay after a failed iteration
    };

    ScanOrchestrator(infra::AsioContext& context, std::shared_ptr<DiscoveryEngine> engine,
                     std::shared_ptr<DeviceLifecycleManager> lifecycle,
                     std::shared_ptr<core::IScanSessionRepository> sessions,
                     core::ScanConfig config, Timing timing);

    ScanOrchestrator(infra::AsioContext& context, std::shared_ptr<DiscoveryEngine> engine,
                     std::shared_ptr<DeviceLifecycleManager> lifecycle,
                     std::shared_ptr<core::IScanSessionRepository> sessions,
                     core::ScanConfig config)
        : ScanOrchestrator(context, std::move(engine), std::move(lifecycle), std::move(sessions),
                           std::move(config), Timing{}) {}

    ~ScanOrchestrator();

    ScanOrchestrator(const ScanOrchestrator&) = delete;
    ScanOrchestrator& operator=(const ScanOrchestrator&) = delete;

    /**
     * @brief Runs a sweep on the calling thread.
     * @param subnet Explicit target, or nullopt to resolve from configuration.
     * @param scanType Sweep kind.
     * @return Rejected if a sweep is already running, otherwise Success or Error.
     * @throws std::runtime_error if the session cannot be opened.
     */
    core::SweepOutcome triggerScan(const std::optional<std::string>& subnet,
                                   core::ScanType scanType);

    /**
     * @brief Claims the scanning flag and runs the sweep on the worker pool.
     * @return Started, or Rejected if a sweep is already running.
     */
    core::SweepOutcome triggerScanAsync(const std::optional<std::string>& subnet,
                                        core::ScanType scanType);

    /**
     * @brief Starts the periodic loop; the first sweep runs immediately.
     * @return False if the loop is already running.
     */
    bool startPeriodic();

    /**
     * @brief Cancels the pending wait. A sweep in flight completes.
     */
    void stopPeriodic();

    /**
     * @brief Changes the periodic interval, taking effect after the next sweep.
     * @throws core::ConfigurationError below the minimum interval.
     */
    void setInterval(int seconds);

    void setConfig(const core::ScanConfig& config);
    [[nodiscard]] core::ScanConfig config() const;

    void setDefaultScanType(core::ScanType scanType);
    [[nodiscard]] core::ScanType defaultScanType() const;

    [[nodiscard]] core::ScanStatus status() const;
    [[nodiscard]] bool isScanning() const { return scanning_.load(); }

    /**
     * @brief Blocks until no sweep is running or the timeout expires.
     * @return True if idle.
     */
    bool waitUntilIdle(std::chrono::milliseconds timeout);

private:
    struct PeriodicLoop {
        explicit PeriodicLoop(asio::io_context& io) : timer(io) {}
        asio::steady_timer timer;
        std::atomic<bool> active{true};
    };

    /// Releases the scanning flag when a claimed sweep ends.
    class ScanningRelease {
    public:
        explicit ScanningRelease(ScanOrchestrator& owner) : owner_(owner) {}
        ~ScanningRelease() { owner_.releaseScanning(); }

        ScanningRelease(const ScanningRelease&) = delete;
        ScanningRelease& operator=(const ScanningRelease&) = delete;

    private:
        ScanOrchestrator& owner_;
    };

    bool claimScanning();
    void releaseScanning();
    core::SweepOutcome runClaimedSweep(const std::optional<std::string>& subnet,
                                       core::ScanType scanType);
    core::SweepOutcome rejected(const std::optional<std::string>& subnet,
                                core::ScanType scanType) const;

    void scheduleIteration(const std::shared_ptr<PeriodicLoop>& loop,
                           std::chrono::milliseconds delay);
    void runIteration(const std::shared_ptr<PeriodicLoop>& loop);

    infra::AsioContext& context_;
    std::shared_ptr<DiscoveryEngine> engine_;
    std::shared_ptr<DeviceLifecycleManager> lifecycle_;
    std::shared_ptr<core::IScanSessionRepository> sessions_;

    mutable std::mutex mutex_;
    std::condition_variable idle_;
    core::ScanConfig config_;
    core::ScanType defaultScanType_{core::ScanType::Ping};
    Timing timing_;
    std::optional<std::chrono::system_clock::time_point> lastScanTime_;
    std::shared_ptr<PeriodicLoop> loop_;

    std::atomic<bool> scanning_{false};
};

} // namespace lanwatch::engine
