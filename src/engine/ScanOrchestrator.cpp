#include "engine/ScanOrchestrator.hpp"

#include "core/types/Errors.hpp"

#include <spdlog/spdlog.h>

namespace lanwatch::engine {

ScanOrchestrator::ScanOrchestrator(infra::AsioContext& context,
                                   std::shared_ptr<DiscoveryEngine> engine,
                                   std::shared_ptr<DeviceLifecycleManager> lifecycle,
                                   std::shared_ptr<core::IScanSessionRepository> sessions,
                                   core::ScanConfig config, Timing timing)
    : context_(context),
      engine_(std::move(engine)),
      lifecycle_(std::move(lifecycle)),
      sessions_(std::move(sessions)),
      config_(std::move(config)),
      timing_(timing) {
    spdlog::debug("ScanOrchestrator initialized (interval {}s)",
                  std::chrono::duration_cast<std::chrono::seconds>(timing_.interval).count());
}

ScanOrchestrator::~ScanOrchestrator() {
    stopPeriodic();
}

bool ScanOrchestrator::claimScanning() {
    bool expected = false;
    return scanning_.compare_exchange_strong(expected, true);
}

void ScanOrchestrator::releaseScanning() {
    {
        std::lock_guard lock(mutex_);
        scanning_.store(false);
    }
    idle_.notify_all();
}

core::SweepOutcome ScanOrchestrator::rejected(const std::optional<std::string>& subnet,
                                              core::ScanType scanType) const {
    core::SweepOutcome outcome;
    outcome.status = core::SweepStatus::Rejected;
    outcome.subnet = subnet.value_or("");
    outcome.scanType = scanType;
    outcome.message = "A sweep is already in progress";
    return outcome;
}

core::SweepOutcome ScanOrchestrator::triggerScan(const std::optional<std::string>& subnet,
                                                 core::ScanType scanType) {
    if (!claimScanning()) {
        spdlog::info("Sweep request rejected, another sweep is running");
        return rejected(subnet, scanType);
    }
    return runClaimedSweep(subnet, scanType);
}

core::SweepOutcome ScanOrchestrator::triggerScanAsync(const std::optional<std::string>& subnet,
                                                      core::ScanType scanType) {
    if (!claimScanning()) {
        spdlog::info("Background sweep request rejected, another sweep is running");
        return rejected(subnet, scanType);
    }

    core::SweepOutcome outcome;
    outcome.subnet = subnet.value_or("");
    outcome.scanType = scanType;

    auto weak = weak_from_this();
    if (!context_.isRunning() || weak.expired()) {
        releaseScanning();
        outcome.status = core::SweepStatus::Error;
        outcome.message = "Worker pool is not running";
        return outcome;
    }

    context_.post([weak, subnet, scanType]() {
        auto self = weak.lock();
        if (!self) {
            return;
        }
        try {
            auto result = self->runClaimedSweep(subnet, scanType);
            spdlog::debug("Background sweep finished: {}",
                          core::SweepOutcome::statusToString(result.status));
        } catch (const std::exception& e) {
            spdlog::error("Background sweep failed: {}", e.what());
        }
    });

    outcome.status = core::SweepStatus::Started;
    outcome.message = "Sweep started";
    return outcome;
}

core::SweepOutcome ScanOrchestrator::runClaimedSweep(const std::optional<std::string>& subnet,
                                                     core::ScanType scanType) {
    ScanningRelease release(*this);

    auto config = this->config();
    auto sweepTime = std::chrono::system_clock::now();
    auto startedAt = std::chrono::steady_clock::now();

    core::ScanSession session;
    session.startTime = sweepTime;
    session.subnet = subnet.value_or("");
    session.scanType = scanType;
    session.status = core::SessionStatus::Running;
    session.id = sessions_->open(session);

    core::SweepOutcome outcome;
    outcome.scanType = scanType;
    outcome.sessionId = session.id;
    outcome.subnet = session.subnet;

    try {
        auto cidr = engine_->resolveSubnet(subnet, config);
        session.subnet = cidr;
        outcome.subnet = cidr;

        auto observations = engine_->sweep(cidr, scanType, config);
        auto summary = lifecycle_->applyObservations(observations, sweepTime);

        session.devicesFound = summary.live;
        session.status = core::SessionStatus::Success;
        outcome.status = core::SweepStatus::Success;
        outcome.devicesFound = summary.live;
        outcome.message = "Found " + std::to_string(summary.live) + " devices (" +
                          std::to_string(summary.created) + " new, " +
                          std::to_string(summary.markedOffline) + " went offline)";
    } catch (const std::exception& e) {
        spdlog::error("Sweep of {} failed: {}",
                      session.subnet.empty() ? std::string("<unresolved>") : session.subnet,
                      e.what());
        session.devicesFound = 0;
        session.status = core::SessionStatus::Error;
        session.errorMessage = e.what();
        outcome.status = core::SweepStatus::Error;
        outcome.message = e.what();
    }

    session.endTime = std::chrono::system_clock::now();
    sessions_->seal(session);

    outcome.durationSeconds =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - startedAt).count();

    {
        std::lock_guard lock(mutex_);
        lastScanTime_ = *session.endTime;
    }

    spdlog::info("Sweep {} of {} finished with {} in {:.1f}s", session.id, outcome.subnet,
                 core::SweepOutcome::statusToString(outcome.status), *outcome.durationSeconds);
    return outcome;
}

bool ScanOrchestrator::startPeriodic() {
    std::lock_guard lock(mutex_);
    if (loop_) {
        spdlog::warn("Periodic sweeps are already running");
        return false;
    }

    loop_ = std::make_shared<PeriodicLoop>(context_.ioContext());
    scheduleIteration(loop_, std::chrono::milliseconds(0));
    spdlog::info("Periodic sweeps started (every {}s)",
                 std::chrono::duration_cast<std::chrono::seconds>(timing_.interval).count());
    return true;
}

void ScanOrchestrator::stopPeriodic() {
    std::lock_guard lock(mutex_);
    if (!loop_) {
        return;
    }
    loop_->active = false;
    loop_->timer.cancel();
    loop_.reset();
    spdlog::info("Periodic sweeps stopped");
}

void ScanOrchestrator::scheduleIteration(const std::shared_ptr<PeriodicLoop>& loop,
                                         std::chrono::milliseconds delay) {
    std::weak_ptr<ScanOrchestrator> weak = weak_from_this();
    loop->timer.expires_after(delay);
    loop->timer.async_wait([weak, loop](const asio::error_code& ec) {
        if (ec || !loop->active) {
            return;
        }
        if (auto self = weak.lock()) {
            self->runIteration(loop);
        }
    });
}

void ScanOrchestrator::runIteration(const std::shared_ptr<PeriodicLoop>& loop) {
    bool failed = false;
    try {
        auto outcome = triggerScan(std::nullopt, defaultScanType());
        if (outcome.status == core::SweepStatus::Rejected) {
            spdlog::info("Periodic sweep skipped, a sweep is already running");
        }
    } catch (const std::exception& e) {
        spdlog::error("Periodic sweep failed, retrying after cooldown: {}", e.what());
        failed = true;
    }

    std::lock_guard lock(mutex_);
    if (!loop->active || loop_ != loop) {
        return;
    }
    scheduleIteration(loop, failed ? timing_.errorCooldown : timing_.interval);
}

void ScanOrchestrator::setInterval(int seconds) {
    std::chrono::milliseconds interval = std::chrono::seconds(seconds);
    std::lock_guard lock(mutex_);
    if (interval < timing_.minimumInterval) {
        throw core::ConfigurationError(
            "scan interval must be at least " +
            std::to_string(
                std::chrono::duration_cast<std::chrono::seconds>(timing_.minimumInterval).count()) +
            " seconds");
    }
    timing_.interval = interval;
    spdlog::info("Scan interval set to {}s", seconds);
}

void ScanOrchestrator::setConfig(const core::ScanConfig& config) {
    config.validate();
    std::lock_guard lock(mutex_);
    config_ = config;
}

core::ScanConfig ScanOrchestrator::config() const {
    std::lock_guard lock(mutex_);
    return config_;
}

void ScanOrchestrator::setDefaultScanType(core::ScanType scanType) {
    std::lock_guard lock(mutex_);
    defaultScanType_ = scanType;
}

core::ScanType ScanOrchestrator::defaultScanType() const {
    std::lock_guard lock(mutex_);
    return defaultScanType_;
}

core::ScanStatus ScanOrchestrator::status() const {
    std::lock_guard lock(mutex_);
    core::ScanStatus status;
    status.scanning = scanning_.load();
    status.intervalSeconds = static_cast<int>(
        std::chrono::duration_cast<std::chrono::seconds>(timing_.interval).count());
    status.periodicRunning = loop_ != nullptr;
    status.lastScanTime = lastScanTime_;
    return status;
}

bool ScanOrchestrator::waitUntilIdle(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return idle_.wait_for(lock, timeout, [this] { return !scanning_.load(); });
}

} // namespace lanwatch::engine
