#include "engine/ProbeStrategyChain.hpp"

#include "core/types/Errors.hpp"

#include <spdlog/spdlog.h>

#include <optional>

namespace lanwatch::engine {

ProbeStrategyChain::ProbeStrategyChain(
    std::vector<std::shared_ptr<core::IProbeBackend>> strategies)
    : strategies_(std::move(strategies)) {}

std::string ProbeStrategyChain::name() const {
    std::string joined;
    for (const auto& strategy : strategies_) {
        if (!joined.empty()) {
            joined += ",";
        }
        joined += strategy->name();
    }
    return "chain[" + joined + "]";
}

std::vector<core::ProbeObservation> ProbeStrategyChain::discoverSubnet(
    const std::string& cidr, core::ScanType scanType, const core::ScanConfig& config) {
    return tryInOrder("discovery", config, [&](core::IProbeBackend& backend) {
        return backend.discoverSubnet(cidr, scanType, config);
    });
}

std::vector<core::ProbeObservation> ProbeStrategyChain::probeHosts(
    const std::vector<std::string>& addresses, const core::ScanConfig& config) {
    try {
        return tryInOrder("detail probe", config, [&](core::IProbeBackend& backend) {
            return backend.probeHosts(addresses, config);
        });
    } catch (const core::ProbeBackendError& e) {
        spdlog::warn("Detail probe of {} host(s) abandoned: {}", addresses.size(), e.what());
        return {};
    }
}

template <typename Call>
std::vector<core::ProbeObservation> ProbeStrategyChain::tryInOrder(const char* operation,
                                                                   const core::ScanConfig& config,
                                                                   Call call) {
    std::optional<core::ProbeBackendError> lastError;

    for (size_t i = 0; i < strategies_.size(); ++i) {
        auto& strategy = *strategies_[i];
        try {
            auto observations = call(strategy);
            spdlog::debug("{} via {} returned {} observations", operation, strategy.name(),
                          observations.size());
            return observations;
        } catch (const core::ProbeBackendError& e) {
            lastError = e;
            if (!config.fallbackEnabled) {
                spdlog::error("{} failed and fallback is disabled: {}", operation, e.what());
                break;
            }
            if (i + 1 < strategies_.size()) {
                spdlog::warn("{} failed ({}), falling back to {}", operation, e.what(),
                             strategies_[i + 1]->name());
            } else {
                spdlog::error("{} failed with every strategy, last error: {}", operation,
                              e.what());
            }
        }
    }

    if (lastError) {
        throw *lastError;
    }
    throw core::ProbeBackendError(name(), "no probe strategies configured");
}

} // namespace lanwatch::engine
