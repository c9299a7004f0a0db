#pragma once

#include "core/services/IProbeBackend.hpp"

#include <memory>
#include <vector>

namespace lanwatch::engine {

/**
 * @brief Tries probe backends in a fixed order of precedence.
 *
 * A ProbeBackendError from one strategy moves on to the next only when the
 * sweep configuration enables fallback. Discovery rethrows the last error when
 * no strategy completes, so the sweep fails instead of reporting an empty
 * network. A detail probe that no strategy completes yields no observations.
 */
class ProbeStrategyChain : public core::IProbeBackend {
public:
    explicit ProbeStrategyChain(std::vector<std::shared_ptr<core::IProbeBackend>> strategies);

    std::string name() const override;

    std::vector<core::ProbeObservation> discoverSubnet(const std::string& cidr,
                                                       core::ScanType scanType,
                                                       const core::ScanConfig& config) override;

    std::vector<core::ProbeObservation> probeHosts(const std::vector<std::string>& addresses,
                                                   const core::ScanConfig& config) override;

    [[nodiscard]] size_t size() const { return strategies_.size(); }

private:
    template <typename Call>
    std::vector<core::ProbeObservation> tryInOrder(const char* operation,
                                                   const core::ScanConfig& config, Call call);

    std::vector<std::shared_ptr<core::IProbeBackend>> strategies_;
};

} // namespace lanwatch::engine
