#pragma once

#include "core/types/ProbeObservation.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace lanwatch::engine {

/**
 * @brief Infers a device category from open ports, services and OS hint.
 *
 * Rules are evaluated in order and the first match wins. The last rule
 * always matches and labels the host "Unknown Device".
 */
class DeviceTypeClassifier {
public:
    struct Rule {
        std::string name; ///< Rule identifier used in debug logs
        std::function<bool(const core::ProbeObservation&)> matches;
        std::function<std::string(const core::ProbeObservation&)> label;
    };

    DeviceTypeClassifier();

    /**
     * @brief Classifies one observation.
     * @return The label, or nullopt when the host has neither open ports nor services.
     */
    [[nodiscard]] std::optional<std::string> classify(const core::ProbeObservation& observation) const;

    [[nodiscard]] const std::vector<Rule>& rules() const { return rules_; }

    static std::vector<Rule> defaultRules();

private:
    std::vector<Rule> rules_;
};

} // namespace lanwatch::engine
