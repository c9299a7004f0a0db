#include "engine/DeviceTypeClassifier.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <initializer_list>

namespace lanwatch::engine {

namespace {

bool hasAnyPort(const core::ProbeObservation& o, std::initializer_list<uint16_t> ports) {
    return std::any_of(o.openPorts.begin(), o.openPorts.end(), [&ports](uint16_t port) {
        return std::find(ports.begin(), ports.end(), port) != ports.end();
    });
}

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool hasService(const core::ProbeObservation& o, std::initializer_list<const char*> names) {
    return std::any_of(o.services.begin(), o.services.end(), [&names](const core::ServiceInfo& s) {
        auto service = lower(s.name);
        return std::any_of(names.begin(), names.end(),
                           [&service](const char* name) { return service == name; });
    });
}

bool osHintContains(const core::ProbeObservation& o, std::initializer_list<const char*> needles) {
    if (!o.osHint) {
        return false;
    }
    auto hint = lower(*o.osHint);
    return std::any_of(needles.begin(), needles.end(), [&hint](const char* needle) {
        return hint.find(needle) != std::string::npos;
    });
}

std::function<std::string(const core::ProbeObservation&)> fixed(std::string label) {
    return [label = std::move(label)](const core::ProbeObservation&) { return label; };
}

} // namespace

DeviceTypeClassifier::DeviceTypeClassifier() : rules_(defaultRules()) {}

std::vector<DeviceTypeClassifier::Rule> DeviceTypeClassifier::defaultRules() {
    std::vector<Rule> rules;

    rules.push_back({"gateway",
                     [](const core::ProbeObservation& o) {
                         return hasAnyPort(o, {80, 443, 8080}) && hasService(o, {"http", "https"}) &&
                                hasAnyPort(o, {22, 23, 53});
                     },
                     fixed("Router/Gateway")});

    rules.push_back({"printer",
                     [](const core::ProbeObservation& o) { return hasAnyPort(o, {515, 631, 9100}); },
                     fixed("Network Printer")});

    rules.push_back({"file-server",
                     [](const core::ProbeObservation& o) {
                         return hasAnyPort(o, {139, 445, 548, 2049});
                     },
                     fixed("NAS/File Server")});

    rules.push_back({"camera",
                     [](const core::ProbeObservation& o) {
                         return hasAnyPort(o, {554, 8080, 80}) && hasService(o, {"rtsp"});
                     },
                     fixed("IP Camera")});

    rules.push_back({"computer",
                     [](const core::ProbeObservation& o) { return hasAnyPort(o, {22, 3389}); },
                     [](const core::ProbeObservation& o) -> std::string {
                         if (osHintContains(o, {"windows"})) {
                             return "Windows Computer";
                         }
                         if (osHintContains(o, {"linux", "unix", "ubuntu", "centos"})) {
                             return "Linux Computer";
                         }
                         if (osHintContains(o, {"mac"})) {
                             return "Mac Computer";
                         }
                         return "Computer";
                     }});

    rules.push_back({"mobile",
                     [](const core::ProbeObservation& o) {
                         return !o.openPorts.empty() && o.openPorts.size() <= 2 &&
                                std::any_of(o.openPorts.begin(), o.openPorts.end(),
                                            [](uint16_t port) { return port > 1024; });
                     },
                     fixed("Mobile Device")});

    rules.push_back({"unknown", [](const core::ProbeObservation&) { return true; },
                     fixed("Unknown Device")});

    return rules;
}

std::optional<std::string> DeviceTypeClassifier::classify(
    const core::ProbeObservation& observation) const {
    if (observation.openPorts.empty() && observation.services.empty()) {
        return std::nullopt;
    }

    for (const auto& rule : rules_) {
        if (rule.matches(observation)) {
            auto label = rule.label(observation);
            spdlog::debug("Classified {} as {} (rule {})", observation.address, label, rule.name);
            return label;
        }
    }
    return std::nullopt;
}

} // namespace lanwatch::engine
