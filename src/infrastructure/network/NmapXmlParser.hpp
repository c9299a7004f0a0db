#pragma once

#include "core/types/ProbeObservation.hpp"

#include <string>
#include <vector>

namespace lanwatch::infra {

/**
 * @brief Translates an nmap XML report ("-oX -") into observations.
 *
 * Only hosts reported with status state="up" are returned. A report that
 * cannot be parsed yields an empty list and a logged error.
 */
class NmapXmlParser {
public:
    static std::vector<core::ProbeObservation> parse(const std::string& xml);
};

} // namespace lanwatch::infra
