/**
 * @file IVendorTableSource.hpp
 * @brief Source of the hardware-prefix to vendor-name table.
 */

#pragma once

#include <string>
#include <unordered_map>

namespace lanwatch::core {

/**
 * @brief Provides the OUI table consumed by the vendor resolver.
 *
 * Keys are six uppercase hex digits without separators (e.g. "00163E").
 */
class IVendorTableSource {
public:
    virtual ~IVendorTableSource() = default;

    virtual std::unordered_map<std::string, std::string> loadVendorTable() = 0;
};

} // namespace lanwatch::core
