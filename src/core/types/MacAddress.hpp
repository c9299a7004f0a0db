/**
 * @file MacAddress.hpp
 * @brief Hardware address normalisation helpers.
 */

#pragma once

#include <optional>
#include <string>

namespace lanwatch::core {

class MacAddress {
public:
    /**
     * @brief Extracts the vendor prefix (OUI) of a hardware address.
     *
     * Separators (':', '-', '.') are stripped and letters uppercased.
     *
     * @return Six uppercase hex digits, or nullopt if fewer than six hex
     *         digits are present.
     */
    static std::optional<std::string> ouiPrefix(const std::string& address);

    /**
     * @brief Formats a 12-hex-digit address as "AA:BB:CC:DD:EE:FF".
     * @return The canonical form, or nullopt if the input is not a full address.
     */
    static std::optional<std::string> normalize(const std::string& address);

    /**
     * @brief Checks for the all-zero address the kernel reports for incomplete entries.
     */
    static bool isNull(const std::string& address);
};

} // namespace lanwatch::core
