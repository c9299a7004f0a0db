/**
 * @file IHostnameResolver.hpp
 * @brief Interface for reverse name lookup.
 */

#pragma once

#include <optional>
#include <string>

namespace lanwatch::core {

class IHostnameResolver {
public:
    virtual ~IHostnameResolver() = default;

    /**
     * @brief Resolves an IPv4 address to a hostname.
     * @return The name, or nullopt when no name is registered or the lookup fails.
     */
    virtual std::optional<std::string> resolve(const std::string& ipAddress) = 0;
};

} // namespace lanwatch::core
