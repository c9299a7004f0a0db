#pragma once

#include "core/services/IHostnameResolver.hpp"

namespace lanwatch::infra {

/**
 * @brief Reverse lookup through the system resolver (getnameinfo).
 */
class ReverseDnsResolver : public core::IHostnameResolver {
public:
    std::optional<std::string> resolve(const std::string& ipAddress) override;
};

} // namespace lanwatch::infra
