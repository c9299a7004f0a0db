#pragma once

#include "core/services/IVendorTableSource.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace lanwatch::engine {

/**
 * @brief Maps hardware addresses to manufacturer names by OUI prefix.
 *
 * The table is loaded from the source on first use and cached until reload().
 * All methods are thread-safe.
 */
class VendorResolver {
public:
    explicit VendorResolver(std::shared_ptr<core::IVendorTableSource> source);

    /**
     * @brief Looks up the vendor of a hardware address.
     * @param macAddress Address in any common notation (":", "-", "." or none).
     * @return Vendor name, or nullopt for short input or an unknown prefix.
     */
    std::optional<std::string> resolve(const std::string& macAddress);

    /**
     * @brief Discards the cached table and reads it again from the source.
     */
    void reload();

    [[nodiscard]] size_t size();

private:
    void ensureLoaded();

    std::shared_ptr<core::IVendorTableSource> source_;
    std::mutex mutex_;
    bool loaded_{false};
    std::unordered_map<std::string, std::string> table_;
};

} // namespace lanwatch::engine
