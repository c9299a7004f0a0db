#include "engine/VendorResolver.hpp"

#include "core/types/MacAddress.hpp"

#include <spdlog/spdlog.h>

namespace lanwatch::engine {

VendorResolver::VendorResolver(std::shared_ptr<core::IVendorTableSource> source)
    : source_(std::move(source)) {}

std::optional<std::string> VendorResolver::resolve(const std::string& macAddress) {
    auto prefix = core::MacAddress::ouiPrefix(macAddress);
    if (!prefix) {
        return std::nullopt;
    }

    std::lock_guard lock(mutex_);
    ensureLoaded();
    auto it = table_.find(*prefix);
    if (it == table_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void VendorResolver::reload() {
    std::lock_guard lock(mutex_);
    loaded_ = false;
    table_.clear();
    ensureLoaded();
}

size_t VendorResolver::size() {
    std::lock_guard lock(mutex_);
    ensureLoaded();
    return table_.size();
}

void VendorResolver::ensureLoaded() {
    if (loaded_) {
        return;
    }
    table_ = source_->loadVendorTable();
    loaded_ = true;
    spdlog::debug("Loaded {} OUI vendor prefixes", table_.size());
}

} // namespace lanwatch::engine
