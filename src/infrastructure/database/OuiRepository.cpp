#include "infrastructure/database/OuiRepository.hpp"

#include "core/types/MacAddress.hpp"

#include <spdlog/spdlog.h>

namespace lanwatch::infra {

OuiRepository::OuiRepository(std::shared_ptr<Database> db) : db_(std::move(db)) {}

std::unordered_map<std::string, std::string> OuiRepository::loadVendorTable() {
    std::unordered_map<std::string, std::string> table;
    auto stmt = db_->prepare("SELECT prefix, vendor FROM oui_vendors");

    while (stmt.step()) {
        table.emplace(stmt.columnText(0), stmt.columnText(1));
    }

    spdlog::debug("Loaded {} vendor prefixes", table.size());
    return table;
}

bool OuiRepository::upsert(const std::string& prefix, const std::string& vendor) {
    auto oui = core::MacAddress::ouiPrefix(prefix);
    if (!oui || vendor.empty()) {
        spdlog::warn("Rejected vendor prefix '{}'", prefix);
        return false;
    }

    auto stmt = db_->prepare("INSERT OR REPLACE INTO oui_vendors (prefix, vendor) VALUES (?, ?)");
    stmt.bind(1, *oui);
    stmt.bind(2, vendor);
    stmt.step();
    return true;
}

int OuiRepository::count() {
    auto stmt = db_->prepare("SELECT COUNT(*) FROM oui_vendors");
    stmt.step();
    return stmt.columnInt(0);
}

} // namespace lanwatch::infra
