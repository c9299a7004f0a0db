#pragma once

#include "core/services/IVendorTableSource.hpp"
#include "infrastructure/database/Database.hpp"

#include <memory>
#include <string>

namespace lanwatch::infra {

/**
 * @brief Vendor prefix table stored in the oui_vendors table.
 */
class OuiRepository : public core::IVendorTableSource {
public:
    explicit OuiRepository(std::shared_ptr<Database> db);

    std::unordered_map<std::string, std::string> loadVendorTable() override;

    /**
     * @brief Inserts or replaces one prefix.
     * @param prefix Six hex digits, separators allowed ("00:16:3E" or "00163e").
     * @param vendor Vendor name.
     * @return False if the prefix is not six hex digits.
     */
    bool upsert(const std::string& prefix, const std::string& vendor);

    int count();

private:
    std::shared_ptr<Database> db_;
};

} // namespace lanwatch::infra
