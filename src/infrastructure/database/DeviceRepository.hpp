#pragma once

#include "core/services/IDeviceRepository.hpp"
#include "infrastructure/database/Database.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace lanwatch::infra {

/**
 * @brief SQLite-backed store for devices and their scan records.
 *
 * Open ports are stored as a JSON array in the devices table. Timestamps are
 * stored as UTC text with one-second resolution.
 */
class DeviceRepository : public core::IDeviceRepository {
public:
    /**
     * @brief Constructs a DeviceRepository with the given database.
     * @param db Shared pointer to the Database instance.
     */
    explicit DeviceRepository(std::shared_ptr<Database> db);

    std::optional<core::Device> getByAddress(const std::string& ipAddress) override;
    std::optional<core::Device> getById(int64_t id) override;
    std::optional<core::Device> getByMac(const std::string& macAddress) override;

    core::Device upsert(const core::Device& device) override;

    std::vector<core::Device> listOnline() override;
    std::vector<core::Device> listAll() override;

    int64_t appendHistory(const core::ScanRecord& record) override;
    std::vector<core::ScanRecord> history(int64_t deviceId,
                                          std::chrono::system_clock::time_point from,
                                          std::chrono::system_clock::time_point to) override;

    bool updateCustomName(int64_t id, const std::optional<std::string>& name) override;
    std::vector<core::Device> search(const std::string& query) override;
    void inTransaction(const std::function<void()>& work) override;

    /**
     * @brief Returns the newest records of a device, newest first.
     * @param deviceId Device to query.
     * @param since Oldest scan time to include.
     */
    std::vector<core::ScanRecord> recentHistory(int64_t deviceId,
                                                std::chrono::system_clock::time_point since);

    /**
     * @brief Deletes scan records older than the given age. Devices are kept.
     * @return Number of deleted records.
     */
    int cleanupOldRecords(std::chrono::hours maxAge);

    int count();
    int countOnline();

private:
    core::Device rowToDevice(Statement& stmt);
    core::ScanRecord rowToRecord(Statement& stmt);
    std::vector<core::Device> collectDevices(Statement& stmt);

    std::shared_ptr<Database> db_;
};

} // namespace lanwatch::infra
