/**
 * @file IDeviceRepository.hpp
 * @brief Storage contract for devices and their scan history.
 */

#pragma once

#include "core/types/Device.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace lanwatch::core {

/**
 * @brief Persistent store for Device and ScanRecord.
 *
 * The lifecycle manager is the only writer of merge-owned device fields and
 * of scan records. The operator alias is written through updateCustomName.
 */
class IDeviceRepository {
public:
    virtual ~IDeviceRepository() = default;

    virtual std::optional<Device> getByAddress(const std::string& ipAddress) = 0;
    virtual std::optional<Device> getById(int64_t id) = 0;
    virtual std::optional<Device> getByMac(const std::string& macAddress) = 0;

    /**
     * @brief Inserts a device (id == 0) or updates an existing one.
     *
     * The custom name is never written by this call.
     *
     * @return The stored device with its id set.
     */
    virtual Device upsert(const Device& device) = 0;

    virtual std::vector<Device> listOnline() = 0;
    virtual std::vector<Device> listAll() = 0;

    /**
     * @brief Appends one presence record.
     * @return ID of the new record.
     */
    virtual int64_t appendHistory(const ScanRecord& record) = 0;

    /**
     * @brief Returns a device's records with scanTime in [from, to], oldest first.
     */
    virtual std::vector<ScanRecord> history(int64_t deviceId,
                                            std::chrono::system_clock::time_point from,
                                            std::chrono::system_clock::time_point to) = 0;

    /**
     * @brief Sets or clears (nullopt) the operator alias of a device.
     * @return False if no device has that id.
     */
    virtual bool updateCustomName(int64_t id, const std::optional<std::string>& name) = 0;

    /**
     * @brief Case-insensitive substring search over address, hardware address,
     *        hostname, custom name and vendor.
     */
    virtual std::vector<Device> search(const std::string& query) = 0;

    /**
     * @brief Runs @p work as one atomic batch of writes.
     *
     * If @p work throws, none of its writes are kept and the exception
     * propagates.
     */
    virtual void inTransaction(const std::function<void()>& work) = 0;
};

} // namespace lanwatch::core
