#include "infrastructure/database/DeviceRepository.hpp"

#include "infrastructure/database/SqlTime.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace lanwatch::infra {

namespace {

constexpr const char* DEVICE_COLUMNS =
    "id, ip_address, mac_address, hostname, vendor, custom_name, device_type, "
    "first_seen, last_seen, is_online, open_ports";

std::string portsToJson(const std::vector<uint16_t>& ports) {
    return nlohmann::json(ports).dump();
}

std::vector<uint16_t> portsFromJson(const std::string& text) {
    auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_array()) {
        spdlog::warn("Ignoring malformed open_ports value: {}", text);
        return {};
    }
    return j.get<std::vector<uint16_t>>();
}

std::string likePattern(const std::string& query) {
    std::string pattern = "%";
    for (char c : query) {
        if (c == '%' || c == '_' || c == '\\') {
            pattern += '\\';
        }
        pattern += c;
    }
    pattern += '%';
    return pattern;
}

} // namespace

DeviceRepository::DeviceRepository(std::shared_ptr<Database> db) : db_(std::move(db)) {}

void DeviceRepository::inTransaction(const std::function<void()>& work) {
    db_->transaction(work);
}

std::optional<core::Device> DeviceRepository::getByAddress(const std::string& ipAddress) {
    auto stmt = db_->prepare(std::string("SELECT ") + DEVICE_COLUMNS +
                             " FROM devices WHERE ip_address = ?");
    stmt.bind(1, ipAddress);

    if (stmt.step()) {
        return rowToDevice(stmt);
    }
    return std::nullopt;
}

std::optional<core::Device> DeviceRepository::getById(int64_t id) {
    auto stmt =
        db_->prepare(std::string("SELECT ") + DEVICE_COLUMNS + " FROM devices WHERE id = ?");
    stmt.bind(1, id);

    if (stmt.step()) {
        return rowToDevice(stmt);
    }
    return std::nullopt;
}

std::optional<core::Device> DeviceRepository::getByMac(const std::string& macAddress) {
    auto stmt = db_->prepare(std::string("SELECT ") + DEVICE_COLUMNS +
                             " FROM devices WHERE UPPER(mac_address) = UPPER(?) "
                             "ORDER BY last_seen DESC LIMIT 1");
    stmt.bind(1, macAddress);

    if (stmt.step()) {
        return rowToDevice(stmt);
    }
    return std::nullopt;
}

core::Device DeviceRepository::upsert(const core::Device& device) {
    core::Device stored = device;

    if (device.id == 0) {
        auto stmt = db_->prepare(R"(
            INSERT INTO devices (ip_address, mac_address, hostname, vendor, device_type,
                                 first_seen, last_seen, is_online, open_ports)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
        )");

        stmt.bind(1, device.ipAddress);
        stmt.bind(2, device.macAddress);
        stmt.bind(3, device.hostname);
        stmt.bind(4, device.vendor);
        stmt.bind(5, device.deviceType);
        stmt.bind(6, timePointToString(device.firstSeen));
        stmt.bind(7, timePointToString(device.lastSeen));
        stmt.bind(8, device.isOnline ? 1 : 0);
        stmt.bind(9, portsToJson(device.openPorts));
        stmt.step();

        stored.id = db_->lastInsertRowId();
        spdlog::debug("Inserted device {} with id: {}", device.ipAddress, stored.id);
        return stored;
    }

    auto stmt = db_->prepare(R"(
        UPDATE devices SET
            ip_address = ?, mac_address = ?, hostname = ?, vendor = ?, device_type = ?,
            first_seen = ?, last_seen = ?, is_online = ?, open_ports = ?
        WHERE id = ?
    )");

    stmt.bind(1, device.ipAddress);
    stmt.bind(2, device.macAddress);
    stmt.bind(3, device.hostname);
    stmt.bind(4, device.vendor);
    stmt.bind(5, device.deviceType);
    stmt.bind(6, timePointToString(device.firstSeen));
    stmt.bind(7, timePointToString(device.lastSeen));
    stmt.bind(8, device.isOnline ? 1 : 0);
    stmt.bind(9, portsToJson(device.openPorts));
    stmt.bind(10, device.id);
    stmt.step();

    spdlog::debug("Updated device: {}", device.id);
    return stored;
}

std::vector<core::Device> DeviceRepository::listOnline() {
    auto stmt = db_->prepare(std::string("SELECT ") + DEVICE_COLUMNS +
                             " FROM devices WHERE is_online = 1 ORDER BY ip_address");
    return collectDevices(stmt);
}

std::vector<core::Device> DeviceRepository::listAll() {
    auto stmt = db_->prepare(std::string("SELECT ") + DEVICE_COLUMNS +
                             " FROM devices ORDER BY last_seen DESC, ip_address");
    return collectDevices(stmt);
}

int64_t DeviceRepository::appendHistory(const core::ScanRecord& record) {
    auto stmt = db_->prepare(R"(
        INSERT INTO scan_records (device_id, scan_time, is_online, latency_ms)
        VALUES (?, ?, ?, ?)
    )");

    stmt.bind(1, record.deviceId);
    stmt.bind(2, timePointToString(record.scanTime));
    stmt.bind(3, record.isOnline ? 1 : 0);
    if (record.latencyMs) {
        stmt.bind(4, *record.latencyMs);
    } else {
        stmt.bindNull(4);
    }

    stmt.step();
    return db_->lastInsertRowId();
}

std::vector<core::ScanRecord> DeviceRepository::history(
    int64_t deviceId, std::chrono::system_clock::time_point from,
    std::chrono::system_clock::time_point to) {
    std::vector<core::ScanRecord> records;
    auto stmt = db_->prepare(R"(
        SELECT id, device_id, scan_time, is_online, latency_ms FROM scan_records
        WHERE device_id = ? AND scan_time >= ? AND scan_time <= ?
        ORDER BY scan_time ASC, id ASC
    )");
    stmt.bind(1, deviceId);
    stmt.bind(2, timePointToString(from));
    stmt.bind(3, timePointToString(to));

    while (stmt.step()) {
        records.push_back(rowToRecord(stmt));
    }
    return records;
}

std::vector<core::ScanRecord> DeviceRepository::recentHistory(
    int64_t deviceId, std::chrono::system_clock::time_point since) {
    std::vector<core::ScanRecord> records;
    auto stmt = db_->prepare(R"(
        SELECT id, device_id, scan_time, is_online, latency_ms FROM scan_records
        WHERE device_id = ? AND scan_time >= ?
        ORDER BY scan_time DESC, id DESC
    )");
    stmt.bind(1, deviceId);
    stmt.bind(2, timePointToString(since));

    while (stmt.step()) {
        records.push_back(rowToRecord(stmt));
    }
    return records;
}

bool DeviceRepository::updateCustomName(int64_t id, const std::optional<std::string>& name) {
    auto stmt = db_->prepare("UPDATE devices SET custom_name = ? WHERE id = ?");
    stmt.bind(1, name);
    stmt.bind(2, id);
    stmt.step();

    bool updated = db_->changes() > 0;
    if (updated) {
        spdlog::info("Device {} alias set to '{}'", id, name.value_or(""));
    }
    return updated;
}

std::vector<core::Device> DeviceRepository::search(const std::string& query) {
    auto stmt = db_->prepare(std::string("SELECT ") + DEVICE_COLUMNS + R"( FROM devices
        WHERE ip_address LIKE ?1 ESCAPE '\'
           OR mac_address LIKE ?1 ESCAPE '\'
           OR hostname LIKE ?1 ESCAPE '\'
           OR custom_name LIKE ?1 ESCAPE '\'
           OR vendor LIKE ?1 ESCAPE '\'
        ORDER BY last_seen DESC, ip_address
    )");
    stmt.bind(1, likePattern(query));
    return collectDevices(stmt);
}

int DeviceRepository::cleanupOldRecords(std::chrono::hours maxAge) {
    auto cutoff = std::chrono::system_clock::now() - maxAge;
    auto stmt = db_->prepare("DELETE FROM scan_records WHERE scan_time < ?");
    stmt.bind(1, timePointToString(cutoff));
    stmt.step();

    int removed = db_->changes();
    spdlog::info("Cleaned up {} scan records older than {} hours", removed, maxAge.count());
    return removed;
}

int DeviceRepository::count() {
    auto stmt = db_->prepare("SELECT COUNT(*) FROM devices");
    stmt.step();
    return stmt.columnInt(0);
}

int DeviceRepository::countOnline() {
    auto stmt = db_->prepare("SELECT COUNT(*) FROM devices WHERE is_online = 1");
    stmt.step();
    return stmt.columnInt(0);
}

std::vector<core::Device> DeviceRepository::collectDevices(Statement& stmt) {
    std::vector<core::Device> devices;
    while (stmt.step()) {
        devices.push_back(rowToDevice(stmt));
    }
    return devices;
}

core::Device DeviceRepository::rowToDevice(Statement& stmt) {
    core::Device device;
    device.id = stmt.columnInt64(0);
    device.ipAddress = stmt.columnText(1);
    device.macAddress = stmt.columnOptionalText(2);
    device.hostname = stmt.columnOptionalText(3);
    device.vendor = stmt.columnOptionalText(4);
    device.customName = stmt.columnOptionalText(5);
    device.deviceType = stmt.columnOptionalText(6);
    device.firstSeen = stringToTimePoint(stmt.columnText(7));
    device.lastSeen = stringToTimePoint(stmt.columnText(8));
    device.isOnline = stmt.columnInt(9) != 0;
    device.openPorts = portsFromJson(stmt.columnText(10));
    return device;
}

core::ScanRecord DeviceRepository::rowToRecord(Statement& stmt) {
    core::ScanRecord record;
    record.id = stmt.columnInt64(0);
    record.deviceId = stmt.columnInt64(1);
    record.scanTime = stringToTimePoint(stmt.columnText(2));
    record.isOnline = stmt.columnInt(3) != 0;
    if (!stmt.columnIsNull(4)) {
        record.latencyMs = stmt.columnDouble(4);
    }
    return record;
}

} // namespace lanwatch::infra
