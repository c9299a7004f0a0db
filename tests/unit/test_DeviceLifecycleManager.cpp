#include <catch2/catch_test_macros.hpp>

#include "engine/DeviceLifecycleManager.hpp"
#include "infrastructure/database/DeviceRepository.hpp"
#include "support/TestSupport.hpp"

using namespace lanwatch::engine;
using namespace lanwatch::core;
using lanwatch::infra::DeviceRepository;
using lanwatch::test::liveHost;
using lanwatch::test::storedNow;
using lanwatch::test::TestDatabase;

namespace {

// Stores through a real repository but fails the n-th device write.
class FailingDeviceRepository : public IDeviceRepository {
public:
    explicit FailingDeviceRepository(std::shared_ptr<DeviceRepository> inner)
        : inner_(std::move(inner)) {}

    std::optional<Device> getByAddress(const std::string& ip) override {
        return inner_->getByAddress(ip);
    }
    std::optional<Device> getById(int64_t id) override { return inner_->getById(id); }
    std::optional<Device> getByMac(const std::string& mac) override {
        return inner_->getByMac(mac);
    }

    Device upsert(const Device& device) override {
        if (++upserts_ == failOnUpsert) {
            throw lanwatch::infra::StorageError("disk I/O error");
        }
        return inner_->upsert(device);
    }

    std::vector<Device> listOnline() override { return inner_->listOnline(); }
    std::vector<Device> listAll() override { return inner_->listAll(); }
    int64_t appendHistory(const ScanRecord& record) override {
        return inner_->appendHistory(record);
    }
    std::vector<ScanRecord> history(int64_t deviceId, std::chrono::system_clock::time_point from,
                                    std::chrono::system_clock::time_point to) override {
        return inner_->history(deviceId, from, to);
    }
    bool updateCustomName(int64_t id, const std::optional<std::string>& name) override {
        return inner_->updateCustomName(id, name);
    }
    std::vector<Device> search(const std::string& query) override {
        return inner_->search(query);
    }
    void inTransaction(const std::function<void()>& work) override {
        inner_->inTransaction(work);
    }

    int failOnUpsert{0};

private:
    std::shared_ptr<DeviceRepository> inner_;
    int upserts_{0};
};

} // namespace

TEST_CASE("DeviceLifecycleManager coalesce", "[DeviceLifecycleManager]") {
    SECTION("Distinct addresses pass through in order") {
        auto merged =
            DeviceLifecycleManager::coalesce({liveHost("10.0.0.2"), liveHost("10.0.0.1")});
        REQUIRE(merged.size() == 2);
        REQUIRE(merged[0].address == "10.0.0.2");
        REQUIRE(merged[1].address == "10.0.0.1");
    }

    SECTION("Duplicates collapse into one observation") {
        ProbeObservation first;
        first.address = "10.0.0.5";
        first.isAlive = false;
        first.openPorts = {443, 22};

        auto second = liveHost("10.0.0.5", "AA:BB:CC:DD:EE:01");
        second.hostname = "laptop.lan";
        second.latencyMs = 4.0;
        second.openPorts = {22, 80};
        second.services.push_back(ServiceInfo{80, "tcp", "http", ""});

        auto merged = DeviceLifecycleManager::coalesce({first, second});
        REQUIRE(merged.size() == 1);

        const auto& obs = merged.front();
        REQUIRE(obs.isAlive);
        REQUIRE(obs.macAddress == "AA:BB:CC:DD:EE:01");
        REQUIRE(obs.hostname == "laptop.lan");
        REQUIRE(obs.latencyMs == 4.0);
        REQUIRE(obs.openPorts == std::vector<uint16_t>{22, 80, 443});
        REQUIRE(obs.services.size() == 1);
    }

    SECTION("The first identity value wins") {
        auto first = liveHost("10.0.0.6");
        first.hostname = "alpha";
        auto second = liveHost("10.0.0.6");
        second.hostname = "beta";
        second.latencyMs = 9.0;

        auto merged = DeviceLifecycleManager::coalesce({first, second});
        REQUIRE(merged.front().hostname == "alpha");
        REQUIRE(merged.front().latencyMs == 1.5);
    }
}

TEST_CASE("DeviceLifecycleManager mergeInto", "[DeviceLifecycleManager]") {
    auto now = storedNow();

    SECTION("A new device takes its address and first sighting") {
        Device device;
        DeviceLifecycleManager::mergeInto(device, liveHost("10.0.0.7", "00:11:22:33:44:55"), now);

        REQUIRE(device.ipAddress == "10.0.0.7");
        REQUIRE(device.firstSeen == now);
        REQUIRE(device.lastSeen == now);
        REQUIRE(device.isOnline);
        REQUIRE(device.macAddress == "00:11:22:33:44:55");
    }

    SECTION("Stored identity fields are not overwritten") {
        Device device;
        device.id = 3;
        device.ipAddress = "10.0.0.8";
        device.firstSeen = now - std::chrono::hours(5);
        device.hostname = "original";
        device.openPorts = {22};

        auto observation = liveHost("10.0.0.8");
        observation.hostname = "replacement";
        observation.vendor = "Acme";
        DeviceLifecycleManager::mergeInto(device, observation, now);

        REQUIRE(device.hostname == "original");
        REQUIRE(device.vendor == "Acme");
        REQUIRE(device.firstSeen == now - std::chrono::hours(5));
        REQUIRE(device.openPorts == std::vector<uint16_t>{22});
    }

    SECTION("Ports and type follow the latest detail pass") {
        Device device;
        device.id = 4;
        device.openPorts = {22};
        device.deviceType = "Computer";

        auto observation = liveHost("10.0.0.9");
        observation.openPorts = {80, 9100};
        observation.deviceType = "Network Printer";
        DeviceLifecycleManager::mergeInto(device, observation, now);

        REQUIRE(device.openPorts == std::vector<uint16_t>{80, 9100});
        REQUIRE(device.deviceType == "Network Printer");
    }
}

TEST_CASE("DeviceLifecycleManager applyObservations", "[DeviceLifecycleManager]") {
    TestDatabase testDb;
    auto repo = std::make_shared<DeviceRepository>(testDb.get());
    DeviceLifecycleManager manager(repo);
    auto first = storedNow() - std::chrono::minutes(10);
    auto second = first + std::chrono::minutes(5);

    SECTION("First sighting creates devices with one record each") {
        auto summary = manager.applyObservations(
            {liveHost("192.168.1.10"), liveHost("192.168.1.11")}, first);

        REQUIRE(summary == LifecycleSummary{2, 0, 0, 2});
        REQUIRE(repo->count() == 2);

        auto device = repo->getByAddress("192.168.1.10");
        REQUIRE(device->isOnline);
        REQUIRE(device->firstSeen == first);

        auto records = repo->history(device->id, first, first);
        REQUIRE(records.size() == 1);
        REQUIRE(records[0].isOnline);
        REQUIRE(records[0].latencyMs == 1.5);
    }

    SECTION("Absent devices are marked offline with the sweep time") {
        manager.applyObservations({liveHost("192.168.1.10"), liveHost("192.168.1.11")}, first);
        auto summary = manager.applyObservations({liveHost("192.168.1.10")}, second);

        REQUIRE(summary == LifecycleSummary{0, 1, 1, 1});

        auto gone = repo->getByAddress("192.168.1.11");
        REQUIRE_FALSE(gone->isOnline);
        REQUIRE(gone->lastSeen == second);
        REQUIRE(gone->firstSeen == first);

        auto records = repo->history(gone->id, first, second);
        REQUIRE(records.size() == 2);
        REQUIRE_FALSE(records[1].isOnline);
        REQUIRE_FALSE(records[1].latencyMs.has_value());
        REQUIRE(records[1].scanTime == second);
    }

    SECTION("Offline devices are not recorded again while absent") {
        manager.applyObservations({liveHost("192.168.1.10"), liveHost("192.168.1.11")}, first);
        manager.applyObservations({liveHost("192.168.1.10")}, second);
        auto summary =
            manager.applyObservations({liveHost("192.168.1.10")}, second + std::chrono::minutes(5));

        REQUIRE(summary.markedOffline == 0);
        auto gone = repo->getByAddress("192.168.1.11");
        REQUIRE(repo->history(gone->id, first, second + std::chrono::hours(1)).size() == 2);
    }

    SECTION("A returning device comes back online") {
        manager.applyObservations({liveHost("192.168.1.12")}, first);
        manager.applyObservations({}, second);
        auto third = second + std::chrono::minutes(5);
        auto summary = manager.applyObservations({liveHost("192.168.1.12")}, third);

        REQUIRE(summary == LifecycleSummary{0, 1, 0, 1});
        auto device = repo->getByAddress("192.168.1.12");
        REQUIRE(device->isOnline);
        REQUIRE(device->lastSeen == third);
    }

    SECTION("Duplicate observations yield a single record") {
        auto summary = manager.applyObservations(
            {liveHost("192.168.1.13"), liveHost("192.168.1.13", "AA:AA:AA:AA:AA:AA")}, first);

        REQUIRE(summary == LifecycleSummary{1, 0, 0, 1});
        auto device = repo->getByAddress("192.168.1.13");
        REQUIRE(device->macAddress == "AA:AA:AA:AA:AA:AA");
        REQUIRE(repo->history(device->id, first, first).size() == 1);
    }

    SECTION("An empty sweep marks everything offline") {
        manager.applyObservations({liveHost("192.168.1.14"), liveHost("192.168.1.15")}, first);
        auto summary = manager.applyObservations({}, second);

        REQUIRE(summary == LifecycleSummary{0, 0, 2, 0});
        REQUIRE(repo->listOnline().empty());
    }
}

TEST_CASE("DeviceLifecycleManager applies a sweep atomically", "[DeviceLifecycleManager]") {
    TestDatabase testDb("lanwatch_lifecycle_atomic_test");
    auto repo = std::make_shared<DeviceRepository>(testDb.get());
    auto first = storedNow() - std::chrono::minutes(10);
    auto second = first + std::chrono::minutes(5);

    DeviceLifecycleManager(repo).applyObservations(
        {liveHost("192.168.1.10"), liveHost("192.168.1.11")}, first);

    auto failing = std::make_shared<FailingDeviceRepository>(repo);
    DeviceLifecycleManager manager(failing);

    SECTION("A storage failure mid-sweep leaves the previous state") {
        // .10 is updated, then inserting .12 fails.
        failing->failOnUpsert = 2;

        REQUIRE_THROWS_AS(manager.applyObservations(
                              {liveHost("192.168.1.10"), liveHost("192.168.1.12"),
                               liveHost("192.168.1.13")},
                              second),
                          lanwatch::infra::StorageError);

        REQUIRE(repo->count() == 2);
        REQUIRE_FALSE(repo->getByAddress("192.168.1.12").has_value());

        auto kept = repo->getByAddress("192.168.1.10");
        REQUIRE(kept->lastSeen == first);
        REQUIRE(repo->history(kept->id, first, second).size() == 1);

        auto untouched = repo->getByAddress("192.168.1.11");
        REQUIRE(untouched->isOnline);
        REQUIRE(repo->history(untouched->id, first, second).size() == 1);
    }

    SECTION("A failure while marking devices offline is rolled back too") {
        // .10 is updated, then demoting .11 fails.
        failing->failOnUpsert = 2;

        REQUIRE_THROWS(manager.applyObservations({liveHost("192.168.1.10")}, second));

        REQUIRE(repo->countOnline() == 2);
        auto kept = repo->getByAddress("192.168.1.10");
        REQUIRE(kept->lastSeen == first);
    }

    SECTION("The next sweep applies normally after a rollback") {
        failing->failOnUpsert = 1;
        REQUIRE_THROWS(manager.applyObservations({liveHost("192.168.1.10")}, second));

        auto summary = manager.applyObservations({liveHost("192.168.1.10")}, second);

        REQUIRE(summary == LifecycleSummary{0, 1, 1, 1});
        REQUIRE(repo->countOnline() == 1);
    }
}
