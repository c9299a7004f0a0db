#pragma once

#include "core/services/IHostnameResolver.hpp"
#include "core/services/IProbeBackend.hpp"
#include "core/services/IProcessRunner.hpp"
#include "core/services/IVendorTableSource.hpp"
#include "core/types/Errors.hpp"
#include "infrastructure/database/Database.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace lanwatch::test {

/**
 * @brief Migrated SQLite database in a temp file, removed on destruction.
 */
class TestDatabase {
public:
    explicit TestDatabase(const std::string& name = "lanwatch_test")
        : dbPath_(std::filesystem::temp_directory_path() / (name + ".db")) {
        removeFiles();
        db_ = std::make_shared<infra::Database>(dbPath_.string());
        db_->runMigrations();
    }

    ~TestDatabase() {
        db_.reset();
        removeFiles();
    }

    std::shared_ptr<infra::Database> get() { return db_; }

private:
    void removeFiles() {
        std::filesystem::remove(dbPath_);
        std::filesystem::remove(dbPath_.string() + "-wal");
        std::filesystem::remove(dbPath_.string() + "-shm");
    }

    std::filesystem::path dbPath_;
    std::shared_ptr<infra::Database> db_;
};

/**
 * @brief Temp directory removed on destruction.
 */
class TestDirectory {
public:
    explicit TestDirectory(const std::string& name)
        : path_(std::filesystem::temp_directory_path() / name) {
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~TestDirectory() { std::filesystem::remove_all(path_); }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

/// Current time truncated to the one-second resolution of stored timestamps.
inline std::chrono::system_clock::time_point storedNow() {
    return std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
}

inline core::ProbeObservation liveHost(const std::string& address,
                                       std::optional<std::string> mac = std::nullopt) {
    core::ProbeObservation observation;
    observation.address = address;
    observation.macAddress = std::move(mac);
    observation.isAlive = true;
    observation.latencyMs = 1.5;
    return observation;
}

/**
 * @brief Scripted probe backend that records every call.
 */
class FakeProbeBackend : public core::IProbeBackend {
public:
    explicit FakeProbeBackend(std::string name = "fake") : name_(std::move(name)) {}

    std::string name() const override { return name_; }

    std::vector<core::ProbeObservation> discoverSubnet(const std::string& cidr,
                                                       core::ScanType scanType,
                                                       const core::ScanConfig& config) override {
        std::lock_guard lock(mutex_);
        discoveryCalls.push_back(cidr);
        lastScanType = scanType;
        lastConfig = config;
        if (discoveryHook) {
            discoveryHook();
        }
        if (failDiscovery) {
            throw core::ProbeBackendError(name_, "discovery failed");
        }
        if (throwGeneric) {
            throw std::runtime_error("unexpected failure");
        }
        return discovered;
    }

    std::vector<core::ProbeObservation> probeHosts(const std::vector<std::string>& addresses,
                                                   const core::ScanConfig&) override {
        std::lock_guard lock(mutex_);
        detailCalls.push_back(addresses);
        for (const auto& address : addresses) {
            if (failDetailFor.contains(address)) {
                throw core::ProbeBackendError(name_, "detail failed for " + address);
            }
        }
        std::vector<core::ProbeObservation> results;
        for (const auto& address : addresses) {
            auto it = detailed.find(address);
            if (it != detailed.end()) {
                results.push_back(it->second);
            }
        }
        return results;
    }

    std::vector<core::ProbeObservation> discovered;
    std::map<std::string, core::ProbeObservation> detailed;
    std::set<std::string> failDetailFor;
    bool failDiscovery{false};
    bool throwGeneric{false};
    std::function<void()> discoveryHook;

    std::vector<std::string> discoveryCalls;
    std::vector<std::vector<std::string>> detailCalls;
    core::ScanType lastScanType{core::ScanType::Ping};
    core::ScanConfig lastConfig;

private:
    std::string name_;
    std::mutex mutex_;
};

/**
 * @brief Process runner returning a scripted result and recording argv.
 */
class FakeProcessRunner : public core::IProcessRunner {
public:
    core::ProcessResult run(const std::vector<std::string>& argv,
                            std::chrono::milliseconds timeout) override {
        std::lock_guard lock(mutex_);
        calls.push_back(argv);
        timeouts.push_back(timeout);
        return result;
    }

    bool isAvailable(const std::string& program) const override {
        return available.contains(program);
    }

    core::ProcessResult result;
    std::set<std::string> available;
    std::vector<std::vector<std::string>> calls;
    std::vector<std::chrono::milliseconds> timeouts;

private:
    std::mutex mutex_;
};

class FakeHostnameResolver : public core::IHostnameResolver {
public:
    std::optional<std::string> resolve(const std::string& ipAddress) override {
        ++lookups;
        auto it = names.find(ipAddress);
        if (it == names.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::unordered_map<std::string, std::string> names;
    std::atomic<int> lookups{0};
};

class InMemoryVendorTable : public core::IVendorTableSource {
public:
    std::unordered_map<std::string, std::string> loadVendorTable() override {
        ++loads;
        return table;
    }

    std::unordered_map<std::string, std::string> table;
    int loads{0};
};

} // namespace lanwatch::test
