#include <catch2/catch_test_macros.hpp>

#include "core/types/Errors.hpp"
#include "engine/DiscoveryEngine.hpp"
#include "support/TestSupport.hpp"

#include <algorithm>

using namespace lanwatch::engine;
using namespace lanwatch::core;
using lanwatch::test::FakeHostnameResolver;
using lanwatch::test::FakeProbeBackend;
using lanwatch::test::InMemoryVendorTable;
using lanwatch::test::liveHost;

namespace {

struct EngineFixture {
    EngineFixture(std::optional<std::string> detected = std::nullopt)
        : backend(std::make_shared<FakeProbeBackend>()),
          vendors(std::make_shared<InMemoryVendorTable>()),
          names(std::make_shared<FakeHostnameResolver>()),
          engine(backend, std::make_shared<VendorResolver>(vendors), names,
                 [detected] { return detected; }) {}

    std::shared_ptr<FakeProbeBackend> backend;
    std::shared_ptr<InMemoryVendorTable> vendors;
    std::shared_ptr<FakeHostnameResolver> names;
    DiscoveryEngine engine;
};

ScanConfig quietConfig() {
    ScanConfig config;
    config.resolveHostnames = false;
    config.fetchVendorInfo = false;
    return config;
}

} // namespace

TEST_CASE("DiscoveryEngine subnet resolution", "[DiscoveryEngine]") {
    SECTION("Explicit target wins and is canonicalised") {
        EngineFixture f("172.16.0.0/16");
        ScanConfig config;
        config.subnetCidr = "10.0.0.0/24";

        REQUIRE(f.engine.resolveSubnet("192.168.7.14/24", config) == "192.168.7.0/24");
    }

    SECTION("Invalid explicit target throws") {
        EngineFixture f;
        REQUIRE_THROWS_AS(f.engine.resolveSubnet("192.168.7.300/24", ScanConfig{}),
                          ConfigurationError);
    }

    SECTION("Configured subnet beats detection") {
        EngineFixture f("172.16.0.0/16");
        ScanConfig config;
        config.subnetCidr = "10.0.0.0/24";

        REQUIRE(f.engine.resolveSubnet(std::nullopt, config) == "10.0.0.0/24");
    }

    SECTION("Detected subnet is used when auto-detection is on") {
        EngineFixture f("172.16.4.9/16");
        REQUIRE(f.engine.resolveSubnet(std::nullopt, ScanConfig{}) == "172.16.0.0/16");
    }

    SECTION("Falls back when detection is off or fails") {
        EngineFixture detecting("172.16.0.0/16");
        ScanConfig config;
        config.autoDetectSubnet = false;
        REQUIRE(detecting.engine.resolveSubnet(std::nullopt, config) ==
                DiscoveryEngine::FALLBACK_SUBNET);

        EngineFixture blind;
        REQUIRE(blind.engine.resolveSubnet(std::nullopt, ScanConfig{}) == "192.168.1.0/24");

        EngineFixture garbled("not a subnet");
        REQUIRE(garbled.engine.resolveSubnet(std::nullopt, ScanConfig{}) == "192.168.1.0/24");
    }

    SECTION("Empty target counts as absent") {
        EngineFixture f("172.16.0.0/16");
        REQUIRE(f.engine.resolveSubnet(std::string(), ScanConfig{}) == "172.16.0.0/16");
    }
}

TEST_CASE("DiscoveryEngine sweep", "[DiscoveryEngine]") {
    EngineFixture f;

    SECTION("Passes the request to the backend") {
        f.backend->discovered = {liveHost("10.0.0.1"), liveHost("10.0.0.2")};

        auto result = f.engine.sweep("10.0.0.0/24", ScanType::Arp, quietConfig());

        REQUIRE(result.size() == 2);
        REQUIRE(f.backend->discoveryCalls == std::vector<std::string>{"10.0.0.0/24"});
        REQUIRE(f.backend->lastScanType == ScanType::Arp);
        REQUIRE(f.backend->detailCalls.empty());
    }

    SECTION("Excluded addresses are dropped") {
        f.backend->discovered = {liveHost("10.0.0.1"), liveHost("10.0.0.2"),
                                 liveHost("10.0.0.3")};
        auto config = quietConfig();
        config.excludeIps = {"10.0.0.2"};

        auto result = f.engine.sweep("10.0.0.0/24", ScanType::Ping, config);

        REQUIRE(result.size() == 2);
        for (const auto& observation : result) {
            REQUIRE(observation.address != "10.0.0.2");
        }
    }

    SECTION("Backend failures propagate") {
        f.backend->failDiscovery = true;
        REQUIRE_THROWS_AS(f.engine.sweep("10.0.0.0/24", ScanType::Ping, quietConfig()),
                          ProbeBackendError);
    }
}

TEST_CASE("DiscoveryEngine detail pass", "[DiscoveryEngine]") {
    EngineFixture f;

    for (int i = 1; i <= 23; ++i) {
        f.backend->discovered.push_back(liveHost("10.0.0." + std::to_string(i)));
    }
    ProbeObservation silent;
    silent.address = "10.0.0.200";
    f.backend->discovered.push_back(silent);

    SECTION("Live hosts are probed in chunks of ten") {
        f.engine.sweep("10.0.0.0/24", ScanType::Comprehensive, quietConfig());

        REQUIRE(f.backend->detailCalls.size() == 3);
        REQUIRE(f.backend->detailCalls[0].size() == 10);
        REQUIRE(f.backend->detailCalls[1].size() == 10);
        REQUIRE(f.backend->detailCalls[2].size() == 3);
        for (const auto& chunk : f.backend->detailCalls) {
            REQUIRE(std::find(chunk.begin(), chunk.end(), "10.0.0.200") == chunk.end());
        }
    }

    SECTION("Detail results replace discovery results") {
        auto detailed = liveHost("10.0.0.4");
        detailed.latencyMs.reset();
        detailed.openPorts = {515, 631};
        f.backend->discovered[3].macAddress = "00:11:22:33:44:55";
        f.backend->detailed["10.0.0.4"] = detailed;

        auto result = f.engine.sweep("10.0.0.0/24", ScanType::Comprehensive, quietConfig());

        auto it = std::find_if(result.begin(), result.end(),
                               [](const ProbeObservation& o) { return o.address == "10.0.0.4"; });
        REQUIRE(it != result.end());
        REQUIRE(it->openPorts == std::vector<uint16_t>{515, 631});
        REQUIRE(it->macAddress == "00:11:22:33:44:55");
        REQUIRE(it->latencyMs == 1.5);
        REQUIRE(it->deviceType == "Network Printer");
    }

    SECTION("A failed chunk does not abort the sweep") {
        f.backend->failDetailFor = {"10.0.0.12"};
        f.backend->detailed["10.0.0.2"] = liveHost("10.0.0.2");
        f.backend->detailed["10.0.0.2"].openPorts = {22};
        f.backend->detailed["10.0.0.12"] = liveHost("10.0.0.12");
        f.backend->detailed["10.0.0.12"].openPorts = {22};
        f.backend->detailed["10.0.0.22"] = liveHost("10.0.0.22");
        f.backend->detailed["10.0.0.22"].openPorts = {22};

        auto result = f.engine.sweep("10.0.0.0/24", ScanType::Comprehensive, quietConfig());

        REQUIRE(result.size() == 24);
        REQUIRE(f.backend->detailCalls.size() == 3);

        auto portsOf = [&result](const std::string& address) {
            auto it = std::find_if(result.begin(), result.end(),
                                   [&](const ProbeObservation& o) { return o.address == address; });
            return it->openPorts;
        };
        REQUIRE(portsOf("10.0.0.2") == std::vector<uint16_t>{22});
        REQUIRE(portsOf("10.0.0.12").empty());
        REQUIRE(portsOf("10.0.0.22") == std::vector<uint16_t>{22});
    }
}

TEST_CASE("DiscoveryEngine enrichment", "[DiscoveryEngine]") {
    EngineFixture f;
    f.vendors->table = {{"080027", "VirtualBox"}};
    f.names->names = {{"10.0.0.1", "vm.lan"}};

    auto withMac = liveHost("10.0.0.1", "08:00:27:AA:BB:CC");
    auto named = liveHost("10.0.0.2");
    named.hostname = "reported.lan";
    f.backend->discovered = {withMac, named};

    SECTION("Back-fills hostnames and vendors") {
        auto result = f.engine.sweep("10.0.0.0/24", ScanType::Ping, ScanConfig{});

        REQUIRE(result[0].hostname == "vm.lan");
        REQUIRE(result[0].vendor == "VirtualBox");
        REQUIRE(result[1].hostname == "reported.lan");
        REQUIRE_FALSE(result[1].vendor.has_value());
        REQUIRE(f.names->lookups.load() == 1);
    }

    SECTION("Respects the lookup switches") {
        auto result = f.engine.sweep("10.0.0.0/24", ScanType::Ping, quietConfig());

        REQUIRE_FALSE(result[0].hostname.has_value());
        REQUIRE_FALSE(result[0].vendor.has_value());
        REQUIRE(f.names->lookups.load() == 0);
    }

    SECTION("Only comprehensive sweeps classify") {
        f.backend->discovered[0].openPorts = {9100};

        auto ping = f.engine.sweep("10.0.0.0/24", ScanType::Ping, quietConfig());
        REQUIRE_FALSE(ping[0].deviceType.has_value());

        auto full = f.engine.sweep("10.0.0.0/24", ScanType::Comprehensive, quietConfig());
        REQUIRE(full[0].deviceType == "Network Printer");
        REQUIRE_FALSE(full[1].deviceType.has_value());
    }

    SECTION("Enrichment never changes liveness") {
        auto result = f.engine.sweep("10.0.0.0/24", ScanType::Ping, ScanConfig{});
        REQUIRE(result[0].isAlive);
        REQUIRE(result[1].isAlive);
    }
}
