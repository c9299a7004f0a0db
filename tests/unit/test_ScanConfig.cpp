#include <catch2/catch_test_macros.hpp>

#include "core/types/Errors.hpp"
#include "core/types/ScanConfig.hpp"

using namespace lanwatch::core;
using namespace std::chrono_literals;

TEST_CASE("ScanConfig defaults", "[ScanConfig]") {
    ScanConfig config;

    REQUIRE_FALSE(config.subnetCidr.has_value());
    REQUIRE(config.autoDetectSubnet);
    REQUIRE(config.excludeIps.empty());
    REQUIRE(config.scanRate == 100);
    REQUIRE(config.maxWorkers == 50);
    REQUIRE(config.scanTimeout == "3s");
    REQUIRE(config.maxRetries == 2);
    REQUIRE(config.pingMethods == std::vector<ProbeMethod>{ProbeMethod::Icmp});
    REQUIRE(config.tcpPingPorts == std::vector<int>{22, 80, 443});
    REQUIRE(config.ackPingPorts == std::vector<int>{80});
    REQUIRE_FALSE(config.enablePortScan);
    REQUIRE(config.portRange == "1-1000");
    REQUIRE_NOTHROW(config.validate());
}

TEST_CASE("ScanConfig validation", "[ScanConfig]") {
    ScanConfig config;

    SECTION("Subnet with host bits is accepted") {
        config.subnetCidr = "192.168.1.17/24";
        REQUIRE_NOTHROW(config.validate());
    }

    SECTION("Malformed subnet is rejected") {
        config.subnetCidr = "192.168.1.0/33";
        REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
        config.subnetCidr = "not-a-subnet";
        REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
    }

    SECTION("Excluded addresses must be IPv4") {
        config.excludeIps = {"192.168.1.1", "192.168.1.300"};
        REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
    }

    SECTION("Numeric ranges are enforced") {
        config.scanRate = 0;
        REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
        config.scanRate = 1000;
        REQUIRE_NOTHROW(config.validate());
        config.scanRate = 1001;
        REQUIRE_THROWS_AS(config.validate(), ConfigurationError);

        config = ScanConfig{};
        config.maxWorkers = 0;
        REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
        config.maxWorkers = 1;
        REQUIRE_NOTHROW(config.validate());
        config.maxWorkers = 200;
        REQUIRE_NOTHROW(config.validate());
        config.maxWorkers = 201;
        REQUIRE_THROWS_AS(config.validate(), ConfigurationError);

        config = ScanConfig{};
        config.maxRetries = 6;
        REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
        config.maxRetries = 0;
        REQUIRE_NOTHROW(config.validate());
    }

    SECTION("Timeout grammar is enforced") {
        config.scanTimeout = "3 seconds";
        REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
        config.scanTimeout = "";
        REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
    }

    SECTION("At least one ping method") {
        config.pingMethods.clear();
        REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
    }

    SECTION("Ping ports must be valid") {
        config.tcpPingPorts = {22, 0};
        REQUIRE_THROWS_AS(config.validate(), ConfigurationError);

        config = ScanConfig{};
        config.ackPingPorts = {65536};
        REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
    }

    SECTION("Port range must parse") {
        config.portRange = "100-10";
        REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
    }
}

TEST_CASE("ScanConfig timeout parsing", "[ScanConfig]") {
    SECTION("Units") {
        REQUIRE(ScanConfig::parseTimeout("500ms") == 500ms);
        REQUIRE(ScanConfig::parseTimeout("3s") == 3000ms);
        REQUIRE(ScanConfig::parseTimeout("2m") == 120000ms);
        REQUIRE(ScanConfig::parseTimeout("1h") == 3600000ms);
    }

    SECTION("Fractions and bare numbers") {
        REQUIRE(ScanConfig::parseTimeout("1.5s") == 1500ms);
        REQUIRE(ScanConfig::parseTimeout("2") == 2000ms);
    }

    SECTION("Rejected inputs") {
        REQUIRE_FALSE(ScanConfig::parseTimeout("").has_value());
        REQUIRE_FALSE(ScanConfig::parseTimeout("0s").has_value());
        REQUIRE_FALSE(ScanConfig::parseTimeout("-1s").has_value());
        REQUIRE_FALSE(ScanConfig::parseTimeout("5d").has_value());
        REQUIRE_FALSE(ScanConfig::parseTimeout("s").has_value());
    }

    SECTION("timeout() uses the configured value") {
        ScanConfig config;
        config.scanTimeout = "250ms";
        REQUIRE(config.timeout() == 250ms);

        config.scanTimeout = "bogus";
        REQUIRE_THROWS_AS(config.timeout(), ConfigurationError);
    }
}

TEST_CASE("ScanConfig port range expansion", "[ScanConfig]") {
    SECTION("Single ports and ranges") {
        auto ports = ScanConfig::expandPortRange("22,80,8000-8002");
        REQUIRE(ports == std::vector<uint16_t>{22, 80, 8000, 8001, 8002});
    }

    SECTION("Duplicates are merged and output is sorted") {
        auto ports = ScanConfig::expandPortRange("443, 80, 79-81");
        REQUIRE(ports == std::vector<uint16_t>{79, 80, 81, 443});
    }

    SECTION("Full range") {
        auto ports = ScanConfig::expandPortRange("1-65535");
        REQUIRE(ports.size() == 65535);
        REQUIRE(ports.front() == 1);
        REQUIRE(ports.back() == 65535);
    }

    SECTION("Invalid expressions") {
        REQUIRE_THROWS_AS(ScanConfig::expandPortRange(""), ConfigurationError);
        REQUIRE_THROWS_AS(ScanConfig::expandPortRange("0"), ConfigurationError);
        REQUIRE_THROWS_AS(ScanConfig::expandPortRange("65536"), ConfigurationError);
        REQUIRE_THROWS_AS(ScanConfig::expandPortRange("80,,81"), ConfigurationError);
        REQUIRE_THROWS_AS(ScanConfig::expandPortRange("http"), ConfigurationError);
        REQUIRE_THROWS_AS(ScanConfig::expandPortRange("90-80"), ConfigurationError);
    }
}

TEST_CASE("ScanConfig probe method names", "[ScanConfig]") {
    for (auto method : {ProbeMethod::Icmp, ProbeMethod::TcpSyn, ProbeMethod::TcpAck,
                        ProbeMethod::Udp}) {
        REQUIRE(ScanConfig::methodFromString(ScanConfig::methodToString(method)) == method);
    }
    REQUIRE(ScanConfig::methodToString(ProbeMethod::TcpSyn) == "tcp_syn");
    REQUIRE_FALSE(ScanConfig::methodFromString("arp").has_value());
}

TEST_CASE("ScanPresets", "[ScanConfig][Presets]") {
    SECTION("Fast") {
        auto config = ScanPresets::fast();
        REQUIRE(config.scanRate == 300);
        REQUIRE(config.maxWorkers == 100);
        REQUIRE(config.scanTimeout == "1s");
        REQUIRE(config.maxRetries == 1);
        REQUIRE(config.pingMethods == std::vector<ProbeMethod>{ProbeMethod::Icmp});
        REQUIRE(config.tcpPingPorts == std::vector<int>{80});
        REQUIRE(config.ackPingPorts.empty());
        REQUIRE_FALSE(config.resolveHostnames);
        REQUIRE_FALSE(config.fetchVendorInfo);
    }

    SECTION("Balanced equals the defaults") {
        REQUIRE(ScanPresets::balanced() == ScanConfig{});
    }

    SECTION("Thorough") {
        auto config = ScanPresets::thorough();
        REQUIRE(config.scanRate == 50);
        REQUIRE(config.maxWorkers == 30);
        REQUIRE(config.scanTimeout == "5s");
        REQUIRE(config.maxRetries == 3);
        REQUIRE(config.pingMethods == std::vector<ProbeMethod>{ProbeMethod::Icmp,
                                                               ProbeMethod::TcpSyn,
                                                               ProbeMethod::TcpAck});
        REQUIRE(config.tcpPingPorts == std::vector<int>{22, 23, 25, 53, 80, 110, 443, 993, 995});
        REQUIRE(config.ackPingPorts == std::vector<int>{80, 443});
        REQUIRE(config.resolveHostnames);
        REQUIRE(config.fetchVendorInfo);
    }

    SECTION("Stealth") {
        auto config = ScanPresets::stealth();
        REQUIRE(config.scanRate == 10);
        REQUIRE(config.maxWorkers == 10);
        REQUIRE(config.scanTimeout == "10s");
        REQUIRE(config.maxRetries == 1);
        REQUIRE(config.pingMethods == std::vector<ProbeMethod>{ProbeMethod::TcpSyn});
        REQUIRE(config.tcpPingPorts == std::vector<int>{80, 443});
        REQUIRE_FALSE(config.resolveHostnames);
        REQUIRE(config.fetchVendorInfo);
    }

    SECTION("All presets validate") {
        auto presets = ScanPresets::all();
        REQUIRE(presets.size() == 4);
        for (const auto& preset : presets) {
            REQUIRE_NOTHROW(preset.config.validate());
            REQUIRE_FALSE(preset.displayName.empty());
            REQUIRE_FALSE(preset.description.empty());
        }
    }

    SECTION("Lookup by name") {
        REQUIRE(ScanPresets::byName("stealth") == ScanPresets::stealth());
        REQUIRE_THROWS_AS(ScanPresets::byName("turbo"), ConfigurationError);
    }
}
