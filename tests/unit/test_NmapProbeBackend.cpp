#include <catch2/catch_test_macros.hpp>

#include "core/types/Errors.hpp"
#include "infrastructure/network/NmapProbeBackend.hpp"
#include "support/TestSupport.hpp"

#include <algorithm>

using namespace lanwatch::core;
using namespace lanwatch::infra;
using lanwatch::test::FakeProcessRunner;

namespace {

bool contains(const std::vector<std::string>& args, const std::string& value) {
    return std::find(args.begin(), args.end(), value) != args.end();
}

std::string valueAfter(const std::vector<std::string>& args, const std::string& flag) {
    auto it = std::find(args.begin(), args.end(), flag);
    if (it == args.end() || it + 1 == args.end()) {
        return {};
    }
    return *(it + 1);
}

const char* ONE_HOST_REPORT = R"(<?xml version="1.0"?>
<nmaprun>
<host><status state="up"/><address addr="192.168.1.1" addrtype="ipv4"/></host>
<host><status state="up"/><address addr="192.168.1.9" addrtype="ipv4"/></host>
</nmaprun>)";

} // namespace

TEST_CASE("NmapProbeBackend discovery arguments", "[NmapProbeBackend]") {
    ScanConfig config;

    SECTION("Default ping sweep") {
        auto args = NmapProbeBackend::discoveryArguments("192.168.1.0/24", ScanType::Ping, config);
        REQUIRE(args.front() == "-sn");
        REQUIRE(contains(args, "-PE"));
        REQUIRE(valueAfter(args, "--max-retries") == "2");
        REQUIRE(valueAfter(args, "--min-rate") == "100");
        REQUIRE(valueAfter(args, "--host-timeout") == "3000ms");
        REQUIRE(valueAfter(args, "-oX") == "-");
        REQUIRE(args.back() == "192.168.1.0/24");
        REQUIRE_FALSE(contains(args, "--exclude"));
    }

    SECTION("Probe methods map to nmap flags") {
        config.pingMethods = {ProbeMethod::Icmp, ProbeMethod::TcpSyn, ProbeMethod::TcpAck,
                              ProbeMethod::Udp};
        config.tcpPingPorts = {22, 443};
        config.ackPingPorts = {80};
        auto args = NmapProbeBackend::discoveryArguments("10.0.0.0/24", ScanType::Ping, config);
        REQUIRE(contains(args, "-PE"));
        REQUIRE(contains(args, "-PS22,443"));
        REQUIRE(contains(args, "-PA80"));
        REQUIRE(contains(args, "-PU"));
    }

    SECTION("ARP sweep ignores ping methods") {
        auto args = NmapProbeBackend::discoveryArguments("10.0.0.0/24", ScanType::Arp, config);
        REQUIRE(contains(args, "-PR"));
        REQUIRE_FALSE(contains(args, "-PE"));
    }

    SECTION("Exclusions are passed to nmap") {
        config.excludeIps = {"10.0.0.1", "10.0.0.2"};
        auto args = NmapProbeBackend::discoveryArguments("10.0.0.0/24", ScanType::Ping, config);
        REQUIRE(valueAfter(args, "--exclude") == "10.0.0.1,10.0.0.2");
    }
}

TEST_CASE("NmapProbeBackend detail arguments", "[NmapProbeBackend]") {
    ScanConfig config;

    SECTION("Default port set") {
        auto args = NmapProbeBackend::detailArguments({"10.0.0.5", "10.0.0.6"}, config);
        REQUIRE(contains(args, "-sV"));
        REQUIRE(contains(args, "-O"));
        REQUIRE(valueAfter(args, "-p") == NmapProbeBackend::DEFAULT_DETAIL_PORTS);
        REQUIRE(args[args.size() - 2] == "10.0.0.5");
        REQUIRE(args.back() == "10.0.0.6");
    }

    SECTION("Configured port range") {
        config.enablePortScan = true;
        config.portRange = "22,80,8000-8100";
        auto args = NmapProbeBackend::detailArguments({"10.0.0.5"}, config);
        REQUIRE(valueAfter(args, "-p") == "22,80,8000-8100");
    }
}

TEST_CASE("NmapProbeBackend execution", "[NmapProbeBackend]") {
    auto runner = std::make_shared<FakeProcessRunner>();
    NmapProbeBackend backend(runner, "/usr/bin/nmap");
    ScanConfig config;

    SECTION("Successful run is parsed") {
        runner->result.exitCode = 0;
        runner->result.stdoutText = ONE_HOST_REPORT;

        auto observations = backend.discoverSubnet("192.168.1.0/24", ScanType::Ping, config);
        REQUIRE(observations.size() == 2);
        REQUIRE(runner->calls.size() == 1);
        REQUIRE(runner->calls[0].front() == "/usr/bin/nmap");
        REQUIRE(runner->timeouts[0] >= std::chrono::seconds(30));
        REQUIRE(runner->timeouts[0] <= std::chrono::minutes(30));
    }

    SECTION("Excluded hosts are filtered from the report") {
        runner->result.exitCode = 0;
        runner->result.stdoutText = ONE_HOST_REPORT;
        config.excludeIps = {"192.168.1.9"};

        auto observations = backend.discoverSubnet("192.168.1.0/24", ScanType::Ping, config);
        REQUIRE(observations.size() == 1);
        REQUIRE(observations[0].address == "192.168.1.1");
    }

    SECTION("Missing binary") {
        runner->result.spawnFailed = true;
        runner->result.exitCode = 127;
        REQUIRE_THROWS_AS(backend.discoverSubnet("192.168.1.0/24", ScanType::Ping, config),
                          ProbeBackendError);
    }

    SECTION("Non-zero exit") {
        runner->result.exitCode = 1;
        runner->result.stderrText = "You requested a scan type which requires root privileges.";
        REQUIRE_THROWS_AS(backend.probeHosts({"192.168.1.1"}, config), ProbeBackendError);
    }

    SECTION("Timeout") {
        runner->result.timedOut = true;
        runner->result.exitCode = 137;
        REQUIRE_THROWS_AS(backend.discoverSubnet("192.168.1.0/24", ScanType::Ping, config),
                          ProbeBackendError);
    }

    SECTION("Unparsable report is an empty result, not a failure") {
        runner->result.exitCode = 0;
        runner->result.stdoutText = "garbage";
        REQUIRE(backend.discoverSubnet("192.168.1.0/24", ScanType::Ping, config).empty());
    }

    SECTION("Empty detail batch does not spawn") {
        REQUIRE(backend.probeHosts({}, config).empty());
        REQUIRE(runner->calls.empty());
    }
}
