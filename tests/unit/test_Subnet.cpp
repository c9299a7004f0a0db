#include <catch2/catch_test_macros.hpp>

#include "core/types/Errors.hpp"
#include "core/types/Subnet.hpp"

using namespace lanwatch::core;

TEST_CASE("Subnet parsing", "[Subnet]") {
    SECTION("Canonical /24") {
        auto subnet = Subnet::parse("192.168.1.0/24");
        REQUIRE(subnet.network == "192.168.1.0");
        REQUIRE(subnet.broadcast == "192.168.1.255");
        REQUIRE(subnet.prefixLength == 24);
        REQUIRE(subnet.usableHosts == 254);
        REQUIRE(subnet.cidr() == "192.168.1.0/24");
    }

    SECTION("Host bits are cleared") {
        auto subnet = Subnet::parse("10.1.2.77/16");
        REQUIRE(subnet.cidr() == "10.1.0.0/16");
        REQUIRE(subnet.usableHosts == 65534);
    }

    SECTION("Bare address is a /32") {
        auto subnet = Subnet::parse("172.16.0.9");
        REQUIRE(subnet.cidr() == "172.16.0.9/32");
        REQUIRE(subnet.usableHosts == 1);
    }

    SECTION("Point-to-point /31") {
        REQUIRE(Subnet::parse("10.0.0.0/31").usableHosts == 2);
    }

    SECTION("Invalid input") {
        REQUIRE_THROWS_AS(Subnet::parse("192.168.1.0/40"), ConfigurationError);
        REQUIRE_THROWS_AS(Subnet::parse("256.1.1.1/24"), ConfigurationError);
        REQUIRE_THROWS_AS(Subnet::parse("lan"), ConfigurationError);
        REQUIRE_FALSE(Subnet::tryParse("").has_value());
    }
}

TEST_CASE("Subnet membership", "[Subnet]") {
    auto subnet = Subnet::parse("192.168.1.0/24");

    REQUIRE(subnet.contains("192.168.1.0"));
    REQUIRE(subnet.contains("192.168.1.42"));
    REQUIRE(subnet.contains("192.168.1.255"));
    REQUIRE_FALSE(subnet.contains("192.168.2.1"));
    REQUIRE_FALSE(subnet.contains("not-an-ip"));
}

TEST_CASE("Subnet host enumeration", "[Subnet]") {
    SECTION("Network and broadcast are skipped") {
        auto hosts = Subnet::parse("192.168.10.0/29").hostAddresses();
        REQUIRE(hosts.size() == 6);
        REQUIRE(hosts.front() == "192.168.10.1");
        REQUIRE(hosts.back() == "192.168.10.6");
    }

    SECTION("/31 and /32 keep every address") {
        REQUIRE(Subnet::parse("10.0.0.0/31").hostAddresses() ==
                std::vector<std::string>{"10.0.0.0", "10.0.0.1"});
        REQUIRE(Subnet::parse("10.0.0.5/32").hostAddresses() ==
                std::vector<std::string>{"10.0.0.5"});
    }
}

TEST_CASE("Subnet address validation", "[Subnet]") {
    REQUIRE(Subnet::isValidAddress("8.8.8.8"));
    REQUIRE_FALSE(Subnet::isValidAddress("8.8.8"));
    REQUIRE_FALSE(Subnet::isValidAddress("8.8.8.8/32"));
    REQUIRE_FALSE(Subnet::isValidAddress("::1"));
}
