#include <catch2/catch_test_macros.hpp>

#include "core/types/MacAddress.hpp"

using namespace lanwatch::core;

TEST_CASE("MacAddress prefix extraction", "[MacAddress]") {
    REQUIRE(MacAddress::ouiPrefix("00:16:3e:aa:bb:cc") == "00163E");
    REQUIRE(MacAddress::ouiPrefix("00-16-3E-AA-BB-CC") == "00163E");
    REQUIRE(MacAddress::ouiPrefix("0016.3eaa.bbcc") == "00163E");
    REQUIRE(MacAddress::ouiPrefix("00163e") == "00163E");

    REQUIRE_FALSE(MacAddress::ouiPrefix("00:16").has_value());
    REQUIRE_FALSE(MacAddress::ouiPrefix("").has_value());
    REQUIRE_FALSE(MacAddress::ouiPrefix("zz:16:3e:aa:bb:cc").has_value());
}

TEST_CASE("MacAddress normalization", "[MacAddress]") {
    REQUIRE(MacAddress::normalize("aa-bb-cc-dd-ee-ff") == "AA:BB:CC:DD:EE:FF");
    REQUIRE(MacAddress::normalize("aabb.ccdd.eeff") == "AA:BB:CC:DD:EE:FF");
    REQUIRE_FALSE(MacAddress::normalize("aa:bb:cc:dd:ee").has_value());
    REQUIRE_FALSE(MacAddress::normalize("aa:bb:cc:dd:ee:ff:00").has_value());
}

TEST_CASE("MacAddress null detection", "[MacAddress]") {
    REQUIRE(MacAddress::isNull("00:00:00:00:00:00"));
    REQUIRE_FALSE(MacAddress::isNull("00:00:00:00:00:01"));
}
