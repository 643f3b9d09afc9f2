// Copyright (c) 2025 The LanSync Developers
// Distributed under the MIT software license

// Unit tests for network address utilities
#include <catch2/catch_test_macros.hpp>
#include "util/netaddress.hpp"

using namespace lansync::util;

TEST_CASE("ValidateAndNormalizeIP - normalization", "[util][netaddress]") {
    SECTION("IPv4 passes through") {
        auto result = ValidateAndNormalizeIP("192.168.1.1");
        REQUIRE(result.has_value());
        REQUIRE(*result == "192.168.1.1");
    }

    SECTION("IPv6 is compressed") {
        auto result = ValidateAndNormalizeIP("2001:0db8:0000:0000:0000:0000:0000:0001");
        REQUIRE(result.has_value());
        REQUIRE(*result == "2001:db8::1");
    }

    SECTION("IPv4-mapped IPv6 becomes IPv4") {
        auto result = ValidateAndNormalizeIP("::ffff:10.0.0.7");
        REQUIRE(result.has_value());
        REQUIRE(*result == "10.0.0.7");
    }

    SECTION("Malformed input and hostnames are rejected") {
        REQUIRE_FALSE(ValidateAndNormalizeIP("").has_value());
        REQUIRE_FALSE(ValidateAndNormalizeIP("256.1.1.1").has_value());
        REQUIRE_FALSE(ValidateAndNormalizeIP("1.1.1").has_value());
        REQUIRE_FALSE(ValidateAndNormalizeIP("gggg::1").has_value());
        REQUIRE_FALSE(ValidateAndNormalizeIP("localhost").has_value());
    }
}

TEST_CASE("SubnetPrefix - /24 of an IPv4 address", "[util][netaddress]") {
    SECTION("Typical LAN addresses") {
        REQUIRE(SubnetPrefix("10.0.0.5") == std::optional<std::string>("10.0.0"));
        REQUIRE(SubnetPrefix("192.168.1.254") == std::optional<std::string>("192.168.1"));
        REQUIRE(SubnetPrefix("127.0.0.9") == std::optional<std::string>("127.0.0"));
    }

    SECTION("Host part does not matter") {
        REQUIRE(SubnetPrefix("172.16.4.0") == SubnetPrefix("172.16.4.255"));
    }

    SECTION("Not IPv4") {
        REQUIRE_FALSE(SubnetPrefix("::1").has_value());
        REQUIRE_FALSE(SubnetPrefix("::ffff:10.0.0.5").has_value());
        REQUIRE_FALSE(SubnetPrefix("").has_value());
        REQUIRE_FALSE(SubnetPrefix("10.0.0").has_value());
        REQUIRE_FALSE(SubnetPrefix("10.0.0.256").has_value());
    }
}
