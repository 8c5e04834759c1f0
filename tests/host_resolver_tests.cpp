// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <scout/core/host_resolver.hpp>

using namespace scout::core;

TEST_CASE("resolve_address", "[resolver]") {
    SECTION("IPv4 literal") {
        auto result = resolve_address("127.0.0.1");
        REQUIRE(result.has_value());
        CHECK(*result == "127.0.0.1");
    }

    SECTION("IPv6 literal") {
        auto result = resolve_address("::1");
        REQUIRE(result.has_value());
        CHECK(*result == "::1");
    }

    SECTION("Reserved TLD never resolves") {
        auto result = resolve_address("lab.invalid");
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == ScoutErrc::resolve_failed);
    }

    SECTION("Empty host") {
        CHECK_FALSE(resolve_address("").has_value());
    }
}
