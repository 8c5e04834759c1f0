// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <scout/core/request_options.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <limits>

using namespace scout::core;
using namespace std::chrono_literals;

namespace fs = std::filesystem;

TEST_CASE("RequestOptions::merged_with", "[options]") {
    RequestOptions base;
    base.timeout = 10s;
    base.user_agent = "base-agent";
    base.headers = {{"Accept", "*/*"}, {"X-Scan", "1"}};

    SECTION("Unset override fields keep the base values") {
        auto merged = base.merged_with(RequestOptions{});
        CHECK(merged == base);
    }

    SECTION("Set override fields win") {
        RequestOptions overrides;
        overrides.timeout = 2s;
        overrides.max_file_size = 1;

        auto merged = base.merged_with(overrides);
        CHECK(merged.timeout == std::chrono::milliseconds(2000));
        CHECK(merged.user_agent == "base-agent");
        CHECK(merged.max_file_size == 1u);
    }

    SECTION("Headers merge key-wise") {
        RequestOptions overrides;
        overrides.headers = {{"X-Scan", "2"}, {"Key", "Hello"}};

        auto merged = base.merged_with(overrides);
        CHECK(merged.headers.size() == 3);
        CHECK(merged.headers.at("Accept") == "*/*");
        CHECK(merged.headers.at("X-Scan") == "2");
        CHECK(merged.headers.at("Key") == "Hello");
    }
}

TEST_CASE("options_from_json", "[options]") {
    SECTION("All recognized fields") {
        auto j = nlohmann::json::parse(R"({
            "timeout": 1.5,
            "connect_timeout": 3,
            "proxy": "http://127.0.0.1:8080",
            "proxy_auth": "p:q",
            "http_auth": "u:v",
            "user_agent": "scanner",
            "cookie": "a=b",
            "verify_tls": false,
            "follow_location": true,
            "max_redirects": 5,
            "max_file_size": 1024,
            "headers": {"Key": "Hello"},
            "params": {"k": "value"}
        })");

        auto result = options_from_json(j);
        REQUIRE(result.has_value());
        CHECK(result->timeout == std::chrono::milliseconds(1500));
        CHECK(result->connect_timeout == std::chrono::milliseconds(3000));
        CHECK(result->proxy == "http://127.0.0.1:8080");
        CHECK(result->proxy_auth == "p:q");
        CHECK(result->http_auth == "u:v");
        CHECK(result->user_agent == "scanner");
        CHECK(result->cookie == "a=b");
        CHECK(result->verify_tls == false);
        CHECK(result->follow_location == true);
        CHECK(result->max_redirects == 5u);
        CHECK(result->max_file_size == 1024u);
        CHECK(result->headers.at("Key") == "Hello");
        CHECK(result->params.at("k") == "value");
    }

    SECTION("Empty object gives default options") {
        auto result = options_from_json(nlohmann::json::object());
        REQUIRE(result.has_value());
        CHECK(*result == RequestOptions{});
    }

    SECTION("Wrong types are rejected") {
        auto result = options_from_json(nlohmann::json::parse(R"({"timeout": "soon"})"));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == ScoutErrc::invalid_config);

        CHECK_FALSE(options_from_json(nlohmann::json::parse(R"({"headers": ["a"]})")).has_value());
        CHECK_FALSE(options_from_json(nlohmann::json::array()).has_value());
    }

    SECTION("Out-of-range durations are rejected") {
        auto text = GENERATE(as<std::string>{}, R"({"timeout": -5})", R"({"timeout": 1e300})",
                             R"({"connect_timeout": -0.5})", R"({"connect_timeout": 1e300})");
        auto result = options_from_json(nlohmann::json::parse(text));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == ScoutErrc::invalid_config);
    }
}

TEST_CASE("seconds_to_duration", "[options]") {
    CHECK(seconds_to_duration(0.0) == std::chrono::milliseconds(0));
    CHECK(seconds_to_duration(2.25) == std::chrono::milliseconds(2250));

    CHECK_FALSE(seconds_to_duration(-1.0).has_value());
    CHECK_FALSE(seconds_to_duration(1e300).has_value());
    CHECK_FALSE(seconds_to_duration(std::numeric_limits<double>::infinity()).has_value());
    CHECK_FALSE(seconds_to_duration(std::numeric_limits<double>::quiet_NaN()).has_value());
}

TEST_CASE("load_options", "[options]") {
    const std::string config_file = "test_scout_options.json";
    if (fs::exists(config_file)) fs::remove(config_file);

    SECTION("Reads a config file") {
        std::ofstream(config_file) << R"({"user_agent": "from-file", "timeout": 2})";

        auto result = load_options(config_file);
        REQUIRE(result.has_value());
        CHECK(result->user_agent == "from-file");
        CHECK(result->timeout == std::chrono::milliseconds(2000));
    }

    SECTION("Malformed JSON is an error") {
        std::ofstream(config_file) << "{not json";

        auto result = load_options(config_file);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == ScoutErrc::invalid_config);
    }

    SECTION("Missing file is an error") {
        CHECK_FALSE(load_options("non_existent_scout_options.json").has_value());
    }

    if (fs::exists(config_file)) fs::remove(config_file);
}
