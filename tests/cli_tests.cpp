// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <scout/cli/commands.hpp>
#include <scout/version.hpp>
#include <cmath>
#include <string>
#include <vector>

using namespace scout::cli;
using namespace scout::core;

namespace {

CliArgs parse(std::vector<std::string> words) {
    words.insert(words.begin(), "scout");
    std::vector<char*> argv;
    for (auto& word : words) argv.push_back(word.data());
    argv.push_back(nullptr);
    return parse_args(static_cast<int>(words.size()), argv.data());
}

} // namespace

TEST_CASE("parse_args", "[cli]") {
    SECTION("Every non-option argument is a URL") {
        auto args = parse({"e.org", "HTTPS://e.org", "http://a.org/"});
        CHECK(args.urls == std::vector<std::string>{"e.org", "HTTPS://e.org", "http://a.org/"});
    }

    SECTION("Option values are not taken as URLs") {
        auto args = parse({"-c", "opts.json", "--proxy", "http://127.0.0.1:8080",
                           "--user-agent", "agent", "-t", "2.5", "-V", "http://e.org"});
        CHECK(args.urls == std::vector<std::string>{"http://e.org"});
        CHECK(args.config_file == "opts.json");
        CHECK(args.proxy == "http://127.0.0.1:8080");
        CHECK(args.user_agent == "agent");
        CHECK(args.timeout_sec == 2.5);
        CHECK(args.verbose);
    }

    SECTION("Unparsable timeout is kept as NaN") {
        auto args = parse({"-t", "soon", "http://e.org"});
        REQUIRE(args.timeout_sec.has_value());
        CHECK(std::isnan(*args.timeout_sec));
    }

    SECTION("Help stops parsing") {
        auto args = parse({"-h", "http://e.org"});
        CHECK(args.help);
        CHECK(args.urls.empty());
    }
}

TEST_CASE("build_options", "[cli]") {
    SECTION("Command line values become overrides") {
        auto args = parse({"-t", "1.5", "--user-agent", "agent", "http://e.org"});
        auto options = build_options(args);
        REQUIRE(options.has_value());
        CHECK(options->timeout == std::chrono::milliseconds(1500));
        CHECK(options->user_agent == "agent");
        CHECK_FALSE(options->proxy.has_value());
    }

    SECTION("Invalid timeouts are rejected") {
        auto text = GENERATE(as<std::string>{}, "-5", "1e300", "soon");
        auto options = build_options(parse({"-t", text, "http://e.org"}));
        REQUIRE_FALSE(options.has_value());
        CHECK(options.error() == ScoutErrc::invalid_config);
    }

    SECTION("Missing config file is an error") {
        auto options = build_options(parse({"-c", "non_existent_scout_cli.json", "http://e.org"}));
        REQUIRE_FALSE(options.has_value());
        CHECK(options.error() == ScoutErrc::invalid_config);
    }
}

TEST_CASE("check rejects malformed URLs", "[cli]") {
    auto url = GENERATE(as<std::string>{}, "e.org", "jj");
    auto result = check(url, RequestOptions{});
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error() == ScoutErrc::invalid_url);
}

TEST_CASE("Version string", "[cli]") {
    CHECK(scout::version.to_string() == "0.1.0");
}
