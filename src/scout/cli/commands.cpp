// Copyright (c) 2026 changcheng967. All rights reserved.

#include <scout/cli/commands.hpp>
#include <scout/core/error.hpp>
#include <scout/core/target.hpp>
#include <scout/version.hpp>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <limits>

using namespace scout::core;

namespace scout::cli {

namespace {

const char* yes_no(bool value) noexcept {
    return value ? "yes" : "no";
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }
        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 < argc) {
                args.config_file = argv[++i];
            }
        } else if (arg == "-t" || arg == "--timeout") {
            if (i + 1 < argc) {
                char* end = nullptr;
                const char* text = argv[++i];
                double seconds = std::strtod(text, &end);
                // Unparsable text is left for build_options to reject
                args.timeout_sec = (end == text || *end != '\0')
                    ? std::numeric_limits<double>::quiet_NaN() : seconds;
            }
        } else if (arg == "--proxy") {
            if (i + 1 < argc) {
                args.proxy = argv[++i];
            }
        } else if (arg == "--user-agent") {
            if (i + 1 < argc) {
                args.user_agent = argv[++i];
            }
        } else if (!arg.starts_with('-')) {
            // Everything else is a URL, Target::create validates it
            args.urls.push_back(arg);
        }
    }

    return args;
}

std::expected<RequestOptions, std::error_code> build_options(const CliArgs& args) noexcept {
    try {
        RequestOptions options;
        if (!args.config_file.empty()) {
            auto loaded = load_options(args.config_file);
            if (!loaded) {
                return std::unexpected(loaded.error());
            }
            options = std::move(*loaded);
        }

        RequestOptions overrides;
        if (args.timeout_sec) {
            auto timeout = seconds_to_duration(*args.timeout_sec);
            if (!timeout) {
                return std::unexpected(timeout.error());
            }
            overrides.timeout = *timeout;
        }
        if (!args.proxy.empty()) {
            overrides.proxy = args.proxy;
        }
        if (!args.user_agent.empty()) {
            overrides.user_agent = args.user_agent;
        }

        return options.merged_with(overrides);
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(ScoutErrc::invalid_config));
    }
}

//=============================================================================
// Commands
//=============================================================================

CliResult check(const std::string& url, const RequestOptions& options) noexcept {
    try {
        auto created = Target::create(url, options);
        if (!created) {
            std::cout << "Error: Invalid URL: " << created.error().message() << std::endl;
            return std::unexpected(created.error());
        }
        auto& target = **created;

        std::cout << "URL:            " << target.url() << std::endl;
        std::cout << "Address:        " << target.ip() << std::endl;

        if (!target.is_online()) {
            std::cout << "Online:         no" << std::endl;
            return 1;
        }

        std::cout << "Online:         yes" << std::endl;
        std::cout << "HTTP auth:      " << yes_no(target.requires_http_auth()) << std::endl;
        std::cout << "Forbidden:      " << yes_no(target.is_forbidden()) << std::endl;
        std::cout << "Proxy auth:     " << yes_no(target.requires_proxy_auth()) << std::endl;

        if (auto redirect = target.redirection()) {
            std::cout << "Redirects to:   " << *redirect << std::endl;
        }

        const auto& plan = target.standing_method();
        std::cout << "Probe method:   " << to_string(plan.method);
        if (plan.max_file_size) {
            std::cout << " (max " << *plan.max_file_size << " bytes)";
        }
        std::cout << std::endl;

        const auto& baseline = target.not_found_baseline();
        std::cout << "404 baseline:   " << target.not_found_url() << " -> "
                  << baseline.status_code << " (" << baseline.body.size() << " bytes)" << std::endl;

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return std::unexpected(make_error_code(ScoutErrc::network_error));
    }
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "Usage: " << program_name << " [options] <url>...\n\n"
              << "Probe web targets: reachability, authentication, HEAD support\n"
              << "and the not-found baseline.\n\n"
              << "Options:\n"
              << "  -c, --config <file>    JSON request options\n"
              << "  -t, --timeout <sec>    Request timeout\n"
              << "      --proxy <url>      Proxy to use\n"
              << "      --user-agent <ua>  User-Agent header\n"
              << "  -V, --verbose          Debug logging\n"
              << "  -v, --version          Show version\n"
              << "  -h, --help             Show this help\n";
}

void print_version() noexcept {
    std::cout << "scout " << scout::version.to_string()
              << " (built " << scout::BUILD_DATE << " " << scout::BUILD_TIME << ")" << std::endl;
}

} // namespace scout::cli
