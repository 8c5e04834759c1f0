// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <scout/core/request_options.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <expected>

namespace scout::cli {

// CLI result
using CliResult = std::expected<int, std::error_code>;

// Command line arguments
struct CliArgs {
    std::vector<std::string> urls;
    std::string config_file;
    std::optional<double> timeout_sec;
    std::string proxy;
    std::string user_agent;
    bool verbose{false};
    bool version{false};
    bool help{false};
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

// Options from the config file (if any) with command line values on top
[[nodiscard]] std::expected<core::RequestOptions, std::error_code>
build_options(const CliArgs& args) noexcept;

// Probe a single target and print the report
[[nodiscard]] CliResult check(const std::string& url,
                              const core::RequestOptions& options) noexcept;

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace scout::cli
