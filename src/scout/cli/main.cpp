// Copyright (c) 2026 changcheng967. All rights reserved.

#include <scout/cli/commands.hpp>
#include <scout/core/http_session.hpp>
#include <spdlog/spdlog.h>
#include <iostream>

using namespace scout::cli;

int main(int argc, char* argv[]) {
    // Parse arguments
    CliArgs args = parse_args(argc, argv);

    // Handle help
    if (args.help) {
        print_help(argv[0]);
        return 0;
    }

    // Handle version
    if (args.version) {
        print_version();
        return 0;
    }

    // Need at least one URL
    if (args.urls.empty()) {
        std::cerr << "Error: No URL specified" << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return 1;
    }

    spdlog::set_level(args.verbose ? spdlog::level::debug : spdlog::level::warn);

    auto options = build_options(args);
    if (!options) {
        std::cerr << "Error: " << options.error().message() << std::endl;
        return 1;
    }

    scout::core::HttpSession::global_init();

    int exit_code = 0;
    for (const auto& url : args.urls) {
        if (args.urls.size() > 1) {
            std::cout << "== " << url << std::endl;
        }

        auto result = check(url, *options);
        if (!result || *result != 0) {
            exit_code = 1;
        }
    }

    scout::core::HttpSession::global_cleanup();
    return exit_code;
}
