// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <cstddef>
#include <string_view>

namespace scout::core {

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t MAX_REDIRECTS = 10;

constexpr std::string_view DEFAULT_USER_AGENT = "scout/0.1";

// Random file name used to capture the not-found baseline: <token>.html
constexpr std::size_t NOT_FOUND_TOKEN_LENGTH = 6;
constexpr std::string_view NOT_FOUND_EXTENSION = ".html";

// Byte cap for probes once HEAD has been found unreliable
constexpr std::uint64_t GET_FALLBACK_MAX_FILE_SIZE = 1;

constexpr std::string_view UNKNOWN_ADDRESS = "Unknown";

} // namespace scout::core
