// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <scout/core/error.hpp>
#include <nlohmann/json_fwd.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace scout::core {

// Transport-level request options. The Target never interprets these, it
// only forwards them. Unset fields fall back to the transport defaults in
// scout/core/config.hpp.
struct RequestOptions {
    std::optional<std::chrono::milliseconds> timeout;
    std::optional<std::chrono::milliseconds> connect_timeout;
    std::optional<std::string> proxy;          // scheme://host:port
    std::optional<std::string> proxy_auth;     // user:password
    std::optional<std::string> http_auth;      // user:password
    std::optional<std::string> user_agent;
    std::optional<std::string> cookie;
    std::map<std::string, std::string> headers;
    std::map<std::string, std::string> params; // appended as query string
    std::optional<bool> verify_tls;
    std::optional<bool> follow_location;
    std::optional<std::uint32_t> max_redirects;
    std::optional<std::uint64_t> max_file_size;

    // Layer `overrides` on top of this. Set scalar fields replace, map fields
    // merge key-wise with the override winning.
    [[nodiscard]] RequestOptions merged_with(const RequestOptions& overrides) const;

    bool operator==(const RequestOptions&) const = default;
};

// Convert a duration in seconds. Negative, non-finite and out-of-range values
// are invalid_config.
[[nodiscard]] std::expected<std::chrono::milliseconds, std::error_code>
seconds_to_duration(double seconds) noexcept;

// Read options from a JSON object. Durations are in seconds.
[[nodiscard]] std::expected<RequestOptions, std::error_code>
options_from_json(const nlohmann::json& j) noexcept;

// Read options from a JSON file
[[nodiscard]] std::expected<RequestOptions, std::error_code>
load_options(std::string_view path) noexcept;

} // namespace scout::core
