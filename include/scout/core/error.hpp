// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string_view>

namespace scout::core {

enum class ScoutErrc {
    success = 0,
    invalid_url,
    invalid_host,
    network_error,
    timeout,
    refused,
    dns_error,
    ssl_error,
    too_many_redirects,
    file_too_large,
    resolve_failed,
    invalid_config,
};

namespace detail {

struct ScoutErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "scout::core";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<ScoutErrc>(ev)) {
            case ScoutErrc::success:              return "Success";
            case ScoutErrc::invalid_url:          return "Invalid URL";
            case ScoutErrc::invalid_host:         return "Host cannot be converted to ASCII";
            case ScoutErrc::network_error:        return "Network error";
            case ScoutErrc::timeout:              return "Operation timed out";
            case ScoutErrc::refused:              return "Connection refused";
            case ScoutErrc::dns_error:            return "DNS resolution failed";
            case ScoutErrc::ssl_error:            return "SSL/TLS error";
            case ScoutErrc::too_many_redirects:   return "Too many redirects";
            case ScoutErrc::file_too_large:       return "Response exceeds maximum file size";
            case ScoutErrc::resolve_failed:       return "Host address lookup failed";
            case ScoutErrc::invalid_config:       return "Invalid configuration";
            default:                              return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::ScoutErrcCategory& scout_errc_category() noexcept {
    static detail::ScoutErrcCategory category;
    return category;
}

inline std::error_code make_error_code(ScoutErrc e) noexcept {
    return {static_cast<int>(e), scout_errc_category()};
}

} // namespace scout::core

namespace std {

template<>
struct is_error_code_enum<scout::core::ScoutErrc> : true_type {};

} // namespace std
