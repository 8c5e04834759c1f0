// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <scout/core/error.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <expected>

namespace scout::core {

// Absolute URL in normalized form.
//
// parse() lower-cases scheme and host, converts internationalized host labels
// to their ASCII-compatible (punycode) form, drops the scheme's default port,
// turns an empty path into "/" and normalizes percent-encoding of the path,
// query and fragment. Instances are immutable values.
class Url {
public:
    static std::expected<Url, std::error_code> parse(std::string_view url_str) noexcept;

    [[nodiscard]] std::string_view scheme() const noexcept { return scheme_; }
    [[nodiscard]] std::string_view userinfo() const noexcept { return userinfo_; }
    [[nodiscard]] std::string_view host() const noexcept { return host_; }
    [[nodiscard]] std::string_view port() const noexcept { return port_; }
    [[nodiscard]] std::string_view path() const noexcept { return path_; }
    [[nodiscard]] std::string_view query() const noexcept { return query_; }
    [[nodiscard]] std::string_view fragment() const noexcept { return fragment_; }

    [[nodiscard]] std::string full() const;
    [[nodiscard]] std::string base() const;  // scheme://host[:port]
    [[nodiscard]] bool is_secure() const noexcept { return scheme_ == "https"; }

    [[nodiscard]] std::uint16_t default_port() const noexcept;

    // Host without the brackets of an IPv6 literal, suitable for lookups
    [[nodiscard]] std::string bare_host() const;

    // Resolve a path reference against this URL (RFC 3986 section 5.2, with
    // the reference always taken as a path, never as scheme or authority).
    // A reference starting with '/' replaces the whole path; any other
    // reference is merged with the directory of the current path.
    // The reference is expected to be encoded already (see encode_reference).
    [[nodiscard]] Url resolve(std::string_view reference) const;

    // Percent-encode a caller supplied path (with optional "?query") so it
    // can be used as a reference. '%', ' ' and '#' are always encoded.
    [[nodiscard]] static std::string encode_reference(std::string_view reference);

    Url() = default;

private:
    std::string scheme_;
    std::string userinfo_;
    std::string host_;
    std::string port_;
    std::string path_;
    std::string query_;
    std::string fragment_;
};

} // namespace scout::core
