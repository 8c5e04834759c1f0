// Copyright (c) 2026 changcheng967. All rights reserved.

#include <scout/core/url.hpp>
#include <idn2.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <vector>

namespace scout::core {

namespace {

enum class Component { path, query, fragment };

bool is_unreserved(unsigned char c) noexcept {
    return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~';
}

bool is_sub_delim(unsigned char c) noexcept {
    switch (c) {
        case '!': case '$': case '&': case '\'': case '(': case ')':
        case '*': case '+': case ',': case ';': case '=':
            return true;
        default:
            return false;
    }
}

bool is_allowed(unsigned char c, Component component) noexcept {
    if (is_unreserved(c) || is_sub_delim(c) || c == ':' || c == '@' || c == '/') {
        return true;
    }
    // '?' only starts the query; inside query and fragment it is data
    return c == '?' && component != Component::path;
}

bool is_hex(char c) noexcept {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

void append_escaped(std::string& out, unsigned char c) {
    constexpr char HEX[] = "0123456789ABCDEF";
    out += '%';
    out += HEX[c >> 4];
    out += HEX[c & 0x0F];
}

// Encode everything outside the component's character set, '%' included
std::string encode_component(std::string_view in, Component component) {
    std::string out;
    out.reserve(in.size());
    for (char ch : in) {
        auto c = static_cast<unsigned char>(ch);
        if (is_allowed(c, component)) {
            out += ch;
        } else {
            append_escaped(out, c);
        }
    }
    return out;
}

// Like encode_component, but keeps well-formed %XX escapes (upper-cased)
std::string normalize_component(std::string_view in, Component component) {
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        auto c = static_cast<unsigned char>(in[i]);
        if (c == '%' && i + 2 < in.size() && is_hex(in[i + 1]) && is_hex(in[i + 2])) {
            out += '%';
            out += static_cast<char>(std::toupper(static_cast<unsigned char>(in[i + 1])));
            out += static_cast<char>(std::toupper(static_cast<unsigned char>(in[i + 2])));
            i += 2;
        } else if (is_allowed(c, component)) {
            out += in[i];
        } else {
            append_escaped(out, c);
        }
    }
    return out;
}

std::string to_lower(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (char c : in) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

bool is_ascii(std::string_view in) noexcept {
    return std::all_of(in.begin(), in.end(), [](char c) {
        return static_cast<unsigned char>(c) < 0x80;
    });
}

bool valid_scheme(std::string_view scheme) noexcept {
    if (scheme.empty() || !std::isalpha(static_cast<unsigned char>(scheme.front()))) {
        return false;
    }
    return std::all_of(scheme.begin(), scheme.end(), [](char ch) {
        auto c = static_cast<unsigned char>(ch);
        return std::isalnum(c) || c == '+' || c == '-' || c == '.';
    });
}

std::expected<std::string, std::error_code> to_ascii_host(std::string_view host) {
    if (is_ascii(host)) {
        return to_lower(host);
    }

    char* ascii = nullptr;
    std::string input(host);
    int rc = idn2_to_ascii_8z(input.c_str(), &ascii, IDN2_NONTRANSITIONAL | IDN2_NFC_INPUT);
    if (rc != IDN2_OK || ascii == nullptr) {
        return std::unexpected(make_error_code(ScoutErrc::invalid_host));
    }
    std::string result(ascii);
    idn2_free(ascii);
    return to_lower(result);
}

// RFC 3986 section 5.2.4
std::string remove_dot_segments(std::string_view path) {
    std::vector<std::string_view> output;
    bool absolute = !path.empty() && path.front() == '/';
    bool trailing_slash = false;

    std::size_t pos = absolute ? 1 : 0;
    while (pos <= path.size()) {
        auto next = path.find('/', pos);
        auto segment = path.substr(pos, next == std::string_view::npos ? std::string_view::npos : next - pos);
        bool last = next == std::string_view::npos;

        if (segment == ".") {
            trailing_slash = last;
        } else if (segment == "..") {
            if (!output.empty()) {
                output.pop_back();
            }
            trailing_slash = last;
        } else {
            output.push_back(segment);
            trailing_slash = false;
        }

        if (last) break;
        pos = next + 1;
    }

    std::string result;
    if (absolute) result += '/';
    for (std::size_t i = 0; i < output.size(); ++i) {
        if (i > 0) result += '/';
        result += output[i];
    }
    if (trailing_slash && !result.empty() && result.back() != '/') {
        result += '/';
    }
    return result;
}

} // namespace

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) noexcept {
    try {
        Url url;

        // Parse scheme
        auto scheme_end = url_str.find("://");
        if (scheme_end == std::string_view::npos || !valid_scheme(url_str.substr(0, scheme_end))) {
            return std::unexpected(make_error_code(ScoutErrc::invalid_url));
        }
        url.scheme_ = to_lower(url_str.substr(0, scheme_end));

        auto rest_start = scheme_end + 3; // Skip "://"

        // The authority ends at the first of: /, ?, #, or end
        auto host_end = url_str.find_first_of("/?#", rest_start);
        if (host_end == std::string_view::npos) {
            host_end = url_str.length();
        }
        auto authority = url_str.substr(rest_start, host_end - rest_start);

        // userinfo (user:pass@) ends at the last '@' of the authority
        auto at_pos = authority.rfind('@');
        if (at_pos != std::string_view::npos) {
            url.userinfo_ = std::string(authority.substr(0, at_pos));
            authority.remove_prefix(at_pos + 1);
        }

        std::string_view host;
        std::string_view port;
        if (!authority.empty() && authority.front() == '[') {
            // IPv6 literal [::1]:port
            auto bracket_end = authority.find(']');
            if (bracket_end == std::string_view::npos) {
                return std::unexpected(make_error_code(ScoutErrc::invalid_url));
            }
            host = authority.substr(0, bracket_end + 1);
            auto after = authority.substr(bracket_end + 1);
            if (!after.empty()) {
                if (after.front() != ':') {
                    return std::unexpected(make_error_code(ScoutErrc::invalid_url));
                }
                port = after.substr(1);
            }
        } else {
            auto colon_pos = authority.rfind(':');
            if (colon_pos != std::string_view::npos) {
                host = authority.substr(0, colon_pos);
                port = authority.substr(colon_pos + 1);
            } else {
                host = authority;
            }
        }

        if (host.empty() || host.find_first_of(" \t\r\n") != std::string_view::npos) {
            return std::unexpected(make_error_code(ScoutErrc::invalid_url));
        }

        if (host.front() == '[') {
            url.host_ = to_lower(host);
        } else {
            auto ascii = to_ascii_host(host);
            if (!ascii) {
                return std::unexpected(ascii.error());
            }
            url.host_ = std::move(*ascii);
        }

        if (!port.empty()) {
            unsigned value = 0;
            auto [end, ec] = std::from_chars(port.data(), port.data() + port.size(), value);
            if (ec != std::errc{} || end != port.data() + port.size() || value > 65535) {
                return std::unexpected(make_error_code(ScoutErrc::invalid_url));
            }
            if (value != url.default_port()) {
                url.port_ = std::to_string(value);
            }
        }

        // Path, query and fragment
        auto rest = url_str.substr(host_end);
        auto fragment_start = rest.find('#');
        if (fragment_start != std::string_view::npos) {
            url.fragment_ = normalize_component(rest.substr(fragment_start + 1), Component::fragment);
            rest = rest.substr(0, fragment_start);
        }
        auto query_start = rest.find('?');
        if (query_start != std::string_view::npos) {
            url.query_ = normalize_component(rest.substr(query_start + 1), Component::query);
            rest = rest.substr(0, query_start);
        }

        url.path_ = rest.empty() ? std::string("/") : normalize_component(rest, Component::path);

        return url;
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(ScoutErrc::invalid_url));
    }
}

std::string Url::full() const {
    std::string result = base();
    result += path_;
    if (!query_.empty()) {
        result += "?";
        result += query_;
    }
    if (!fragment_.empty()) {
        result += "#";
        result += fragment_;
    }
    return result;
}

std::string Url::base() const {
    std::string result = scheme_;
    result += "://";
    if (!userinfo_.empty()) {
        result += userinfo_;
        result += "@";
    }
    result += host_;
    if (!port_.empty()) {
        result += ":";
        result += port_;
    }
    return result;
}

std::uint16_t Url::default_port() const noexcept {
    if (scheme_ == "http") return 80;
    if (scheme_ == "https") return 443;
    if (scheme_ == "ftp") return 21;
    return 0;
}

std::string Url::bare_host() const {
    if (host_.size() >= 2 && host_.front() == '[' && host_.back() == ']') {
        return host_.substr(1, host_.size() - 2);
    }
    return host_;
}

Url Url::resolve(std::string_view reference) const {
    Url target = *this;
    target.fragment_.clear();

    auto ref = reference;
    auto fragment_start = ref.find('#');
    if (fragment_start != std::string_view::npos) {
        target.fragment_ = normalize_component(ref.substr(fragment_start + 1), Component::fragment);
        ref = ref.substr(0, fragment_start);
    }

    std::string_view ref_path = ref;
    std::string_view ref_query;
    bool has_query = false;
    auto query_start = ref.find('?');
    if (query_start != std::string_view::npos) {
        ref_path = ref.substr(0, query_start);
        ref_query = ref.substr(query_start + 1);
        has_query = true;
    }

    if (ref_path.empty()) {
        if (has_query) {
            target.query_ = normalize_component(ref_query, Component::query);
        }
        return target;
    }

    target.query_ = has_query ? normalize_component(ref_query, Component::query) : std::string();

    std::string merged;
    if (ref_path.front() == '/') {
        merged = std::string(ref_path);
    } else {
        // Merge with the directory of the current path
        auto last_slash = path_.rfind('/');
        merged = last_slash == std::string::npos ? std::string("/") : path_.substr(0, last_slash + 1);
        merged += ref_path;
    }

    target.path_ = normalize_component(remove_dot_segments(merged), Component::path);
    if (target.path_.empty()) {
        target.path_ = "/";
    }
    return target;
}

std::string Url::encode_reference(std::string_view reference) {
    auto query_start = reference.find('?');
    if (query_start == std::string_view::npos) {
        return encode_component(reference, Component::path);
    }
    return encode_component(reference.substr(0, query_start), Component::path)
         + "?"
         + encode_component(reference.substr(query_start + 1), Component::query);
}

} // namespace scout::core
