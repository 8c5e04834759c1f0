// Copyright (c) 2026 changcheng967. All rights reserved.

#include <scout/core/request_options.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cmath>
#include <fstream>
#include <limits>

namespace scout::core {

namespace {

template<typename T>
void override_if_set(std::optional<T>& field, const std::optional<T>& value) {
    if (value) {
        field = value;
    }
}

} // namespace

std::expected<std::chrono::milliseconds, std::error_code>
seconds_to_duration(double seconds) noexcept {
    // curl takes the millisecond count as a long
    constexpr double max_ms = static_cast<double>(std::numeric_limits<long>::max());
    if (!std::isfinite(seconds) || seconds < 0.0 || seconds * 1000.0 >= max_ms) {
        return std::unexpected(make_error_code(ScoutErrc::invalid_config));
    }
    return std::chrono::milliseconds(static_cast<std::int64_t>(seconds * 1000.0));
}

RequestOptions RequestOptions::merged_with(const RequestOptions& overrides) const {
    RequestOptions result = *this;

    override_if_set(result.timeout, overrides.timeout);
    override_if_set(result.connect_timeout, overrides.connect_timeout);
    override_if_set(result.proxy, overrides.proxy);
    override_if_set(result.proxy_auth, overrides.proxy_auth);
    override_if_set(result.http_auth, overrides.http_auth);
    override_if_set(result.user_agent, overrides.user_agent);
    override_if_set(result.cookie, overrides.cookie);
    override_if_set(result.verify_tls, overrides.verify_tls);
    override_if_set(result.follow_location, overrides.follow_location);
    override_if_set(result.max_redirects, overrides.max_redirects);
    override_if_set(result.max_file_size, overrides.max_file_size);

    for (const auto& [key, value] : overrides.headers) {
        result.headers[key] = value;
    }
    for (const auto& [key, value] : overrides.params) {
        result.params[key] = value;
    }

    return result;
}

std::expected<RequestOptions, std::error_code>
options_from_json(const nlohmann::json& j) noexcept {
    try {
        if (!j.is_object()) {
            return std::unexpected(make_error_code(ScoutErrc::invalid_config));
        }

        RequestOptions opts;

        if (j.contains("timeout")) {
            auto timeout = seconds_to_duration(j["timeout"].get<double>());
            if (!timeout) {
                spdlog::debug("Rejected timeout {}", j["timeout"].dump());
                return std::unexpected(timeout.error());
            }
            opts.timeout = *timeout;
        }

        if (j.contains("connect_timeout")) {
            auto connect_timeout = seconds_to_duration(j["connect_timeout"].get<double>());
            if (!connect_timeout) {
                spdlog::debug("Rejected connect_timeout {}", j["connect_timeout"].dump());
                return std::unexpected(connect_timeout.error());
            }
            opts.connect_timeout = *connect_timeout;
        }

        if (j.contains("proxy")) {
            opts.proxy = j["proxy"].get<std::string>();
        }

        if (j.contains("proxy_auth")) {
            opts.proxy_auth = j["proxy_auth"].get<std::string>();
        }

        if (j.contains("http_auth")) {
            opts.http_auth = j["http_auth"].get<std::string>();
        }

        if (j.contains("user_agent")) {
            opts.user_agent = j["user_agent"].get<std::string>();
        }

        if (j.contains("cookie")) {
            opts.cookie = j["cookie"].get<std::string>();
        }

        if (j.contains("verify_tls")) {
            opts.verify_tls = j["verify_tls"].get<bool>();
        }

        if (j.contains("follow_location")) {
            opts.follow_location = j["follow_location"].get<bool>();
        }

        if (j.contains("max_redirects")) {
            opts.max_redirects = j["max_redirects"].get<std::uint32_t>();
        }

        if (j.contains("max_file_size")) {
            opts.max_file_size = j["max_file_size"].get<std::uint64_t>();
        }

        if (j.contains("headers")) {
            if (!j["headers"].is_object()) {
                return std::unexpected(make_error_code(ScoutErrc::invalid_config));
            }
            for (auto& [key, value] : j["headers"].items()) {
                opts.headers[key] = value.get<std::string>();
            }
        }

        if (j.contains("params")) {
            if (!j["params"].is_object()) {
                return std::unexpected(make_error_code(ScoutErrc::invalid_config));
            }
            for (auto& [key, value] : j["params"].items()) {
                opts.params[key] = value.get<std::string>();
            }
        }

        return opts;
    } catch (const std::exception& e) {
        spdlog::debug("Rejected request options: {}", e.what());
        return std::unexpected(make_error_code(ScoutErrc::invalid_config));
    }
}

std::expected<RequestOptions, std::error_code>
load_options(std::string_view path) noexcept {
    try {
        std::ifstream file{std::string(path)};
        if (!file) {
            spdlog::warn("Cannot open config file {}", path);
            return std::unexpected(make_error_code(ScoutErrc::invalid_config));
        }

        auto j = nlohmann::json::parse(file);
        return options_from_json(j);
    } catch (const std::exception& e) {
        spdlog::warn("Cannot parse config file {}: {}", path, e.what());
        return std::unexpected(make_error_code(ScoutErrc::invalid_config));
    }
}

} // namespace scout::core
