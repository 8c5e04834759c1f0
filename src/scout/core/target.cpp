// Copyright (c) 2026 changcheng967. All rights reserved.

#include <scout/core/target.hpp>
#include <scout/core/config.hpp>
#include <scout/core/host_resolver.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <random>

namespace scout::core {

namespace {

constexpr std::int32_t HTTP_MOVED_PERMANENTLY = 301;
constexpr std::int32_t HTTP_FOUND = 302;
constexpr std::int32_t HTTP_UNAUTHORIZED = 401;
constexpr std::int32_t HTTP_FORBIDDEN = 403;
constexpr std::int32_t HTTP_METHOD_NOT_ALLOWED = 405;
constexpr std::int32_t HTTP_PROXY_AUTH_REQUIRED = 407;
constexpr std::int32_t HTTP_NOT_IMPLEMENTED = 501;

std::string random_token(std::size_t length) {
    static constexpr std::string_view ALPHABET = "abcdefghijklmnopqrstuvwxyz0123456789";

    std::random_device device;
    std::mt19937 engine(device());
    std::uniform_int_distribution<std::size_t> pick(0, ALPHABET.size() - 1);

    std::string token;
    token.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        token += ALPHABET[pick(engine)];
    }
    return token;
}

} // namespace

Target::Target(RequestOptions options, std::shared_ptr<HttpTransport> transport)
    : options_(std::move(options))
    , transport_(transport ? std::move(transport) : std::make_shared<HttpSession>()) {}

Target::~Target() = default;

std::expected<std::unique_ptr<Target>, std::error_code>
Target::create(std::string_view url_str,
               RequestOptions options,
               std::shared_ptr<HttpTransport> transport) noexcept {
    try {
        std::unique_ptr<Target> target(new Target(std::move(options), std::move(transport)));
        auto result = target->set_url(url_str);
        if (!result) {
            return std::unexpected(result.error());
        }
        return target;
    } catch (const std::exception& e) {
        spdlog::error("Cannot create target for {}: {}", url_str, e.what());
        return std::unexpected(make_error_code(ScoutErrc::invalid_url));
    }
}

std::expected<void, std::error_code> Target::set_url(std::string_view url_str) noexcept {
    auto parsed = Url::parse(url_str);
    if (!parsed) {
        return std::unexpected(parsed.error());
    }

    try {
        std::string raw(url_str);
        uri_ = std::move(*parsed);
        raw_url_ = std::move(raw);
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(ScoutErrc::invalid_url));
    }
    return {};
}

std::string Target::url(std::string_view path) const {
    if (path.empty()) {
        return uri_.full();
    }
    return uri_.resolve(Url::encode_reference(path)).full();
}

std::string Target::ip() const {
    auto address = resolve_address(uri_.bare_host());
    if (!address) {
        spdlog::debug("No address for {}: {}", uri_.host(), address.error().message());
        return std::string(UNKNOWN_ADDRESS);
    }
    return *address;
}

//=============================================================================
// Memoized probes
//=============================================================================

const std::string& Target::not_found_url() {
    std::lock_guard<std::mutex> lock(not_found_url_mutex_);
    if (!not_found_url_) {
        not_found_url_ = url(random_token(NOT_FOUND_TOKEN_LENGTH) + std::string(NOT_FOUND_EXTENSION));
    }
    return *not_found_url_;
}

const HttpResponse& Target::not_found_baseline() {
    std::lock_guard<std::mutex> lock(baseline_mutex_);
    if (!baseline_) {
        RequestOptions follow;
        follow.follow_location = true;

        baseline_ = get(not_found_url(), follow);
        spdlog::debug("Not-found baseline for {}: {} ({} bytes)",
                      uri_.full(), baseline_->status_code, baseline_->body.size());
    }
    return *baseline_;
}

const HttpResponse& Target::homepage_response() {
    std::lock_guard<std::mutex> lock(homepage_mutex_);
    if (!homepage_) {
        RequestOptions follow;
        follow.follow_location = true;

        homepage_ = get(homepage_url(), follow);
    }
    return *homepage_;
}

const RequestPlan& Target::standing_method() {
    std::lock_guard<std::mutex> lock(plan_mutex_);
    if (!plan_) {
        auto status = head(homepage_url()).status_code;

        if (status == 0 || status == HTTP_METHOD_NOT_ALLOWED || status == HTTP_NOT_IMPLEMENTED) {
            plan_ = RequestPlan{HttpMethod::get, GET_FALLBACK_MAX_FILE_SIZE};
            spdlog::debug("HEAD unusable on {} (status {}), probing with GET", uri_.full(), status);
        } else {
            plan_ = RequestPlan{HttpMethod::head, std::nullopt};
            spdlog::debug("HEAD usable on {} (status {})", uri_.full(), status);
        }
    }
    return *plan_;
}

//=============================================================================
// Reachability and access checks
//=============================================================================

bool Target::is_online(std::string_view path) {
    // Any answer counts, server errors included
    return status_of(path) != 0;
}

bool Target::requires_http_auth(std::string_view path) {
    return status_of(path) == HTTP_UNAUTHORIZED;
}

bool Target::is_forbidden(std::string_view path) {
    return status_of(path) == HTTP_FORBIDDEN;
}

bool Target::requires_proxy_auth(std::string_view path) {
    return status_of(path) == HTTP_PROXY_AUTH_REQUIRED;
}

std::optional<std::string> Target::redirection(std::string_view path) {
    const std::string target = url(path);

    auto status = get(target).status_code;
    if (status != HTTP_MOVED_PERMANENTLY && status != HTTP_FOUND) {
        return std::nullopt;
    }

    RequestOptions follow;
    follow.follow_location = true;
    follow.max_redirects = MAX_REDIRECTS;

    auto followed = get(target, follow);
    if (followed.effective_url.empty() || followed.effective_url == target) {
        return std::nullopt;
    }
    return followed.effective_url;
}

//=============================================================================
// Adaptive HEAD/GET
//=============================================================================

HttpResponse Target::probe(std::string_view path,
                           const StatusCodes& accepted_codes,
                           const RequestOptions& head_options,
                           const RequestOptions& get_options) {
    const RequestPlan plan = standing_method();
    const std::string target = url(path);

    if (plan.head_supported()) {
        auto response = head(target, head_options);
        if (std::find(accepted_codes.begin(), accepted_codes.end(), response.status_code) != accepted_codes.end()) {
            return response;
        }
        return get(target, get_options);
    }

    RequestOptions capped;
    capped.max_file_size = plan.max_file_size;
    return get(target, capped.merged_with(get_options));
}

HttpResponse Target::get(const std::string& target_url, const RequestOptions& overrides) {
    return transport_->get(target_url, options_.merged_with(overrides));
}

HttpResponse Target::head(const std::string& target_url, const RequestOptions& overrides) {
    return transport_->head(target_url, options_.merged_with(overrides));
}

std::int32_t Target::status_of(std::string_view path) {
    return get(url(path)).status_code;
}

} // namespace scout::core
