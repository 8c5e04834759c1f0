// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <scout/core/error.hpp>
#include <scout/core/url.hpp>
#include <scout/core/http_session.hpp>
#include <scout/core/request_options.hpp>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace scout::core {

// Standing parameters for lightweight probes, decided once per target
struct RequestPlan {
    HttpMethod method{HttpMethod::head};
    std::optional<std::uint64_t> max_file_size;

    [[nodiscard]] bool head_supported() const noexcept { return method == HttpMethod::head; }

    bool operator==(const RequestPlan&) const = default;
};

// One web endpoint under scan.
//
// Memoized values (not-found URL and baseline, homepage response, standing
// method) are computed by the first caller and never refreshed, so every
// consumer compares against the same capture. Each slot is guarded by its own
// mutex: a Target may be shared by concurrent probing threads and still issues
// exactly one request per slot. set_url() is a configuration step and must
// not run concurrently with probes.
class Target {
public:
    using StatusCodes = std::vector<std::int32_t>;

    ~Target();

    // Non-copyable, non-movable (mutex members)
    Target(const Target&) = delete;
    Target& operator=(const Target&) = delete;
    Target(Target&&) = delete;
    Target& operator=(Target&&) = delete;

    // The only way to obtain a Target, so its URL is always valid.
    // A null transport selects a private libcurl HttpSession.
    [[nodiscard]] static std::expected<std::unique_ptr<Target>, std::error_code>
    create(std::string_view url_str,
           RequestOptions options = {},
           std::shared_ptr<HttpTransport> transport = nullptr) noexcept;

    // Parse and normalize the target URL. On failure nothing is changed.
    [[nodiscard]] std::expected<void, std::error_code> set_url(std::string_view url_str) noexcept;

    [[nodiscard]] const std::string& raw_url() const noexcept { return raw_url_; }
    [[nodiscard]] const Url& uri() const noexcept { return uri_; }
    [[nodiscard]] const RequestOptions& options() const noexcept { return options_; }

    // Normalized URL, or `path` encoded and resolved against it
    [[nodiscard]] std::string url(std::string_view path = {}) const;
    [[nodiscard]] std::string homepage_url() const { return url(); }

    // Address of the host for display, "Unknown" when the lookup fails
    [[nodiscard]] std::string ip() const;

    // Random URL that should not exist on any server: <token>.html
    [[nodiscard]] const std::string& not_found_url();

    // Response to not_found_url(), captured once
    [[nodiscard]] const HttpResponse& not_found_baseline();

    // Homepage GET following redirects, captured once
    [[nodiscard]] const HttpResponse& homepage_response();

    // Reachability and access checks, re-evaluated on every call
    [[nodiscard]] bool is_online(std::string_view path = {});
    [[nodiscard]] bool requires_http_auth(std::string_view path = {});
    [[nodiscard]] bool is_forbidden(std::string_view path = {});
    [[nodiscard]] bool requires_proxy_auth(std::string_view path = {});

    // Where a 301/302 at `path` finally leads, if somewhere else
    [[nodiscard]] std::optional<std::string> redirection(std::string_view path = {});

    // HEAD unless the homepage dropped, refused or did not implement HEAD
    [[nodiscard]] const RequestPlan& standing_method();

    // HEAD `path`; when its status is in `accepted_codes` that response is the
    // result, otherwise GET `path`. With a GET standing method the HEAD step
    // is skipped.
    [[nodiscard]] HttpResponse probe(std::string_view path,
                                     const StatusCodes& accepted_codes = {200},
                                     const RequestOptions& head_options = {},
                                     const RequestOptions& get_options = {});

private:
    Target(RequestOptions options, std::shared_ptr<HttpTransport> transport);

    [[nodiscard]] HttpResponse get(const std::string& target_url, const RequestOptions& overrides = {});
    [[nodiscard]] HttpResponse head(const std::string& target_url, const RequestOptions& overrides = {});
    [[nodiscard]] std::int32_t status_of(std::string_view path);

    std::string raw_url_;
    Url uri_;
    RequestOptions options_;
    std::shared_ptr<HttpTransport> transport_;

    std::mutex not_found_url_mutex_;
    std::optional<std::string> not_found_url_;

    std::mutex baseline_mutex_;
    std::optional<HttpResponse> baseline_;

    std::mutex homepage_mutex_;
    std::optional<HttpResponse> homepage_;

    std::mutex plan_mutex_;
    std::optional<RequestPlan> plan_;
};

} // namespace scout::core
