// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <scout/core/error.hpp>
#include <scout/core/request_options.hpp>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace scout::core {

enum class HttpMethod : std::uint8_t {
    head,
    get,
};

[[nodiscard]] std::string_view to_string(HttpMethod method) noexcept;

struct HttpRequest {
    HttpMethod method{HttpMethod::get};
    std::string url;
    RequestOptions options;
};

// Response of a single request. A transport failure is not an error here:
// status_code stays 0, body is empty and `error` says what went wrong.
struct HttpResponse {
    HttpMethod method{HttpMethod::get};   // Method that produced this response
    std::string url;                      // Requested URL
    std::string effective_url;            // Last URL after redirects
    std::int32_t status_code{0};
    std::string status_message;
    std::map<std::string, std::string> headers; // Lower-cased names
    std::string body;
    double total_time{0.0};               // Seconds
    std::error_code error;

    [[nodiscard]] bool received() const noexcept { return status_code != 0; }
};

// Apply a transport error to a partially filled response. Any error other
// than file_too_large drops the status and body, so the response reads as
// unreachable. A capped body keeps the status it already received.
void finish_response(std::error_code error, HttpResponse& response) noexcept;

// Seam between the probing logic and the network
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    [[nodiscard]] virtual HttpResponse perform(const HttpRequest& request) noexcept = 0;

    [[nodiscard]] HttpResponse head(const std::string& url, const RequestOptions& options = {}) noexcept {
        return perform(HttpRequest{HttpMethod::head, url, options});
    }

    [[nodiscard]] HttpResponse get(const std::string& url, const RequestOptions& options = {}) noexcept {
        return perform(HttpRequest{HttpMethod::get, url, options});
    }
};

// libcurl transport. Every request uses a fresh easy handle, so one session
// may be shared between threads.
class HttpSession : public HttpTransport {
public:
    HttpSession() = default;
    ~HttpSession() override = default;

    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;

    [[nodiscard]] HttpResponse perform(const HttpRequest& request) noexcept override;

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;
};

} // namespace scout::core
