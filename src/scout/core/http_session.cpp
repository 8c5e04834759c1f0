// Copyright (c) 2026 changcheng967. All rights reserved.

#include <scout/core/http_session.hpp>
#include <scout/core/config.hpp>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <cctype>
#include <string>

namespace scout::core {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
    CurlHandle(CurlHandle&& other) noexcept : ptr(other.ptr) { other.ptr = nullptr; }
    CurlHandle& operator=(CurlHandle&& other) noexcept {
        if (this != &other) {
            if (ptr) curl_easy_cleanup(ptr);
            ptr = other.ptr;
            other.ptr = nullptr;
        }
        return *this;
    }
};

// RAII request header list
struct CurlHeaders {
    curl_slist* list = nullptr;

    CurlHeaders() = default;
    ~CurlHeaders() { if (list) curl_slist_free_all(list); }

    CurlHeaders(const CurlHeaders&) = delete;
    CurlHeaders& operator=(const CurlHeaders&) = delete;

    bool append(const std::string& line) noexcept {
        curl_slist* next = curl_slist_append(list, line.c_str());
        if (!next) return false;
        list = next;
        return true;
    }
};

// Header callback, keeps only the headers of the last response in a redirect chain
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* response = static_cast<HttpResponse*>(userdata);
    if (!response) return total;

    std::string_view header(buffer, total);

    // Remove trailing \r or \n
    while (!header.empty() && (header.back() == '\r' || header.back() == '\n')) {
        header.remove_suffix(1);
    }

    // Status line: "HTTP/1.1 404 Not Found"
    if (header.starts_with("HTTP/")) {
        response->headers.clear();
        response->status_message.clear();
        auto code_start = header.find(' ');
        if (code_start != std::string_view::npos) {
            auto message_start = header.find(' ', code_start + 1);
            if (message_start != std::string_view::npos) {
                response->status_message = std::string(header.substr(message_start + 1));
            }
        }
        return total;
    }

    auto colon = header.find(':');
    if (colon == std::string_view::npos) return total;

    auto name = header.substr(0, colon);
    auto value = header.substr(colon + 1);

    // Trim leading whitespace
    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }

    // Convert name to lowercase
    std::string lower_name;
    lower_name.reserve(name.size());
    for (char c : name) {
        lower_name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    response->headers[lower_name] = std::string(value);
    return total;
}

// Write callback, collects the body
std::size_t write_callback(char* ptr, std::size_t size, std::size_t nitems, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    if (!body) return 0;

    std::size_t total = size * nitems;
    body->append(ptr, total);
    return total;
}

ScoutErrc map_curl_error(CURLcode code) noexcept {
    switch (code) {
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return ScoutErrc::dns_error;
        case CURLE_COULDNT_CONNECT:
            return ScoutErrc::refused;
        case CURLE_OPERATION_TIMEDOUT:
            return ScoutErrc::timeout;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:
            return ScoutErrc::ssl_error;
        case CURLE_TOO_MANY_REDIRECTS:
            return ScoutErrc::too_many_redirects;
        case CURLE_FILESIZE_EXCEEDED:
            return ScoutErrc::file_too_large;
        default:
            return ScoutErrc::network_error;
    }
}

std::string with_query(CURL* curl, const std::string& url,
                       const std::map<std::string, std::string>& params) {
    if (params.empty()) return url;

    std::string query;
    for (const auto& [key, value] : params) {
        if (!query.empty()) query += '&';

        char* k = curl_easy_escape(curl, key.c_str(), static_cast<int>(key.size()));
        char* v = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.size()));
        if (k) query += k;
        query += '=';
        if (v) query += v;
        curl_free(k);
        curl_free(v);
    }

    auto fragment = url.find('#');
    std::string base = fragment == std::string::npos ? url : url.substr(0, fragment);
    base += base.find('?') == std::string::npos ? '?' : '&';
    base += query;
    if (fragment != std::string::npos) {
        base += url.substr(fragment);
    }
    return base;
}

} // namespace

std::string_view to_string(HttpMethod method) noexcept {
    switch (method) {
        case HttpMethod::head: return "HEAD";
        case HttpMethod::get:  return "GET";
    }
    return "GET";
}

void finish_response(std::error_code error, HttpResponse& response) noexcept {
    if (!error) return;
    response.error = error;

    // An oversized body still had its status line answered
    if (error == ScoutErrc::file_too_large) return;

    response.status_code = 0;
    response.status_message.clear();
    response.body.clear();
}

//=============================================================================
// HttpSession
//=============================================================================

HttpResponse HttpSession::perform(const HttpRequest& request) noexcept {
    HttpResponse response{};
    response.method = request.method;
    response.url = request.url;

    try {
        CurlHandle curl = CurlHandle(curl_easy_init());
        if (!curl.ptr) {
            response.error = make_error_code(ScoutErrc::network_error);
            return response;
        }

        const RequestOptions& opts = request.options;
        const std::string target = with_query(curl.ptr, request.url, opts.params);

        curl_easy_setopt(curl.ptr, CURLOPT_URL, target.c_str());
        curl_easy_setopt(curl.ptr, CURLOPT_NOSIGNAL, 1L);

        if (request.method == HttpMethod::head) {
            curl_easy_setopt(curl.ptr, CURLOPT_NOBODY, 1L);
        } else {
            curl_easy_setopt(curl.ptr, CURLOPT_HTTPGET, 1L);
        }

        curl_easy_setopt(curl.ptr, CURLOPT_FOLLOWLOCATION, opts.follow_location.value_or(false) ? 1L : 0L);
        curl_easy_setopt(curl.ptr, CURLOPT_MAXREDIRS, static_cast<long>(opts.max_redirects.value_or(MAX_REDIRECTS)));

        CURLcode setup = CURLE_OK;
        if (opts.connect_timeout) {
            setup = curl_easy_setopt(curl.ptr, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(opts.connect_timeout->count()));
        } else {
            setup = curl_easy_setopt(curl.ptr, CURLOPT_CONNECTTIMEOUT, static_cast<long>(CONNECTION_TIMEOUT_SEC));
        }
        if (setup == CURLE_OK && opts.timeout) {
            setup = curl_easy_setopt(curl.ptr, CURLOPT_TIMEOUT_MS, static_cast<long>(opts.timeout->count()));
        }

        bool verify = opts.verify_tls.value_or(true);
        curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYPEER, verify ? 1L : 0L);
        curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYHOST, verify ? 2L : 0L);

        if (setup == CURLE_OK && opts.proxy) {
            setup = curl_easy_setopt(curl.ptr, CURLOPT_PROXY, opts.proxy->c_str());
        }
        if (setup == CURLE_OK && opts.proxy_auth) {
            setup = curl_easy_setopt(curl.ptr, CURLOPT_PROXYUSERPWD, opts.proxy_auth->c_str());
        }
        if (setup != CURLE_OK) {
            spdlog::warn("{} {} rejected options: {}", to_string(request.method), request.url,
                         curl_easy_strerror(setup));
            finish_response(make_error_code(ScoutErrc::network_error), response);
            return response;
        }
        if (opts.http_auth) {
            curl_easy_setopt(curl.ptr, CURLOPT_USERPWD, opts.http_auth->c_str());
            curl_easy_setopt(curl.ptr, CURLOPT_HTTPAUTH, static_cast<long>(CURLAUTH_ANY));
        }
        if (opts.cookie) {
            curl_easy_setopt(curl.ptr, CURLOPT_COOKIE, opts.cookie->c_str());
        }

        const std::string user_agent = opts.user_agent.value_or(std::string(DEFAULT_USER_AGENT));
        curl_easy_setopt(curl.ptr, CURLOPT_USERAGENT, user_agent.c_str());

        if (opts.max_file_size) {
            curl_easy_setopt(curl.ptr, CURLOPT_MAXFILESIZE_LARGE, static_cast<curl_off_t>(*opts.max_file_size));
        }

        CurlHeaders headers;
        for (const auto& [name, value] : opts.headers) {
            if (!headers.append(name + ": " + value)) {
                response.error = make_error_code(ScoutErrc::network_error);
                return response;
            }
        }
        if (headers.list) {
            curl_easy_setopt(curl.ptr, CURLOPT_HTTPHEADER, headers.list);
        }

        curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &response);
        curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &response.body);

        // Perform request
        CURLcode result = curl_easy_perform(curl.ptr);

        long http_code = 0;
        curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
        response.status_code = static_cast<std::int32_t>(http_code);

        char* effective = nullptr;
        if (curl_easy_getinfo(curl.ptr, CURLINFO_EFFECTIVE_URL, &effective) == CURLE_OK && effective) {
            response.effective_url = effective;
        }

        double total_time = 0.0;
        if (curl_easy_getinfo(curl.ptr, CURLINFO_TOTAL_TIME, &total_time) == CURLE_OK) {
            response.total_time = total_time;
        }

        if (result != CURLE_OK) {
            finish_response(make_error_code(map_curl_error(result)), response);
            spdlog::debug("{} {} failed: {} ({})", to_string(request.method), request.url,
                          response.error.message(), curl_easy_strerror(result));
            return response;
        }

        spdlog::debug("{} {} -> {}", to_string(request.method), request.url, response.status_code);
        return response;
    } catch (const std::exception& e) {
        spdlog::warn("{} {} aborted: {}", to_string(request.method), request.url, e.what());
        finish_response(make_error_code(ScoutErrc::network_error), response);
        return response;
    }
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void HttpSession::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace scout::core
