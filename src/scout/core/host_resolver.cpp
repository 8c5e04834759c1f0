// Copyright (c) 2026 changcheng967. All rights reserved.

#include <scout/core/host_resolver.hpp>
#include <spdlog/spdlog.h>
#include <netdb.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <memory>

namespace scout::core {

namespace {

struct AddrInfoDeleter {
    void operator()(addrinfo* info) const noexcept {
        if (info) freeaddrinfo(info);
    }
};

using AddrInfoPtr = std::unique_ptr<addrinfo, AddrInfoDeleter>;

} // namespace

std::expected<std::string, std::error_code>
resolve_address(std::string_view host) noexcept {
    try {
        if (host.empty()) {
            return std::unexpected(make_error_code(ScoutErrc::resolve_failed));
        }

        addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        addrinfo* raw = nullptr;
        const std::string name(host);
        int rc = getaddrinfo(name.c_str(), nullptr, &hints, &raw);
        AddrInfoPtr result(raw);
        if (rc != 0 || !result) {
            spdlog::debug("Cannot resolve {}: {}", name, gai_strerror(rc));
            return std::unexpected(make_error_code(ScoutErrc::resolve_failed));
        }

        for (const addrinfo* it = result.get(); it != nullptr; it = it->ai_next) {
            if (it->ai_family != AF_INET && it->ai_family != AF_INET6) {
                continue;
            }

            char buffer[NI_MAXHOST] = {};
            if (getnameinfo(it->ai_addr, it->ai_addrlen, buffer, sizeof(buffer),
                            nullptr, 0, NI_NUMERICHOST) == 0) {
                return std::string(buffer);
            }
        }

        return std::unexpected(make_error_code(ScoutErrc::resolve_failed));
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(ScoutErrc::resolve_failed));
    }
}

} // namespace scout::core
