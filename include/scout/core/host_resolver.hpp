// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <scout/core/error.hpp>
#include <expected>
#include <string>
#include <string_view>

namespace scout::core {

// Best-effort lookup of the first address of `host` (IPv4 or IPv6, numeric
// form). Literal addresses are returned without touching the network.
[[nodiscard]] std::expected<std::string, std::error_code>
resolve_address(std::string_view host) noexcept;

} // namespace scout::core
