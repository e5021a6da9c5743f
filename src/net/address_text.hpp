#pragma once

#include "nblisten/core/result.hpp"

#include <cstdint>
#include <string_view>

namespace nblisten::net::detail {

struct host_port {
    std::string_view host;
    std::string_view port;
};

/// Split `host:port` or `[v6]:port`; the brackets are stripped from `host`.
[[nodiscard]] result<host_port> split_host_port(std::string_view value);
/// Decimal port in `[0, 65535]`.
[[nodiscard]] result<std::uint16_t> parse_port(std::string_view text);

} // namespace nblisten::net::detail
