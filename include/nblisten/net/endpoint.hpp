#pragma once

/**
 * @file
 * @brief Host/port endpoint and its textual form.
 */

#include "nblisten/core/result.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace nblisten::net {

/**
 * @brief IPv4 or IPv6 endpoint represented as a literal host and TCP port.
 */
struct endpoint {
    /// IPv4 dotted quad or IPv6 literal without brackets.
    std::string host;
    /// Port in host byte order.
    std::uint16_t port{};

    /// `127.0.0.1:port`
    [[nodiscard]] static endpoint loopback(std::uint16_t port);
    /// `0.0.0.0:port`
    [[nodiscard]] static endpoint any(std::uint16_t port);
    /// `[::1]:port`
    [[nodiscard]] static endpoint loopback_v6(std::uint16_t port);
    /// `[::]:port`
    [[nodiscard]] static endpoint any_v6(std::uint16_t port);

    /// @return `true` when `host` contains an IPv6 literal.
    [[nodiscard]] bool is_v6() const noexcept;

    friend bool operator==(const endpoint&, const endpoint&) = default;
};

/**
 * @brief Parse `host:port` or `[v6-host]:port` text.
 *
 * The host part must be a numeric literal; use `resolve()` for names.
 * @return Parsed endpoint, or EINVAL.
 */
[[nodiscard]] result<endpoint> parse_endpoint(std::string_view value);

/// @brief Format an endpoint as `host:port`, bracketing IPv6 hosts.
[[nodiscard]] std::string format_endpoint(const endpoint& value);

} // namespace nblisten::net
