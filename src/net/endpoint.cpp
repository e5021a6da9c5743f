#include "nblisten/net/endpoint.hpp"

#include "address_text.hpp"
#include "socket_helpers.hpp"

#include <cerrno>

namespace nblisten::net {

endpoint endpoint::loopback(std::uint16_t port) {
    return endpoint{.host = "127.0.0.1", .port = port};
}

endpoint endpoint::any(std::uint16_t port) {
    return endpoint{.host = "0.0.0.0", .port = port};
}

endpoint endpoint::loopback_v6(std::uint16_t port) {
    return endpoint{.host = "::1", .port = port};
}

endpoint endpoint::any_v6(std::uint16_t port) {
    return endpoint{.host = "::", .port = port};
}

bool endpoint::is_v6() const noexcept {
    return host.find(':') != std::string::npos;
}

result<endpoint> parse_endpoint(std::string_view value) {
    const auto parts = detail::split_host_port(value);
    if (!parts.has_value()) {
        return err<endpoint>(parts.error());
    }

    const auto port = detail::parse_port(parts->port);
    if (!port.has_value()) {
        return err<endpoint>(port.error());
    }

    endpoint parsed{.host = std::string{parts->host}, .port = port.value()};
    if (!detail::to_sockaddr(parsed).has_value()) {
        return err<endpoint>(make_error_from_errno(EINVAL));
    }
    return parsed;
}

std::string format_endpoint(const endpoint& value) {
    if (value.is_v6()) {
        return "[" + value.host + "]:" + std::to_string(value.port);
    }
    return value.host + ":" + std::to_string(value.port);
}

} // namespace nblisten::net
