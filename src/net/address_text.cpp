#include "address_text.hpp"

#include <cerrno>

namespace nblisten::net::detail {

result<host_port> split_host_port(std::string_view value) {
    if (!value.empty() && value.front() == '[') {
        const std::size_t closing = value.find(']');
        if (closing == std::string_view::npos || closing == 1 ||
            closing + 1 >= value.size() || value[closing + 1] != ':') {
            return err<host_port>(make_error_from_errno(EINVAL));
        }
        const auto port = value.substr(closing + 2);
        if (port.empty()) {
            return err<host_port>(make_error_from_errno(EINVAL));
        }
        return host_port{value.substr(1, closing - 1), port};
    }

    const std::size_t separator = value.rfind(':');
    if (separator == std::string_view::npos || separator == 0 ||
        separator + 1 >= value.size()) {
        return err<host_port>(make_error_from_errno(EINVAL));
    }
    // An unbracketed host may not itself contain a colon.
    if (value.substr(0, separator).find(':') != std::string_view::npos) {
        return err<host_port>(make_error_from_errno(EINVAL));
    }
    return host_port{value.substr(0, separator), value.substr(separator + 1)};
}

result<std::uint16_t> parse_port(std::string_view text) {
    if (text.empty()) {
        return err<std::uint16_t>(make_error_from_errno(EINVAL));
    }

    std::uint32_t port = 0;
    for (const char ch : text) {
        if (ch < '0' || ch > '9') {
            return err<std::uint16_t>(make_error_from_errno(EINVAL));
        }
        port = port * 10U + static_cast<std::uint32_t>(ch - '0');
        if (port > 65535U) {
            return err<std::uint16_t>(make_error_from_errno(EINVAL));
        }
    }
    return static_cast<std::uint16_t>(port);
}

} // namespace nblisten::net::detail
