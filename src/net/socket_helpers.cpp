#include "socket_helpers.hpp"

#include <arpa/inet.h>
#include <array>
#include <cerrno>
#include <fcntl.h>
#include <netinet/in.h>
#include <unistd.h>

namespace nblisten::net::detail {

result<socket_address> to_sockaddr(const endpoint& ep) noexcept {
    socket_address addr{};

    auto* v4 = reinterpret_cast<sockaddr_in*>(&addr.storage);
    if (::inet_pton(AF_INET, ep.host.c_str(), &v4->sin_addr) == 1) {
        v4->sin_family = AF_INET;
        v4->sin_port = htons(ep.port);
        addr.length = sizeof(sockaddr_in);
        return addr;
    }

    addr = socket_address{};
    auto* v6 = reinterpret_cast<sockaddr_in6*>(&addr.storage);
    if (::inet_pton(AF_INET6, ep.host.c_str(), &v6->sin6_addr) == 1) {
        v6->sin6_family = AF_INET6;
        v6->sin6_port = htons(ep.port);
        addr.length = sizeof(sockaddr_in6);
        return addr;
    }

    return err<socket_address>(make_error_from_errno(EINVAL));
}

result<endpoint> from_sockaddr(const socket_address& addr) noexcept {
    std::array<char, INET6_ADDRSTRLEN> buffer{};

    if (addr.family() == AF_INET) {
        const auto* v4 = reinterpret_cast<const sockaddr_in*>(&addr.storage);
        if (::inet_ntop(AF_INET, &v4->sin_addr, buffer.data(),
                        buffer.size()) == nullptr) {
            return err<endpoint>(error::from_errno());
        }
        return endpoint{.host = std::string{buffer.data()},
                        .port = ntohs(v4->sin_port)};
    }

    if (addr.family() == AF_INET6) {
        const auto* v6 = reinterpret_cast<const sockaddr_in6*>(&addr.storage);
        if (::inet_ntop(AF_INET6, &v6->sin6_addr, buffer.data(),
                        buffer.size()) == nullptr) {
            return err<endpoint>(error::from_errno());
        }
        return endpoint{.host = std::string{buffer.data()},
                        .port = ntohs(v6->sin6_port)};
    }

    return err<endpoint>(make_error_from_errno(EAFNOSUPPORT));
}

result<endpoint> local_endpoint_of(int fd) noexcept {
    socket_address addr{};
    addr.length = sizeof(addr.storage);
    if (::getsockname(fd, addr.data(), &addr.length) != 0) {
        return err<endpoint>(error::from_errno());
    }
    return from_sockaddr(addr);
}

result<endpoint> peer_endpoint_of(int fd) noexcept {
    socket_address addr{};
    addr.length = sizeof(addr.storage);
    if (::getpeername(fd, addr.data(), &addr.length) != 0) {
        return err<endpoint>(error::from_errno());
    }
    return from_sockaddr(addr);
}

result<int> make_nonblocking_stream_socket(int family) noexcept {
    int fd = ::socket(family, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0);
    if (fd >= 0) {
        return fd;
    }

    fd = ::socket(family, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return err<int>(error::from_errno());
    }

    const auto status = set_blocking_mode(fd, false);
    if (!status.has_value()) {
        (void)::close(fd);
        return err<int>(status.error());
    }
    return fd;
}

result<void> set_reuse_addr(int fd) noexcept {
    int enabled = 1;
    if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &enabled, sizeof(enabled)) ==
        0) {
        return ok();
    }
    return err<void>(error::from_errno());
}

result<void> set_blocking_mode(int fd, bool blocking) noexcept {
    if (fd < 0) {
        return err<void>(make_error_from_errno(EBADF));
    }

    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return err<void>(error::from_errno());
    }

    const int updated = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
    if (updated == flags || ::fcntl(fd, F_SETFL, updated) == 0) {
        return ok();
    }
    return err<void>(error::from_errno());
}

} // namespace nblisten::net::detail
