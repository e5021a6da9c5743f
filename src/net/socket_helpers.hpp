#pragma once

#include "nblisten/core/result.hpp"
#include "nblisten/net/endpoint.hpp"

#include <sys/socket.h>

namespace nblisten::net::detail {

/// Raw socket address of either family together with its used length.
struct socket_address {
    sockaddr_storage storage{};
    socklen_t length{0};

    [[nodiscard]] int family() const noexcept { return storage.ss_family; }
    [[nodiscard]] const sockaddr* data() const noexcept {
        return reinterpret_cast<const sockaddr*>(&storage);
    }
    [[nodiscard]] sockaddr* data() noexcept {
        return reinterpret_cast<sockaddr*>(&storage);
    }
};

[[nodiscard]] result<socket_address> to_sockaddr(const endpoint& ep) noexcept;
[[nodiscard]] result<endpoint>
from_sockaddr(const socket_address& addr) noexcept;

[[nodiscard]] result<endpoint> local_endpoint_of(int fd) noexcept;
[[nodiscard]] result<endpoint> peer_endpoint_of(int fd) noexcept;

/// Create a `SOCK_STREAM | SOCK_CLOEXEC` socket already in nonblocking mode.
[[nodiscard]] result<int> make_nonblocking_stream_socket(int family) noexcept;

[[nodiscard]] result<void> set_reuse_addr(int fd) noexcept;
[[nodiscard]] result<void> set_blocking_mode(int fd, bool blocking) noexcept;

} // namespace nblisten::net::detail
