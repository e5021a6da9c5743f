#include "nblisten/net/tcp_stream.hpp"

#include "socket_helpers.hpp"

#include <cerrno>
#include <sys/socket.h>

namespace nblisten::net {

tcp_stream::tcp_stream(nblisten::unique_fd fd) noexcept : fd_(std::move(fd)) {}

result<tcp_stream> tcp_stream::connect(const endpoint& remote) noexcept {
    const auto maybe_addr = detail::to_sockaddr(remote);
    if (!maybe_addr.has_value()) {
        return err<tcp_stream>(maybe_addr.error());
    }

    const int fd = ::socket(maybe_addr->family(), SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return err<tcp_stream>(error::from_errno());
    }

    unique_fd owned_fd{fd};
    if (::connect(owned_fd.get(), maybe_addr->data(), maybe_addr->length) !=
        0) {
        return err<tcp_stream>(error::from_errno());
    }

    return tcp_stream{std::move(owned_fd)};
}

result<std::size_t>
tcp_stream::read_some(std::span<std::byte> buffer) noexcept {
    if (!valid()) {
        return err<std::size_t>(make_error_from_errno(EBADF));
    }
    if (buffer.empty()) {
        return static_cast<std::size_t>(0);
    }

    const ssize_t read_count =
        ::recv(fd_.get(), buffer.data(), buffer.size(), 0);
    if (read_count < 0) {
        return err<std::size_t>(error::from_errno());
    }
    return static_cast<std::size_t>(read_count);
}

result<std::size_t>
tcp_stream::write_some(std::span<const std::byte> buffer) noexcept {
    if (!valid()) {
        return err<std::size_t>(make_error_from_errno(EBADF));
    }
    if (buffer.empty()) {
        return static_cast<std::size_t>(0);
    }

    const ssize_t write_count =
        ::send(fd_.get(), buffer.data(), buffer.size(), MSG_NOSIGNAL);
    if (write_count < 0) {
        return err<std::size_t>(error::from_errno());
    }
    return static_cast<std::size_t>(write_count);
}

result<endpoint> tcp_stream::local_endpoint() const noexcept {
    if (!valid()) {
        return err<endpoint>(make_error_from_errno(EBADF));
    }
    return detail::local_endpoint_of(fd_.get());
}

result<endpoint> tcp_stream::peer_endpoint() const noexcept {
    if (!valid()) {
        return err<endpoint>(make_error_from_errno(EBADF));
    }
    return detail::peer_endpoint_of(fd_.get());
}

int tcp_stream::native_handle() const noexcept {
    return fd_.get();
}

bool tcp_stream::valid() const noexcept {
    return fd_.valid();
}

result<void> write_all(tcp_stream& stream,
                       std::span<const std::byte> buffer) noexcept {
    while (!buffer.empty()) {
        const auto written = stream.write_some(buffer);
        if (!written.has_value()) {
            if (written.error().is(EINTR)) {
                continue;
            }
            return err<void>(written.error());
        }
        if (written.value() == 0) {
            return err<void>(make_error_from_errno(EPIPE));
        }
        buffer = buffer.subspan(written.value());
    }
    return ok();
}

result<void> read_exact(tcp_stream& stream,
                        std::span<std::byte> buffer) noexcept {
    while (!buffer.empty()) {
        const auto received = stream.read_some(buffer);
        if (!received.has_value()) {
            if (received.error().is(EINTR)) {
                continue;
            }
            return err<void>(received.error());
        }
        if (received.value() == 0) {
            return err<void>(make_error_from_errno(ECONNRESET));
        }
        buffer = buffer.subspan(received.value());
    }
    return ok();
}

} // namespace nblisten::net
