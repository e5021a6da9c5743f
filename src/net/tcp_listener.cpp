#include "nblisten/net/tcp_listener.hpp"

#include "nblisten/net/resolver.hpp"
#include "socket_helpers.hpp"

#include <cerrno>
#include <sys/socket.h>
#include <thread>

namespace nblisten::net {

tcp_listener::tcp_listener(nblisten::unique_fd fd) noexcept
    : fd_(fd.release()) {}

tcp_listener::~tcp_listener() noexcept {
    close();
}

tcp_listener::tcp_listener(tcp_listener&& other) noexcept
    : fd_(other.fd_.exchange(platform::invalid_native_handle)) {}

tcp_listener& tcp_listener::operator=(tcp_listener&& other) noexcept {
    if (this != &other) {
        platform::invalidate(
            fd_.exchange(other.fd_.exchange(platform::invalid_native_handle)));
    }
    return *this;
}

result<tcp_listener> tcp_listener::bind(const endpoint& local,
                                        int backlog) noexcept {
    const auto maybe_addr = detail::to_sockaddr(local);
    if (!maybe_addr.has_value()) {
        return err<tcp_listener>(maybe_addr.error());
    }

    const auto maybe_fd =
        detail::make_nonblocking_stream_socket(maybe_addr->family());
    if (!maybe_fd.has_value()) {
        return err<tcp_listener>(maybe_fd.error());
    }

    unique_fd owned_fd{maybe_fd.value()};
    const auto reuse_status = detail::set_reuse_addr(owned_fd.get());
    if (!reuse_status.has_value()) {
        return err<tcp_listener>(reuse_status.error());
    }

    if (::bind(owned_fd.get(), maybe_addr->data(), maybe_addr->length) != 0) {
        return err<tcp_listener>(error::from_errno());
    }
    if (::listen(owned_fd.get(), backlog) != 0) {
        return err<tcp_listener>(error::from_errno());
    }

    return tcp_listener{std::move(owned_fd)};
}

result<tcp_listener> tcp_listener::bind(std::string_view address,
                                        int backlog) {
    const auto candidates = resolve(address);
    if (!candidates.has_value()) {
        return err<tcp_listener>(candidates.error());
    }
    return bind(std::span<const endpoint>{candidates.value()}, backlog);
}

result<tcp_listener> tcp_listener::bind(std::span<const endpoint> candidates,
                                        int backlog) noexcept {
    error last_failure = make_error_from_errno(EADDRNOTAVAIL);
    for (const auto& candidate : candidates) {
        auto bound = bind(candidate, backlog);
        if (bound.has_value()) {
            return bound;
        }
        last_failure = bound.error();
    }
    return err<tcp_listener>(last_failure);
}

result<std::shared_ptr<tcp_listener>>
tcp_listener::bind_shared(std::string_view address, int backlog) {
    auto bound = bind(address, backlog);
    if (!bound.has_value()) {
        return err<std::shared_ptr<tcp_listener>>(bound.error());
    }
    return std::make_shared<tcp_listener>(std::move(bound.value()));
}

result<tcp_listener> tcp_listener::adopt(nblisten::unique_fd fd) noexcept {
    const auto status = detail::set_blocking_mode(fd.get(), false);
    if (!status.has_value()) {
        return err<tcp_listener>(status.error());
    }
    return tcp_listener{std::move(fd)};
}

void tcp_listener::close() noexcept {
    platform::invalidate(fd_.exchange(platform::invalid_native_handle,
                                      std::memory_order_acq_rel));
}

result<tcp_stream> tcp_listener::accept() noexcept {
    const auto fd = fd_.load(std::memory_order_acquire);
    if (fd == platform::invalid_native_handle) {
        return err<tcp_stream>(
            make_error_from_errno(platform::closed_handle_error));
    }

    while (true) {
        const int accepted = ::accept4(fd, nullptr, nullptr, SOCK_CLOEXEC);
        if (accepted >= 0) {
            return tcp_stream{unique_fd{accepted}};
        }
        if (errno != EINTR) {
            return err<tcp_stream>(error::from_errno());
        }
    }
}

result<void>
tcp_listener::handle_incoming(const connection_handler& handler,
                              std::chrono::nanoseconds poll_interval) noexcept {
    if (!handler) {
        return err<void>(make_error_from_errno(EINVAL));
    }
    if (poll_interval < std::chrono::nanoseconds::zero()) {
        poll_interval = std::chrono::nanoseconds::zero();
    }

    while (true) {
        auto accepted = accept();
        if (accepted.has_value()) {
            handler(std::move(accepted.value()));
            continue;
        }

        const auto failure = accepted.error();
        if (is_would_block(failure)) {
            std::this_thread::sleep_for(poll_interval);
            continue;
        }
        if (is_closed_handle(failure)) {
            return ok();
        }
        return err<void>(failure);
    }
}

bool tcp_listener::is_closed() const noexcept {
    return fd_.load(std::memory_order_acquire) ==
           platform::invalid_native_handle;
}

result<endpoint> tcp_listener::local_endpoint() const noexcept {
    const auto fd = fd_.load(std::memory_order_acquire);
    if (fd == platform::invalid_native_handle) {
        return err<endpoint>(
            make_error_from_errno(platform::closed_handle_error));
    }
    return detail::local_endpoint_of(fd);
}

result<std::uint16_t> tcp_listener::local_port() const noexcept {
    const auto local = local_endpoint();
    if (!local.has_value()) {
        return err<std::uint16_t>(local.error());
    }
    return local->port;
}

platform::native_handle_type tcp_listener::native_handle() const noexcept {
    return fd_.load(std::memory_order_acquire);
}

bool tcp_listener::valid() const noexcept {
    return !is_closed();
}

bool is_would_block(const nblisten::error& err) noexcept {
    return err.is(EAGAIN) || err.is(EWOULDBLOCK);
}

bool is_closed_handle(const nblisten::error& err) noexcept {
    return err.is(platform::closed_handle_error);
}

} // namespace nblisten::net
