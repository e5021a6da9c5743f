#pragma once

/**
 * @file
 * @brief Nonblocking TCP listener with a cancellable accept loop.
 *
 * Typical use shares one listener between a driver thread running
 * `handle_incoming()` and any controller thread that decides when to stop:
 *
 * @code
 * auto listener = nblisten::net::tcp_listener::bind_shared("127.0.0.1:0");
 * std::thread controller([l = listener.value()] {
 *     std::this_thread::sleep_for(std::chrono::seconds{5});
 *     l->close();
 * });
 * auto status = listener.value()->handle_incoming(
 *     [](nblisten::net::tcp_stream stream) { ... },
 *     std::chrono::milliseconds{10});
 * controller.join();
 * @endcode
 */

#include "nblisten/core/result.hpp"
#include "nblisten/core/unique_fd.hpp"
#include "nblisten/net/endpoint.hpp"
#include "nblisten/net/tcp_stream.hpp"
#include "nblisten/platform/invalidate.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string_view>

namespace nblisten::net {

/**
 * @brief Callback invoked once per accepted connection.
 *
 * Runs synchronously on the thread driving `handle_incoming()`. Failures on
 * the connection are the handler's own business: `handle_incoming()` is
 * `noexcept`, so an exception escaping the handler ends the process through
 * `std::terminate`.
 */
using connection_handler = std::function<void(tcp_stream)>;

/**
 * @brief TCP listening socket that is always in nonblocking mode.
 *
 * `close()`, `accept()`, `handle_incoming()` and the query functions may be
 * called concurrently on one shared instance. Move operations may not.
 */
class tcp_listener {
public:
    /// Construct an empty, already closed listener.
    tcp_listener() noexcept = default;
    /// Closes the socket unless `close()` already did.
    ~tcp_listener() noexcept;

    tcp_listener(const tcp_listener&) = delete;
    tcp_listener& operator=(const tcp_listener&) = delete;
    tcp_listener(tcp_listener&& other) noexcept;
    tcp_listener& operator=(tcp_listener&& other) noexcept;

    /**
     * @brief Bind and listen on one explicit endpoint.
     *
     * The socket is switched to nonblocking mode before it is bound. On
     * failure the OS error is returned unchanged and nothing stays open.
     *
     * @param local Local host/port; port 0 picks an ephemeral port.
     * @param backlog Kernel listen backlog.
     */
    [[nodiscard]] static result<tcp_listener> bind(const endpoint& local,
                                                   int backlog = 128) noexcept;
    /**
     * @brief Resolve `host:port` and bind to the first candidate that works.
     *
     * When every candidate fails the error of the last attempt is returned.
     */
    [[nodiscard]] static result<tcp_listener> bind(std::string_view address,
                                                   int backlog = 128);
    /**
     * @brief Bind to the first endpoint in `candidates` that works.
     *
     * When every candidate fails the error of the last attempt is returned;
     * an empty list yields EADDRNOTAVAIL.
     */
    [[nodiscard]] static result<tcp_listener>
    bind(std::span<const endpoint> candidates, int backlog = 128) noexcept;
    /// @brief `bind(address)` wrapped for sharing across threads.
    [[nodiscard]] static result<std::shared_ptr<tcp_listener>>
    bind_shared(std::string_view address, int backlog = 128);

    /**
     * @brief Take over an already listening socket.
     *
     * Forces the descriptor into nonblocking mode first; on failure the
     * descriptor is closed and the error returned.
     */
    [[nodiscard]] static result<tcp_listener> adopt(nblisten::unique_fd fd) noexcept;

    /**
     * @brief Invalidate the socket from any thread.
     *
     * Acts on the OS resource directly, however many owners still hold the
     * listener. A concurrent or later `handle_incoming()` then returns
     * success. Calling it again is a no-op.
     */
    void close() noexcept;

    /**
     * @brief Try to accept one connection without waiting.
     *
     * EINTR is retried. Would-block and closed-handle failures are returned
     * like any other error; see `is_would_block()` and `is_closed_handle()`.
     */
    [[nodiscard]] result<tcp_stream> accept() noexcept;

    /**
     * @brief Dispatch incoming connections until the listener is closed.
     *
     * Each accepted connection is passed to `handler` before the next
     * accept attempt. When nothing is pending the calling thread sleeps for
     * `poll_interval` and tries again. Returns success once `close()` has
     * invalidated the socket; any other accept failure ends the loop and is
     * returned as is. An empty handler is rejected with EINVAL.
     *
     * Shutdown latency is bounded by one `poll_interval` plus one accept
     * attempt. A negative interval is treated as zero, which makes the loop
     * spin on accept without sleeping.
     */
    [[nodiscard]] result<void>
    handle_incoming(const connection_handler& handler,
                    std::chrono::nanoseconds poll_interval) noexcept;

    /// @return `true` once `close()` has run or nothing was ever bound.
    [[nodiscard]] bool is_closed() const noexcept;
    /// @return Address the socket is bound to, resolving an ephemeral port.
    [[nodiscard]] result<endpoint> local_endpoint() const noexcept;
    /// @return Bound local port number.
    [[nodiscard]] result<std::uint16_t> local_port() const noexcept;

    /// @return Native listening socket, or the invalid handle once closed.
    [[nodiscard]] platform::native_handle_type native_handle() const noexcept;
    /// @return `true` while a socket is owned.
    [[nodiscard]] bool valid() const noexcept;

private:
    explicit tcp_listener(nblisten::unique_fd fd) noexcept;

    std::atomic<platform::native_handle_type> fd_{
        platform::invalid_native_handle};
};

/// @return `true` for "no connection pending" (EAGAIN / EWOULDBLOCK).
[[nodiscard]] bool is_would_block(const nblisten::error& err) noexcept;
/// @return `true` for the error `close()` makes the next accept report.
[[nodiscard]] bool is_closed_handle(const nblisten::error& err) noexcept;

} // namespace nblisten::net
