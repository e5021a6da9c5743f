#pragma once

/**
 * @file
 * @brief Connected TCP socket handed to connection handlers.
 */

#include "nblisten/core/result.hpp"
#include "nblisten/core/unique_fd.hpp"
#include "nblisten/net/endpoint.hpp"

#include <cstddef>
#include <span>

namespace nblisten::net {

/**
 * @brief Blocking connected TCP socket.
 *
 * Streams produced by `tcp_listener::accept()` are in blocking mode even
 * though the listener itself never is.
 */
class tcp_stream {
public:
    /// Construct an empty stream.
    tcp_stream() noexcept = default;
    /// Construct from an already-open connected socket.
    explicit tcp_stream(nblisten::unique_fd fd) noexcept;

    tcp_stream(const tcp_stream&) = delete;
    tcp_stream& operator=(const tcp_stream&) = delete;
    tcp_stream(tcp_stream&&) noexcept = default;
    tcp_stream& operator=(tcp_stream&&) noexcept = default;

    /**
     * @brief Connect to a remote endpoint.
     * @param remote Remote IPv4 or IPv6 host/port.
     */
    [[nodiscard]] static result<tcp_stream>
    connect(const endpoint& remote) noexcept;

    /**
     * @brief Read up to `buffer.size()` bytes.
     * @return Number of bytes read, or 0 on peer shutdown.
     */
    [[nodiscard]] result<std::size_t>
    read_some(std::span<std::byte> buffer) noexcept;
    /**
     * @brief Write up to `buffer.size()` bytes.
     * @return Number of bytes written.
     */
    [[nodiscard]] result<std::size_t>
    write_some(std::span<const std::byte> buffer) noexcept;

    /// @return Address this side of the connection is bound to.
    [[nodiscard]] result<endpoint> local_endpoint() const noexcept;
    /// @return Address of the remote side.
    [[nodiscard]] result<endpoint> peer_endpoint() const noexcept;

    /// @return Native socket descriptor.
    [[nodiscard]] int native_handle() const noexcept;
    /// @return `true` when a valid socket is owned.
    [[nodiscard]] bool valid() const noexcept;

private:
    nblisten::unique_fd fd_;
};

/**
 * @brief Keep writing until the entire buffer is transferred.
 */
[[nodiscard]] result<void>
write_all(tcp_stream& stream, std::span<const std::byte> buffer) noexcept;
/**
 * @brief Keep reading until the entire buffer is filled.
 *
 * Fails with ECONNRESET if the peer shuts down first.
 */
[[nodiscard]] result<void> read_exact(tcp_stream& stream,
                                      std::span<std::byte> buffer) noexcept;

} // namespace nblisten::net
