#pragma once

/**
 * @file
 * @brief Build-time selected capability for forcibly invalidating a socket.
 *
 * A listener shared between threads can be invalidated here regardless of
 * how many owners still reference it. The next syscall made against the
 * handle fails with `closed_handle_error`, which the accept loop treats as
 * its shutdown signal.
 *
 * Known limitation: invalidating a handle while another thread is inside a
 * syscall on it is not specified the same way on every platform, and the
 * released descriptor number may be reused by the process before the other
 * thread observes the failure. No extra synchronisation is layered on top.
 */

#if defined(_WIN32)
#include <winsock2.h>
#endif

namespace nblisten::platform {

#if defined(_WIN32)
using native_handle_type = SOCKET;
inline constexpr native_handle_type invalid_native_handle = INVALID_SOCKET;
/// `WSAENOTSOCK`, reported by Winsock for a closed socket.
inline constexpr int closed_handle_error = 10038;
#else
using native_handle_type = int;
inline constexpr native_handle_type invalid_native_handle = -1;
/// `EBADF`.
inline constexpr int closed_handle_error = 9;
#endif

/**
 * @brief Release the OS resource behind `handle` immediately.
 *
 * Never fails from the caller's point of view; an already invalid handle is
 * ignored.
 */
void invalidate(native_handle_type handle) noexcept;

} // namespace nblisten::platform
