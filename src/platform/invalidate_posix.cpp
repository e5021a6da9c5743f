#include "nblisten/platform/invalidate.hpp"

#include <cerrno>
#include <unistd.h>

namespace nblisten::platform {

static_assert(closed_handle_error == EBADF);

void invalidate(native_handle_type handle) noexcept {
    if (handle == invalid_native_handle) {
        return;
    }
    // EINTR still releases the descriptor on Linux; retrying could close a
    // number that another thread has already been handed.
    (void)::close(handle);
}

} // namespace nblisten::platform
