#include "nblisten/platform/invalidate.hpp"

#include <winsock2.h>

namespace nblisten::platform {

static_assert(closed_handle_error == WSAENOTSOCK);

void invalidate(native_handle_type handle) noexcept {
    if (handle == invalid_native_handle) {
        return;
    }
    (void)::closesocket(handle);
}

} // namespace nblisten::platform
