#include "nblisten/platform/invalidate.hpp"

#include <array>
#include <cerrno>
#include <fcntl.h>
#include <gtest/gtest.h>
#include <unistd.h>

namespace {

TEST(invalidate_test, sentinel_matches_descriptor_closed_errno) {
    EXPECT_EQ(nblisten::platform::closed_handle_error, EBADF);
    EXPECT_EQ(nblisten::platform::invalid_native_handle, -1);
}

TEST(invalidate_test, releases_descriptor) {
    std::array<int, 2> fds{};
    ASSERT_EQ(::pipe(fds.data()), 0);

    nblisten::platform::invalidate(fds[0]);
    nblisten::platform::invalidate(fds[1]);

    errno = 0;
    EXPECT_EQ(::fcntl(fds[0], F_GETFD), -1);
    EXPECT_EQ(errno, nblisten::platform::closed_handle_error);
}

TEST(invalidate_test, invalid_handle_leaves_open_descriptors_alone) {
    std::array<int, 2> fds{};
    ASSERT_EQ(::pipe(fds.data()), 0);

    nblisten::platform::invalidate(nblisten::platform::invalid_native_handle);

    EXPECT_NE(::fcntl(fds[0], F_GETFD), -1);
    EXPECT_NE(::fcntl(fds[1], F_GETFD), -1);
    ::close(fds[0]);
    ::close(fds[1]);
}

} // namespace
