#include "nblisten/core/unique_fd.hpp"

#include <array>
#include <cerrno>
#include <fcntl.h>
#include <gtest/gtest.h>
#include <stdexcept>
#include <unistd.h>

namespace {

std::array<int, 2> make_pipe() {
    std::array<int, 2> fds{};
    if (::pipe(fds.data()) != 0) {
        throw std::runtime_error("pipe creation failed");
    }
    return fds;
}

void expect_fd_is_closed(int fd) {
    errno = 0;
    EXPECT_EQ(::fcntl(fd, F_GETFD), -1);
    EXPECT_EQ(errno, EBADF);
}

TEST(unique_fd_test, default_constructed_is_invalid) {
    const nblisten::unique_fd fd;
    EXPECT_FALSE(fd.valid());
    EXPECT_FALSE(static_cast<bool>(fd));
    EXPECT_EQ(fd.get(), -1);
}

TEST(unique_fd_test, move_assignment_closes_previous_descriptor) {
    const auto first = make_pipe();
    const auto second = make_pipe();

    nblisten::unique_fd target{first[0]};
    nblisten::unique_fd first_write_end{first[1]};
    nblisten::unique_fd source{second[0]};
    nblisten::unique_fd second_write_end{second[1]};

    const int old_target_fd = target.get();
    const int source_fd = source.get();

    target = std::move(source);

    expect_fd_is_closed(old_target_fd);
    EXPECT_FALSE(source.valid());
    EXPECT_EQ(target.get(), source_fd);
}

TEST(unique_fd_test, release_hands_over_without_closing) {
    const auto fds = make_pipe();

    nblisten::unique_fd read_end{fds[0]};
    nblisten::unique_fd write_end{fds[1]};

    const int released = read_end.release();
    EXPECT_FALSE(read_end.valid());
    EXPECT_NE(::fcntl(released, F_GETFD), -1);

    EXPECT_TRUE(nblisten::close_fd(released).has_value());
}

TEST(unique_fd_test, swap_exchanges_descriptors) {
    const auto fds = make_pipe();

    nblisten::unique_fd a{fds[0]};
    nblisten::unique_fd b{fds[1]};
    a.swap(b);

    EXPECT_EQ(a.get(), fds[1]);
    EXPECT_EQ(b.get(), fds[0]);
}

TEST(unique_fd_test, destructor_closes_valid_descriptor) {
    int fd_to_check = -1;
    {
        const auto fds = make_pipe();
        nblisten::unique_fd read_end{fds[0]};
        nblisten::unique_fd write_end{fds[1]};
        fd_to_check = read_end.get();
    }

    expect_fd_is_closed(fd_to_check);
}

TEST(unique_fd_test, close_fd_reports_error_for_invalid_descriptor) {
    const auto close_result = nblisten::close_fd(-1);
    ASSERT_FALSE(close_result.has_value());
    EXPECT_EQ(close_result.error().value(), EBADF);
}

} // namespace
