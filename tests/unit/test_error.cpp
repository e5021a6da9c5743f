#include "nblisten/core/error.hpp"

#include <cerrno>
#include <gtest/gtest.h>
#include <sstream>

namespace {

TEST(error_test, keeps_raw_errno_values) {
    const auto retry = nblisten::make_error_from_errno(EAGAIN);
    const auto closed = nblisten::make_error_from_errno(EBADF);
    const auto in_use = nblisten::make_error_from_errno(EADDRINUSE);

    EXPECT_EQ(retry.value(), EAGAIN);
    EXPECT_TRUE(closed.is(EBADF));
    EXPECT_FALSE(closed.is(EAGAIN));
    EXPECT_EQ(in_use.code(), std::error_code(EADDRINUSE, std::system_category()));
}

TEST(error_test, uses_current_errno_by_default) {
    errno = ETIMEDOUT;
    const auto value = nblisten::error::from_errno();

    EXPECT_EQ(value.value(), ETIMEDOUT);
    EXPECT_FALSE(value.message().empty());
}

TEST(error_test, default_constructed_error_is_empty) {
    const nblisten::error value;
    EXPECT_EQ(value.value(), 0);
    EXPECT_EQ(value, nblisten::error{});
    EXPECT_NE(value, nblisten::make_error_from_errno(EINVAL));
}

TEST(error_test, streams_message_and_value) {
    std::ostringstream out;
    out << nblisten::make_error_from_errno(EBADF);

    EXPECT_NE(out.str().find("(9)"), std::string::npos);
    EXPECT_EQ(out.str().find(nblisten::make_error_from_errno(EBADF).message()),
              0U);
}

} // namespace
