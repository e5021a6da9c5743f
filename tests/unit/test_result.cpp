#include "nblisten/core/result.hpp"

#include <cerrno>
#include <gtest/gtest.h>
#include <string>
#include <type_traits>

namespace {

nblisten::result<int> parse_positive(int value) {
    if (value > 0) {
        return value;
    }
    return nblisten::err<int>(nblisten::make_error_from_errno(EINVAL));
}

TEST(result_test, stores_success_value) {
    const auto value = parse_positive(7);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value.value(), 7);
}

TEST(result_test, stores_failure_value) {
    const auto value = parse_positive(0);
    ASSERT_FALSE(value.has_value());
    EXPECT_EQ(value.error().value(), EINVAL);
}

TEST(result_test, ok_decays_its_argument) {
    const auto value = nblisten::ok(std::string{"listener"});
    static_assert(std::is_same_v<std::remove_cvref_t<decltype(value)>::value_type,
                                 std::string>);
    EXPECT_EQ(value.value(), "listener");
}

TEST(result_test, supports_void_results) {
    EXPECT_TRUE(nblisten::ok().has_value());

    const auto failed =
        nblisten::err<void>(nblisten::make_error_from_errno(EBADF));
    ASSERT_FALSE(failed.has_value());
    EXPECT_TRUE(failed.error().is(EBADF));
}

} // namespace
