#include "nblisten/net/resolver.hpp"

#include <algorithm>
#include <cerrno>
#include <gtest/gtest.h>

namespace {

TEST(resolver_test, resolves_localhost_with_requested_port) {
    const auto resolved = nblisten::net::resolve("localhost", "80");
    ASSERT_TRUE(resolved.has_value()) << resolved.error().message();
    ASSERT_FALSE(resolved.value().empty());
    EXPECT_TRUE(std::all_of(
        resolved.value().begin(), resolved.value().end(),
        [](const nblisten::net::endpoint& value) { return value.port == 80; }));
}

TEST(resolver_test, numeric_literal_resolves_to_itself) {
    const auto resolved = nblisten::net::resolve("127.0.0.1:4242");
    ASSERT_TRUE(resolved.has_value()) << resolved.error().message();
    ASSERT_EQ(resolved.value().size(), 1U);
    EXPECT_EQ(resolved.value().front(), nblisten::net::endpoint::loopback(4242));
}

TEST(resolver_test, malformed_address_text_is_invalid) {
    const auto resolved = nblisten::net::resolve("localhost");
    ASSERT_FALSE(resolved.has_value());
    EXPECT_EQ(resolved.error().value(), EINVAL);
}

TEST(resolver_test, unknown_service_fails) {
    const auto resolved =
        nblisten::net::resolve("127.0.0.1", "no-such-service-name");
    ASSERT_FALSE(resolved.has_value());
    EXPECT_NE(resolved.error().value(), 0);
}

} // namespace
