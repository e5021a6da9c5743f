#include "nblisten/net/endpoint.hpp"

#include <cerrno>
#include <gtest/gtest.h>

namespace {

TEST(endpoint_test, parse_and_format_ipv4) {
    const auto parsed = nblisten::net::parse_endpoint("127.0.0.1:8080");
    ASSERT_TRUE(parsed.has_value()) << parsed.error().message();
    EXPECT_EQ(parsed.value(), nblisten::net::endpoint::loopback(8080));
    EXPECT_FALSE(parsed.value().is_v6());
    EXPECT_EQ(nblisten::net::format_endpoint(parsed.value()), "127.0.0.1:8080");
}

TEST(endpoint_test, parse_and_format_bracketed_ipv6) {
    const auto parsed = nblisten::net::parse_endpoint("[::1]:9000");
    ASSERT_TRUE(parsed.has_value()) << parsed.error().message();
    EXPECT_EQ(parsed.value().host, "::1");
    EXPECT_EQ(parsed.value().port, 9000);
    EXPECT_TRUE(parsed.value().is_v6());
    EXPECT_EQ(nblisten::net::format_endpoint(parsed.value()), "[::1]:9000");
}

TEST(endpoint_test, wildcard_port_zero_is_accepted) {
    const auto parsed = nblisten::net::parse_endpoint("0.0.0.0:0");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed.value(), nblisten::net::endpoint::any(0));
}

TEST(endpoint_test, rejects_malformed_text) {
    for (const char* text : {"127.0.0.1", "127.0.0.1:", ":80", "bad-ip:80",
                             "127.0.0.1:70000", "127.0.0.1:8o", "::1:80",
                             "[::1]80", "[::1]:", "[]:80", "[::1"}) {
        const auto parsed = nblisten::net::parse_endpoint(text);
        ASSERT_FALSE(parsed.has_value()) << text;
        EXPECT_EQ(parsed.error().value(), EINVAL) << text;
    }
}

TEST(endpoint_test, named_constructors) {
    EXPECT_EQ(nblisten::net::endpoint::any(80).host, "0.0.0.0");
    EXPECT_EQ(nblisten::net::endpoint::any_v6(80).host, "::");
    EXPECT_EQ(nblisten::net::format_endpoint(nblisten::net::endpoint::loopback_v6(1)),
              "[::1]:1");
}

} // namespace
