#include <core/util/address.h>
#include <gtest/gtest.h>

using namespace peerpin::core;

TEST(AddressTest, HttpsUrlWithPortAndPath) {
    auto url = ParseHttpsUrl("https://localhost:8443/hello");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->host, "localhost");
    EXPECT_EQ(url->port, 8443);
    EXPECT_EQ(url->target, "/hello");
}

TEST(AddressTest, HttpsUrlDefaults) {
    auto url = ParseHttpsUrl("https://example.org");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->host, "example.org");
    EXPECT_EQ(url->port, 443);
    EXPECT_EQ(url->target, "/");
}

TEST(AddressTest, HttpsUrlKeepsQuery) {
    auto url = ParseHttpsUrl("https://127.0.0.1:9000/whoami?verbose=1");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->host, "127.0.0.1");
    EXPECT_EQ(url->target, "/whoami?verbose=1");
}

TEST(AddressTest, HttpsUrlBracketedIpv6) {
    auto url = ParseHttpsUrl("https://[::1]:8443/hello");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->host, "::1");
    EXPECT_EQ(url->port, 8443);
}

TEST(AddressTest, HttpsUrlRejectsMalformed) {
    EXPECT_FALSE(ParseHttpsUrl("http://localhost:8443/hello").has_value());
    EXPECT_FALSE(ParseHttpsUrl("localhost:8443").has_value());
    EXPECT_FALSE(ParseHttpsUrl("https://").has_value());
    EXPECT_FALSE(ParseHttpsUrl("https://localhost:0/").has_value());
    EXPECT_FALSE(ParseHttpsUrl("https://localhost:70000/").has_value());
    EXPECT_FALSE(ParseHttpsUrl("https://localhost:abc/").has_value());
    EXPECT_FALSE(ParseHttpsUrl("https://[::1/").has_value());
}

TEST(AddressTest, ListenAddressWithoutHostBindsEverywhere) {
    auto endpoint = ParseListenAddress(":8443");
    ASSERT_TRUE(endpoint.has_value());
    EXPECT_EQ(endpoint->address().to_string(), "0.0.0.0");
    EXPECT_EQ(endpoint->port(), 8443);
}

TEST(AddressTest, ListenAddressWithHost) {
    auto loopback = ParseListenAddress("localhost:9000");
    ASSERT_TRUE(loopback.has_value());
    EXPECT_EQ(loopback->address().to_string(), "127.0.0.1");

    auto v6 = ParseListenAddress("[::1]:9000");
    ASSERT_TRUE(v6.has_value());
    EXPECT_TRUE(v6->address().is_v6());

    auto ephemeral = ParseListenAddress("127.0.0.1:0");
    ASSERT_TRUE(ephemeral.has_value());
    EXPECT_EQ(ephemeral->port(), 0);
}

TEST(AddressTest, ListenAddressRejectsMalformed) {
    EXPECT_FALSE(ParseListenAddress("8443").has_value());
    EXPECT_FALSE(ParseListenAddress("host.example:8443").has_value());
    EXPECT_FALSE(ParseListenAddress(":").has_value());
    EXPECT_FALSE(ParseListenAddress(":99999").has_value());
}
