#include <gtest/gtest.h>
#include "network/url.hpp"

using namespace tether::network;

TEST(UrlTest, SecureUrlWithPortAndPath) {
    auto result = parse_url("wss://stream.binance.com:9443/ws");

    ASSERT_TRUE(result.is_ok()) << result.error();
    const auto& ep = result.value();
    EXPECT_EQ(ep.scheme, "wss");
    EXPECT_TRUE(ep.use_tls);
    EXPECT_EQ(ep.host, "stream.binance.com");
    EXPECT_EQ(ep.port, "9443");
    EXPECT_EQ(ep.target, "/ws");
    EXPECT_EQ(ep.host_header(), "stream.binance.com:9443");
}

TEST(UrlTest, DefaultPorts) {
    auto plain = parse_url("ws://example.com");
    auto secure = parse_url("WSS://example.com/");

    ASSERT_TRUE(plain.is_ok());
    ASSERT_TRUE(secure.is_ok());
    EXPECT_EQ(plain.value().port, "80");
    EXPECT_EQ(plain.value().target, "/");
    EXPECT_FALSE(plain.value().use_tls);
    EXPECT_EQ(secure.value().port, "443");
    EXPECT_EQ(secure.value().host_header(), "example.com");
}

TEST(UrlTest, QueryIsKeptAndFragmentDropped) {
    auto with_path = parse_url("ws://h/stream?streams=a/b#frag");
    auto bare_query = parse_url("ws://h?x=1");
    auto bare_fragment = parse_url("ws://h#top");

    ASSERT_TRUE(with_path.is_ok());
    ASSERT_TRUE(bare_query.is_ok());
    ASSERT_TRUE(bare_fragment.is_ok());
    EXPECT_EQ(with_path.value().target, "/stream?streams=a/b");
    EXPECT_EQ(bare_query.value().target, "/?x=1");
    EXPECT_EQ(bare_fragment.value().host, "h");
    EXPECT_EQ(bare_fragment.value().target, "/");
}

TEST(UrlTest, Ipv6Literal) {
    auto result = parse_url("ws://[::1]:8080/feed");

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().host, "::1");
    EXPECT_EQ(result.value().port, "8080");
}

TEST(UrlTest, CredentialsAreStripped) {
    auto result = parse_url("ws://user:pass@localhost:9000");

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().host, "localhost");
    EXPECT_EQ(result.value().port, "9000");
}

TEST(UrlTest, RejectsInvalidUrls) {
    EXPECT_TRUE(parse_url("localhost:9000").is_err());
    EXPECT_TRUE(parse_url("http://example.com").is_err());
    EXPECT_TRUE(parse_url("ws://").is_err());
    EXPECT_TRUE(parse_url("ws://:80/").is_err());
    EXPECT_TRUE(parse_url("ws://host:99999").is_err());
    EXPECT_TRUE(parse_url("ws://host:abc").is_err());
    EXPECT_TRUE(parse_url("ws://[::1/").is_err());
}

TEST(UrlTest, ErrorMessageNamesTheProblem) {
    auto result = parse_url("ftp://example.com");

    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error().find("scheme"), std::string::npos);
}
