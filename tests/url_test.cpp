#include <ky/net/url.hpp>

#include <gtest/gtest.h>

#include <system_error>

using namespace ky::net;

namespace {

errc parse_error(std::string_view s) {
    try {
        (void)parse_url(s);
    } catch (const std::system_error& e) {
        return static_cast<errc>(e.code().value());
    }
    return errc{};
}

} // namespace

// ---------------------------------------------------------------------------
// parse_url
// ---------------------------------------------------------------------------
TEST(UrlTest, ParsesFullUrl) {
    const auto u = parse_url("HTTPS://user:pw@example.com:8443/a/b?x=1#frag");
    EXPECT_EQ(u.scheme, "https");
    EXPECT_EQ(u.host, "example.com");
    EXPECT_EQ(u.port, "8443");
    EXPECT_EQ(u.path, "/a/b");
    EXPECT_EQ(u.query, "?x=1");
    EXPECT_EQ(u.target(), "/a/b?x=1");
    EXPECT_EQ(u.host_header(), "example.com:8443");
}

TEST(UrlTest, DefaultsPathAndPort) {
    const auto u = parse_url("http://example.com");
    EXPECT_EQ(u.path, "/");
    EXPECT_EQ(u.effective_port(), "80");
    EXPECT_EQ(u.host_header(), "example.com");
    EXPECT_EQ(u.to_string(), "http://example.com/");
}

TEST(UrlTest, QueryWithoutPath) {
    const auto u = parse_url("http://h?q=1");
    EXPECT_EQ(u.target(), "/?q=1");
}

TEST(UrlTest, Ipv6Literal) {
    const auto u = parse_url("http://[::1]:8080/x");
    EXPECT_EQ(u.host, "::1");
    EXPECT_EQ(u.port, "8080");
    EXPECT_EQ(u.host_header(), "[::1]:8080");
}

TEST(UrlTest, RejectsBadInput) {
    EXPECT_EQ(parse_error("example.com/path"), errc::invalid_url);
    EXPECT_EQ(parse_error("http:///nohost"), errc::invalid_url);
    EXPECT_EQ(parse_error("ftp://example.com/"), errc::unsupported_scheme);
    EXPECT_EQ(parse_error("http://[::1/x"), errc::invalid_url);
}

TEST(UrlTest, ErrorCodesCarryCategory) {
    const std::error_code ec = errc::too_many_redirects;
    EXPECT_STREQ(ec.category().name(), "ky.net");
    EXPECT_EQ(ec.message(), "too many redirects");
}

// ---------------------------------------------------------------------------
// resolve_url
// ---------------------------------------------------------------------------
TEST(ResolveUrlTest, AbsoluteLocation) {
    const auto base = parse_url("http://a.test/x");
    EXPECT_EQ(resolve_url(base, "https://b.test/y").to_string(), "https://b.test/y");
}

TEST(ResolveUrlTest, SchemeRelative) {
    const auto base = parse_url("https://a.test/x");
    EXPECT_EQ(resolve_url(base, "//b.test/y").to_string(), "https://b.test/y");
}

TEST(ResolveUrlTest, AbsolutePathKeepsAuthority) {
    const auto base = parse_url("http://a.test:8080/x/y?q=1");
    EXPECT_EQ(resolve_url(base, "/z?r=2").to_string(), "http://a.test:8080/z?r=2");
}

TEST(ResolveUrlTest, QueryOnly) {
    const auto base = parse_url("http://a.test/x/y?q=1");
    EXPECT_EQ(resolve_url(base, "?r=2").to_string(), "http://a.test/x/y?r=2");
}

TEST(ResolveUrlTest, RelativePathWithDotSegments) {
    const auto base = parse_url("http://a.test/x/y/z");
    EXPECT_EQ(resolve_url(base, "w").to_string(), "http://a.test/x/y/w");
    EXPECT_EQ(resolve_url(base, "../w").to_string(), "http://a.test/x/w");
    EXPECT_EQ(resolve_url(base, "./w").to_string(), "http://a.test/x/y/w");
}

TEST(ResolveUrlTest, TrailingDotSegments) {
    const auto base = parse_url("http://a.test/a/b/c");
    EXPECT_EQ(resolve_url(base, "../..").to_string(), "http://a.test/");
    EXPECT_EQ(resolve_url(base, "..").to_string(), "http://a.test/a/");
    EXPECT_EQ(resolve_url(base, ".").to_string(), "http://a.test/a/b/");
    EXPECT_EQ(resolve_url(base, "/x/y/..").to_string(), "http://a.test/x/");
    EXPECT_EQ(resolve_url(base, "/..").to_string(), "http://a.test/");
}
