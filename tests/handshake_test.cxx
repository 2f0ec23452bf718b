#include <gtest/gtest.h>

#include "core/errors.hpp"
#include "gateway/handshake.hpp"

using namespace gateway;

TEST(HandshakeTest, FindsHeadEndWithCrLf)
{
    std::string buffer = "GET /stream HTTP/1.1\r\nHost: gw\r\n\r\n{\"type\":\"ping\"}\n";
    auto end = findHeadEnd(buffer);
    ASSERT_TRUE(end.has_value());
    EXPECT_EQ(buffer.substr(end->second), "{\"type\":\"ping\"}\n");
}

TEST(HandshakeTest, FindsHeadEndWithBareLf)
{
    std::string buffer = "GET /stream HTTP/1.1\nHost: gw\n\nrest";
    auto end = findHeadEnd(buffer);
    ASSERT_TRUE(end.has_value());
    EXPECT_EQ(buffer.substr(end->second), "rest");
}

TEST(HandshakeTest, IncompleteHeadHasNoEnd)
{
    EXPECT_FALSE(findHeadEnd("GET /stream HTTP/1.1\r\nHost: gw\r\n").has_value());
}

TEST(HandshakeTest, ParsesRequestLineHeadersAndQuery)
{
    auto request = parseHandshake("GET /stream?token=abc%2Fdef&x=1 HTTP/1.1\r\nHost: gw\r\nX-Trace-Id:  42 \r\n");
    EXPECT_EQ(request.method, "GET");
    EXPECT_EQ(request.path, "/stream");
    EXPECT_EQ(request.version, "HTTP/1.1");
    EXPECT_EQ(request.headers.at("host"), "gw");
    EXPECT_EQ(request.headers.at("x-trace-id"), "42");
    EXPECT_EQ(request.query.at("token"), "abc/def");
    EXPECT_EQ(request.query.at("x"), "1");
}

TEST(HandshakeTest, MalformedHeadIsAnAuthenticationFailure)
{
    EXPECT_THROW(parseHandshake("hello"), core::AuthenticationError);
    EXPECT_THROW(parseHandshake("GET /stream SMTP\r\n"), core::AuthenticationError);
    EXPECT_THROW(parseHandshake("GET /stream HTTP/1.1\r\nno colon here\r\n"), core::AuthenticationError);
    EXPECT_THROW(parseHandshake(std::string(kMaxHandshakeBytes + 1, 'G')), core::AuthenticationError);
}

TEST(HandshakeTest, BearerHeaderWinsOverQuery)
{
    auto request = parseHandshake("GET /stream?token=from-query HTTP/1.1\r\nAuthorization: bearer from-header\r\n");
    EXPECT_EQ(extractCredential(request), std::optional<std::string>("from-header"));
}

TEST(HandshakeTest, FallsBackToQueryParameters)
{
    EXPECT_EQ(extractCredential(parseHandshake("GET /stream?token=q1 HTTP/1.1\r\n")),
              std::optional<std::string>("q1"));
    EXPECT_EQ(extractCredential(parseHandshake("GET /stream?access_token=q2 HTTP/1.1\r\n")),
              std::optional<std::string>("q2"));
}

TEST(HandshakeTest, MissingCredential)
{
    EXPECT_FALSE(extractCredential(parseHandshake("GET /stream HTTP/1.1\r\nAuthorization: Basic dXNlcg==\r\n")));
    EXPECT_FALSE(extractCredential(parseHandshake("GET /stream?token= HTTP/1.1\r\n")));
}

TEST(HandshakeTest, BuiltHandshakeParsesBack)
{
    auto head = buildHandshake("127.0.0.1:7600", "/stream", "dev-token-t1");
    auto end = findHeadEnd(head);
    ASSERT_TRUE(end.has_value());
    EXPECT_EQ(end->second, head.size());

    auto request = parseHandshake(std::string_view(head).substr(0, end->first));
    EXPECT_EQ(request.path, "/stream");
    EXPECT_EQ(extractCredential(request), std::optional<std::string>("dev-token-t1"));
}
