// STAKEGUARD - HTTP Client Tests
// Copyright (c) 2024 STAKEGUARD Developers
// MIT License

#include <gtest/gtest.h>

#include "stakeguard/net/http_client.h"

namespace stakeguard {
namespace net {
namespace test {

// ============================================================================
// URL Parsing
// ============================================================================

TEST(UrlTest, ParseHttpsDefaults) {
    auto url = Url::Parse("https://api.coingecko.com/api/v3/simple/price?ids=dusk-network");
    ASSERT_TRUE(url.has_value());

    EXPECT_EQ(url->scheme, "https");
    EXPECT_EQ(url->host, "api.coingecko.com");
    EXPECT_EQ(url->port, 443);
    EXPECT_EQ(url->target, "/api/v3/simple/price?ids=dusk-network");
    EXPECT_TRUE(url->IsSecure());
}

TEST(UrlTest, ParseExplicitPort) {
    auto url = Url::Parse("http://127.0.0.1:8080");
    ASSERT_TRUE(url.has_value());

    EXPECT_EQ(url->host, "127.0.0.1");
    EXPECT_EQ(url->port, 8080);
    EXPECT_EQ(url->target, "/");
    EXPECT_FALSE(url->IsSecure());
}

TEST(UrlTest, QueryWithoutPath) {
    auto url = Url::Parse("http://example.com?x=1");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->target, "/?x=1");
}

TEST(UrlTest, RejectsInvalid) {
    EXPECT_FALSE(Url::Parse("ftp://example.com/").has_value());
    EXPECT_FALSE(Url::Parse("example.com/path").has_value());
    EXPECT_FALSE(Url::Parse("https://").has_value());
    EXPECT_FALSE(Url::Parse("http://host:99999/").has_value());
    EXPECT_FALSE(Url::Parse("http://host:abc/").has_value());
}

// ============================================================================
// Request Serialization
// ============================================================================

TEST(HttpWireTest, BuildPostRequest) {
    auto url = Url::Parse("https://discord.com/api/webhooks/1/abc");
    ASSERT_TRUE(url.has_value());

    std::string body = R"({"content":"hi"})";
    std::string request = BuildHTTPRequest("POST", *url,
                                           {{"Content-Type", "application/json"}}, body);

    EXPECT_EQ(request.rfind("POST /api/webhooks/1/abc HTTP/1.1\r\n", 0), 0u);
    EXPECT_NE(request.find("Host: discord.com\r\n"), std::string::npos);
    EXPECT_NE(request.find("Content-Type: application/json\r\n"), std::string::npos);
    EXPECT_NE(request.find("Content-Length: 16\r\n"), std::string::npos);
    EXPECT_NE(request.find("Connection: close\r\n"), std::string::npos);
    EXPECT_EQ(request.substr(request.size() - body.size()), body);
}

TEST(HttpWireTest, HostIncludesNonDefaultPort) {
    auto url = Url::Parse("http://localhost:8080/hook");
    ASSERT_TRUE(url.has_value());

    std::string request = BuildHTTPRequest("GET", *url, {}, "");
    EXPECT_NE(request.find("Host: localhost:8080\r\n"), std::string::npos);
    EXPECT_EQ(request.find("Content-Length"), std::string::npos);
}

// ============================================================================
// Response Parsing
// ============================================================================

TEST(HttpWireTest, ParseContentLengthResponse) {
    std::string raw = "HTTP/1.1 200 OK\r\n"
                      "Content-Type: application/json\r\n"
                      "Content-Length: 2\r\n"
                      "\r\n"
                      "{}extra";
    std::string body;
    int status = 0;

    ASSERT_TRUE(ParseHTTPResponse(raw, body, status));
    EXPECT_EQ(status, 200);
    EXPECT_EQ(body, "{}");
}

TEST(HttpWireTest, ParseChunkedResponse) {
    std::string raw = "HTTP/1.1 200 OK\r\n"
                      "Transfer-Encoding: chunked\r\n"
                      "\r\n"
                      "5\r\nhello\r\n"
                      "6;ext=1\r\n world\r\n"
                      "0\r\n\r\n";
    std::string body;
    int status = 0;

    ASSERT_TRUE(ParseHTTPResponse(raw, body, status));
    EXPECT_EQ(status, 200);
    EXPECT_EQ(body, "hello world");
}

TEST(HttpWireTest, ParseErrorStatus) {
    std::string raw = "HTTP/1.1 429 Too Many Requests\r\nContent-Length: 0\r\n\r\n";
    std::string body;
    int status = 0;

    ASSERT_TRUE(ParseHTTPResponse(raw, body, status));
    EXPECT_EQ(status, 429);
    EXPECT_TRUE(body.empty());
}

TEST(HttpWireTest, ParseRejectsGarbage) {
    std::string body;
    int status = 0;
    EXPECT_FALSE(ParseHTTPResponse("not http", body, status));
    EXPECT_FALSE(ParseHTTPResponse("HTTP/1.1 2x0 OK\r\n\r\n", body, status));
    EXPECT_FALSE(ParseHTTPResponse("HTTP/1.1 200 OK\r\nNo-Terminator: 1\r\n", body, status));
}

TEST(HttpWireTest, ResponseCompleteness) {
    EXPECT_FALSE(IsHTTPResponseComplete("HTTP/1.1 200 OK\r\nContent-Length: 4\r\n"));
    EXPECT_FALSE(IsHTTPResponseComplete("HTTP/1.1 200 OK\r\nContent-Length: 4\r\n\r\nab"));
    EXPECT_TRUE(IsHTTPResponseComplete("HTTP/1.1 200 OK\r\nContent-Length: 4\r\n\r\nabcd"));

    EXPECT_FALSE(IsHTTPResponseComplete(
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n5\r\nhello\r\n"));
    EXPECT_TRUE(IsHTTPResponseComplete(
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n5\r\nhello\r\n0\r\n\r\n"));

    // No framing: only the peer closing ends the response
    EXPECT_FALSE(IsHTTPResponseComplete("HTTP/1.0 200 OK\r\n\r\nbody"));
}

TEST(HttpResponseTest, IsSuccess) {
    HttpResponse response;
    EXPECT_FALSE(response.IsSuccess());

    response.ok = true;
    response.statusCode = 204;
    EXPECT_TRUE(response.IsSuccess());

    response.statusCode = 500;
    EXPECT_FALSE(response.IsSuccess());
}

TEST(HttpClientTest, InvalidUrlReportsError) {
    HttpClient client;
    HttpResponse response = client.Get("not a url");

    EXPECT_FALSE(response.ok);
    EXPECT_FALSE(response.error.empty());
}

} // namespace test
} // namespace net
} // namespace stakeguard
