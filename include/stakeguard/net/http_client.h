// STAKEGUARD - HTTP Client
// Copyright (c) 2024 STAKEGUARD Developers
// MIT License
//
// Minimal HTTP/1.1 client used for the market price feed and webhook
// notifications. HTTPS is provided by OpenSSL. One connection per request.

#ifndef STAKEGUARD_NET_HTTP_CLIENT_H
#define STAKEGUARD_NET_HTTP_CLIENT_H

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace stakeguard {
namespace net {

// ============================================================================
// URL
// ============================================================================

struct Url {
    std::string scheme;     // "http" or "https"
    std::string host;
    uint16_t port{0};
    std::string target;     // Path plus query, at least "/"

    bool IsSecure() const { return scheme == "https"; }

    /// Parse an absolute http(s) URL. Returns nullopt for anything else.
    static std::optional<Url> Parse(const std::string& url);
};

// ============================================================================
// Request / Response
// ============================================================================

using HeaderMap = std::map<std::string, std::string>;

struct HttpResponse {
    bool ok{false};         // Transport succeeded and a status line was read
    int statusCode{0};
    std::string body;
    std::string error;      // Transport or parse failure reason

    bool IsSuccess() const { return ok && statusCode >= 200 && statusCode < 300; }
};

/// Serialize a request. Always sends "Connection: close".
std::string BuildHTTPRequest(const std::string& method, const Url& url,
                             const HeaderMap& headers, const std::string& body);

/**
 * Parse a complete raw response into status code and body, decoding
 * chunked transfer encoding.
 * @return false if the status line or header block is malformed
 */
bool ParseHTTPResponse(const std::string& raw, std::string& body, int& statusCode);

/// True once `raw` holds a full response per Content-Length or chunked framing
bool IsHTTPResponseComplete(const std::string& raw);

// ============================================================================
// Client Interface
// ============================================================================

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    virtual HttpResponse Get(const std::string& url, const HeaderMap& headers = {}) = 0;

    virtual HttpResponse Post(const std::string& url, const std::string& body,
                              const HeaderMap& headers = {}) = 0;
};

// ============================================================================
// Socket Client
// ============================================================================

class HttpClient : public IHttpClient {
public:
    struct Config {
        std::chrono::seconds timeout{10};
        std::string userAgent{"stakeguard/1.0"};
        bool verifyPeer{true};
    };

    HttpClient();
    explicit HttpClient(const Config& config);

    HttpResponse Get(const std::string& url, const HeaderMap& headers = {}) override;

    HttpResponse Post(const std::string& url, const std::string& body,
                      const HeaderMap& headers = {}) override;

    const Config& GetConfig() const { return config_; }

private:
    HttpResponse Request(const std::string& method, const std::string& url,
                         const HeaderMap& headers, const std::string& body);

    Config config_;
};

} // namespace net
} // namespace stakeguard

#endif // STAKEGUARD_NET_HTTP_CLIENT_H
