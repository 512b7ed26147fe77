// STAKEGUARD - HTTP Client Implementation
// Copyright (c) 2024 STAKEGUARD Developers
// MIT License

#include "stakeguard/net/http_client.h"
#include "stakeguard/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <cstdlib>
#include <memory>
#include <stdexcept>

#include <netdb.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace stakeguard {
namespace net {

// ============================================================================
// URL Parsing
// ============================================================================

std::optional<Url> Url::Parse(const std::string& url) {
    Url result;

    size_t schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        return std::nullopt;
    }
    result.scheme = url.substr(0, schemeEnd);
    std::transform(result.scheme.begin(), result.scheme.end(), result.scheme.begin(), ::tolower);
    if (result.scheme != "http" && result.scheme != "https") {
        return std::nullopt;
    }

    size_t authorityStart = schemeEnd + 3;
    size_t pathStart = url.find_first_of("/?", authorityStart);
    std::string authority = url.substr(authorityStart,
        pathStart == std::string::npos ? std::string::npos : pathStart - authorityStart);
    if (authority.empty()) {
        return std::nullopt;
    }

    result.port = result.IsSecure() ? 443 : 80;
    size_t colon = authority.rfind(':');
    if (colon != std::string::npos) {
        std::string portStr = authority.substr(colon + 1);
        if (portStr.empty() || portStr.size() > 5 ||
            !std::all_of(portStr.begin(), portStr.end(), ::isdigit)) {
            return std::nullopt;
        }
        unsigned long port = std::stoul(portStr);
        if (port == 0 || port > 65535) {
            return std::nullopt;
        }
        result.port = static_cast<uint16_t>(port);
        authority = authority.substr(0, colon);
    }
    if (authority.empty()) {
        return std::nullopt;
    }
    result.host = authority;

    if (pathStart == std::string::npos) {
        result.target = "/";
    } else {
        result.target = url.substr(pathStart);
        if (result.target[0] == '?') {
            result.target = "/" + result.target;
        }
    }

    return result;
}

// ============================================================================
// Wire Format
// ============================================================================

std::string BuildHTTPRequest(const std::string& method, const Url& url,
                             const HeaderMap& headers, const std::string& body) {
    std::string out = method + " " + url.target + " HTTP/1.1\r\nHost: " + url.host;
    if (url.port != (url.IsSecure() ? 443 : 80)) {
        out += ":" + std::to_string(url.port);
    }
    out += "\r\n";

    for (const auto& header : headers) {
        out += header.first + ": " + header.second + "\r\n";
    }
    if (!body.empty() || method == "POST") {
        out += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    }
    out += "Connection: close\r\n\r\n";
    out += body;
    return out;
}

namespace {

/// Status line and header block of a response, header names lowercased
struct ResponseHead {
    int statusCode{0};
    std::map<std::string, std::string> headers;
    size_t bodyOffset{0};

    bool IsChunked() const {
        auto it = headers.find("transfer-encoding");
        return it != headers.end() && it->second.find("chunked") != std::string::npos;
    }

    std::optional<size_t> ContentLength() const {
        auto it = headers.find("content-length");
        if (it == headers.end() || it->second.empty() ||
            !std::all_of(it->second.begin(), it->second.end(), ::isdigit)) {
            return std::nullopt;
        }
        return static_cast<size_t>(std::strtoull(it->second.c_str(), nullptr, 10));
    }
};

std::string TrimSpaces(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    return s.substr(begin, s.find_last_not_of(" \t") - begin + 1);
}

/// Fails when the blank line ending the headers has not arrived or the
/// status line is not "HTTP/x.y NNN ..."
std::optional<ResponseHead> ReadHead(const std::string& raw) {
    size_t end = raw.find("\r\n\r\n");
    if (end == std::string::npos || raw.compare(0, 5, "HTTP/") != 0) {
        return std::nullopt;
    }

    ResponseHead head;
    head.bodyOffset = end + 4;

    size_t lineEnd = raw.find("\r\n");
    size_t space = raw.find(' ');
    if (space == std::string::npos || space + 4 > lineEnd) {
        return std::nullopt;
    }
    std::string code = raw.substr(space + 1, 3);
    if (!std::all_of(code.begin(), code.end(), ::isdigit)) {
        return std::nullopt;
    }
    head.statusCode = std::atoi(code.c_str());

    size_t pos = lineEnd + 2;
    while (pos < end) {
        size_t next = raw.find("\r\n", pos);
        std::string line = raw.substr(pos, next - pos);
        size_t colon = line.find(':');
        if (colon != std::string::npos) {
            std::string name = line.substr(0, colon);
            std::transform(name.begin(), name.end(), name.begin(), ::tolower);
            head.headers[name] = TrimSpaces(line.substr(colon + 1));
        }
        pos = next + 2;
    }
    return head;
}

/// Decodes a chunked body. nullopt until the terminating zero-size chunk.
std::optional<std::string> DecodeChunked(const std::string& raw, size_t offset) {
    std::string body;
    size_t pos = offset;
    for (;;) {
        size_t lineEnd = raw.find("\r\n", pos);
        if (lineEnd == std::string::npos) {
            return std::nullopt;
        }
        // Size may carry ";extension"
        std::string sizeField = raw.substr(pos, lineEnd - pos);
        char* parsedEnd = nullptr;
        unsigned long size = std::strtoul(sizeField.c_str(), &parsedEnd, 16);
        if (parsedEnd == sizeField.c_str()) {
            return std::nullopt;
        }
        if (size == 0) {
            return body;
        }
        pos = lineEnd + 2;
        if (pos + size > raw.size()) {
            return std::nullopt;
        }
        body.append(raw, pos, size);
        pos += size;
        if (raw.compare(pos, 2, "\r\n") == 0) {
            pos += 2;
        }
    }
}

} // namespace

bool IsHTTPResponseComplete(const std::string& raw) {
    auto head = ReadHead(raw);
    if (!head) {
        return false;
    }
    if (head->IsChunked()) {
        return DecodeChunked(raw, head->bodyOffset).has_value();
    }
    if (auto length = head->ContentLength()) {
        return raw.size() >= head->bodyOffset + *length;
    }
    // Neither framing: read until the peer closes
    return false;
}

bool ParseHTTPResponse(const std::string& raw, std::string& body, int& statusCode) {
    auto head = ReadHead(raw);
    if (!head) {
        return false;
    }
    statusCode = head->statusCode;

    if (head->IsChunked()) {
        auto decoded = DecodeChunked(raw, head->bodyOffset);
        if (!decoded) {
            return false;
        }
        body = std::move(*decoded);
        return true;
    }

    body = raw.substr(head->bodyOffset);
    auto length = head->ContentLength();
    if (length && body.size() > *length) {
        body.resize(*length);
    }
    return true;
}

// ============================================================================
// Transport
// ============================================================================

namespace {

/// Connected socket, optionally wrapped in TLS. Closes on destruction.
class Connection {
public:
    Connection() = default;
    ~Connection() { Close(); }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    void Open(const Url& url, std::chrono::seconds timeout, bool verifyPeer) {
        struct addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* result = nullptr;
        std::string portStr = std::to_string(url.port);
        int status = getaddrinfo(url.host.c_str(), portStr.c_str(), &hints, &result);
        if (status != 0) {
            throw std::runtime_error("Failed to resolve " + url.host + ": " + gai_strerror(status));
        }

        struct timeval tv;
        tv.tv_sec = static_cast<time_t>(timeout.count());
        tv.tv_usec = 0;

        for (struct addrinfo* rp = result; rp != nullptr; rp = rp->ai_next) {
            socket_ = socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
            if (socket_ < 0) continue;

            setsockopt(socket_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
            setsockopt(socket_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

            if (connect(socket_, rp->ai_addr, rp->ai_addrlen) == 0) break;

            close(socket_);
            socket_ = -1;
        }
        freeaddrinfo(result);

        if (socket_ < 0) {
            throw std::runtime_error("Failed to connect to " + url.host + ":" + portStr);
        }

        if (url.IsSecure()) {
            StartTls(url.host, verifyPeer);
        }
    }

    void SendAll(const std::string& data) {
        size_t totalSent = 0;
        while (totalSent < data.size()) {
            int sent;
            if (ssl_) {
                sent = SSL_write(ssl_, data.data() + totalSent,
                                 static_cast<int>(data.size() - totalSent));
            } else {
                sent = static_cast<int>(send(socket_, data.data() + totalSent,
                                             data.size() - totalSent, MSG_NOSIGNAL));
            }
            if (sent <= 0) {
                throw std::runtime_error("Send failed");
            }
            totalSent += static_cast<size_t>(sent);
        }
    }

    /// Returns bytes read, 0 at end of stream
    size_t Receive(char* buffer, size_t size) {
        int received;
        if (ssl_) {
            received = SSL_read(ssl_, buffer, static_cast<int>(size));
            if (received <= 0) {
                int err = SSL_get_error(ssl_, received);
                if (err == SSL_ERROR_ZERO_RETURN) return 0;
                // Servers often drop the TCP connection without close_notify
                if (err == SSL_ERROR_SYSCALL && ERR_peek_error() == 0) return 0;
                throw std::runtime_error("TLS receive failed");
            }
        } else {
            received = static_cast<int>(recv(socket_, buffer, size, 0));
            if (received < 0) {
                throw std::runtime_error(errno == EAGAIN || errno == EWOULDBLOCK
                                             ? "Receive timed out"
                                             : "Receive failed");
            }
        }
        return static_cast<size_t>(received);
    }

    void Close() {
        if (ssl_) {
            SSL_shutdown(ssl_);
            SSL_free(ssl_);
            ssl_ = nullptr;
        }
        if (ctx_) {
            SSL_CTX_free(ctx_);
            ctx_ = nullptr;
        }
        if (socket_ >= 0) {
            close(socket_);
            socket_ = -1;
        }
    }

private:
    void StartTls(const std::string& host, bool verifyPeer) {
        ctx_ = SSL_CTX_new(TLS_client_method());
        if (!ctx_) {
            throw std::runtime_error("SSL_CTX_new failed");
        }
        if (verifyPeer) {
            SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
            SSL_CTX_set_default_verify_paths(ctx_);
        }

        ssl_ = SSL_new(ctx_);
        if (!ssl_) {
            throw std::runtime_error("SSL_new failed");
        }
        SSL_set_fd(ssl_, socket_);
        SSL_set_tlsext_host_name(ssl_, host.c_str());
        if (verifyPeer) {
            SSL_set1_host(ssl_, host.c_str());
        }

        if (SSL_connect(ssl_) != 1) {
            unsigned long err = ERR_get_error();
            char reason[256] = {0};
            ERR_error_string_n(err, reason, sizeof(reason));
            throw std::runtime_error(std::string("TLS handshake failed: ") + reason);
        }
    }

    int socket_{-1};
    SSL_CTX* ctx_{nullptr};
    SSL* ssl_{nullptr};
};

} // namespace

// ============================================================================
// HttpClient Implementation
// ============================================================================

HttpClient::HttpClient() : HttpClient(Config{}) {}

HttpClient::HttpClient(const Config& config) : config_(config) {}

HttpResponse HttpClient::Get(const std::string& url, const HeaderMap& headers) {
    return Request("GET", url, headers, "");
}

HttpResponse HttpClient::Post(const std::string& url, const std::string& body,
                              const HeaderMap& headers) {
    HeaderMap merged = headers;
    if (merged.find("Content-Type") == merged.end()) {
        merged["Content-Type"] = "application/json";
    }
    return Request("POST", url, merged, body);
}

HttpResponse HttpClient::Request(const std::string& method, const std::string& url,
                                 const HeaderMap& headers, const std::string& body) {
    HttpResponse response;

    auto parsed = Url::Parse(url);
    if (!parsed) {
        response.error = "Invalid URL";
        return response;
    }

    HeaderMap allHeaders = headers;
    allHeaders.emplace("User-Agent", config_.userAgent);
    allHeaders.emplace("Accept", "application/json");

    std::string raw;
    try {
        Connection conn;
        conn.Open(*parsed, config_.timeout, config_.verifyPeer);
        conn.SendAll(BuildHTTPRequest(method, *parsed, allHeaders, body));

        auto deadline = std::chrono::steady_clock::now() + config_.timeout;
        char buffer[4096];
        while (true) {
            size_t received = conn.Receive(buffer, sizeof(buffer));
            if (received == 0) break;
            raw.append(buffer, received);
            if (IsHTTPResponseComplete(raw)) break;
            if (std::chrono::steady_clock::now() > deadline) {
                throw std::runtime_error("Request timed out");
            }
        }
    } catch (const std::exception& e) {
        response.error = e.what();
        LOG_DEBUG(util::LogCategory::DEFAULT) << method << " " << parsed->host
                                             << " failed: " << e.what();
        return response;
    }

    if (!ParseHTTPResponse(raw, response.body, response.statusCode)) {
        response.error = "Invalid HTTP response";
        return response;
    }

    response.ok = true;
    return response;
}

} // namespace net
} // namespace stakeguard
