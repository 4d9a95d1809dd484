// src/http_connection.hpp
// Socket-backed HTTP sender: one TCP (optionally TLS) connection per request.

#pragma once

#include "http.hpp"
#include <openssl/ssl.h>
#include <chrono>
#include <memory>
#include <string>

namespace huefy {
namespace http {

struct SenderOptions {
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds timeout{30000};  // whole request, connect included
    bool tls_verify_peer = true;
    std::string tls_ca_file;                   // empty: system trust store
    size_t max_response_bytes = 16u << 20;
    bool load_tls = false;                     // build the TLS context in the constructor
};

// Owns an SSL_CTX configured for client use (TLS 1.2+, trust store, peer
// verification).
class TlsContext {
public:
    TlsContext(bool verify_peer, const std::string& ca_file);
    ~TlsContext();

    TlsContext(const TlsContext&) = delete;
    TlsContext& operator=(const TlsContext&) = delete;

    SSL_CTX* get() const noexcept { return ctx_; }
    bool verify_peer() const noexcept { return verify_peer_; }

private:
    SSL_CTX* ctx_ = nullptr;
    bool verify_peer_;
};

class SocketHttpSender : public HttpSender {
public:
    explicit SocketHttpSender(SenderOptions options);
    ~SocketHttpSender() override;

    HttpResponse send(const HttpRequest& req) override;

private:
    TlsContext& tls_context();

    SenderOptions options_;
    std::unique_ptr<TlsContext> tls_;  // created on first https request
};

} // namespace http
} // namespace huefy
