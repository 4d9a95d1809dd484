// src/http_transport.hpp
// Direct HTTP/JSON transport with retry, backoff and error translation.

#pragma once

#include "http.hpp"
#include "huefy/config.hpp"
#include "huefy/transport.hpp"

#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <string>

namespace huefy {

// Translate a non-2xx response into the error registered for its code.
// Undecodable bodies become code "HTTP_<status>" with the raw body as message.
std::exception_ptr translate_error_response(int status, const std::string& status_text,
                                            const std::string& body);

class HttpTransport : public Transport {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    static const char* const USER_AGENT;

    // Uses a SocketHttpSender and real sleeps. Throws ConfigurationError on an
    // unparseable endpoint.
    HttpTransport(const std::string& api_key, const HuefyConfig& config);

    HttpTransport(const std::string& api_key, const HuefyConfig& config,
                  std::unique_ptr<http::HttpSender> sender, Sleeper sleeper = Sleeper());

    ~HttpTransport() override;

    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    nlohmann::json send_email(const nlohmann::json& request) override;
    nlohmann::json send_bulk_emails(const nlohmann::json& requests) override;
    nlohmann::json health_check() override;

    TransportMode mode() const noexcept override { return TransportMode::Http; }
    const std::string& endpoint() const noexcept override { return endpoint_; }
    std::chrono::milliseconds timeout() const noexcept override { return config_.timeout(); }

private:
    nlohmann::json make_request(const char* method, const std::string& path,
                                const nlohmann::json* body);

    std::string api_key_;
    HuefyConfig config_;
    std::string endpoint_;
    http::Url base_;
    std::unique_ptr<http::HttpSender> sender_;
    Sleeper sleeper_;
};

} // namespace huefy
