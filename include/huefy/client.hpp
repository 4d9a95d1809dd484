// include/huefy/client.hpp
// Huefy email client: single and bulk template sends plus health checks.

#pragma once

#include "config.hpp"
#include "error.hpp"
#include "models.hpp"
#include "transport.hpp"
#include "types.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace huefy {

// The Huefy client.
//
// Created via HuefyClient::create(api_key, config). The transport (kernel
// binary or HTTP) is chosen from config.transport() once, at construction.
// Calls are synchronous and block until the backend answers or fails.
//
// Example:
//   auto client = HuefyClient::create("hk_live_...", HuefyConfig::production());
//   auto res = client->send_email(SendEmailRequest("welcome", "jane@example.com",
//                                                  {{"name", "Jane"}}));
class HuefyClient {
public:
    // Throws ValidationError on an empty or blank API key, ConfigurationError
    // when the selected transport cannot be set up.
    static std::unique_ptr<HuefyClient> create(const std::string& api_key,
                                               HuefyConfig config = HuefyConfig());

    // Bind the client to an already constructed transport.
    static std::unique_ptr<HuefyClient> with_transport(const std::string& api_key,
                                                       HuefyConfig config,
                                                       std::unique_ptr<Transport> transport);

    ~HuefyClient();

    HuefyClient(const HuefyClient&) = delete;
    HuefyClient& operator=(const HuefyClient&) = delete;
    HuefyClient(HuefyClient&&) noexcept;
    HuefyClient& operator=(HuefyClient&&) noexcept;

    // Validate and send one email. Transport errors propagate unchanged.
    SendEmailResponse send_email(const SendEmailRequest& request);

    // Validate every request, then send them in a single call. An empty list
    // or an invalid element throws ValidationError before any I/O.
    BulkEmailResponse send_bulk_emails(const std::vector<SendEmailRequest>& requests);

    HealthResponse health_check();

    TransportMode transport_mode() const noexcept;
    const std::string& endpoint() const noexcept;
    std::chrono::milliseconds timeout() const noexcept;
    const HuefyConfig& config() const noexcept;

private:
    HuefyClient(const std::string& api_key, HuefyConfig config,
                std::unique_ptr<Transport> transport);
    struct Inner;
    std::unique_ptr<Inner> inner_;
};

} // namespace huefy
