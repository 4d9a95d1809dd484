// src/client.cpp
// Huefy client implementation: validation, transport selection, decoding.

#include "huefy/client.hpp"
#include "http_transport.hpp"
#include "kernel_transport.hpp"
#include "validation.hpp"

namespace huefy {

using json = nlohmann::json;

namespace {

void require_api_key(const std::string& api_key) {
    if (!validation::check_api_key(api_key)) {
        throw ValidationError("apiKey", "is required");
    }
}

std::unique_ptr<Transport> make_transport(const std::string& api_key, const HuefyConfig& config) {
    switch (config.transport()) {
        case TransportMode::Http:
            return std::make_unique<HttpTransport>(api_key, config);
        case TransportMode::Kernel:
            return std::make_unique<KernelTransport>(api_key, config);
    }
    throw ConfigurationError("unknown transport mode");
}

} // namespace

struct HuefyClient::Inner {
    HuefyConfig config;
    std::unique_ptr<Transport> transport;
};

HuefyClient::HuefyClient(const std::string& api_key, HuefyConfig config,
                         std::unique_ptr<Transport> transport)
    : inner_(std::make_unique<Inner>(Inner{std::move(config), std::move(transport)})) {
    require_api_key(api_key);
    if (!inner_->transport) {
        throw ConfigurationError("transport must not be null");
    }

    inner_->config.log(LogLevel::Debug,
                       std::string("huefy client using ") + to_string(inner_->transport->mode()) +
                           " transport, endpoint " + inner_->transport->endpoint() +
                           ", timeout " + std::to_string(inner_->transport->timeout().count()) +
                           "ms");
}

HuefyClient::~HuefyClient() = default;
HuefyClient::HuefyClient(HuefyClient&&) noexcept = default;
HuefyClient& HuefyClient::operator=(HuefyClient&&) noexcept = default;

std::unique_ptr<HuefyClient> HuefyClient::create(const std::string& api_key, HuefyConfig config) {
    require_api_key(api_key);
    auto transport = make_transport(api_key, config);
    return std::unique_ptr<HuefyClient>(
        new HuefyClient(api_key, std::move(config), std::move(transport)));
}

std::unique_ptr<HuefyClient> HuefyClient::with_transport(const std::string& api_key,
                                                         HuefyConfig config,
                                                         std::unique_ptr<Transport> transport) {
    return std::unique_ptr<HuefyClient>(
        new HuefyClient(api_key, std::move(config), std::move(transport)));
}

// --- Calls ---

SendEmailResponse HuefyClient::send_email(const SendEmailRequest& request) {
    request.validate();
    return SendEmailResponse::from_json(inner_->transport->send_email(request.to_json()));
}

BulkEmailResponse HuefyClient::send_bulk_emails(const std::vector<SendEmailRequest>& requests) {
    if (requests.empty()) {
        throw ValidationError("requests", "must not be empty");
    }

    json payload = json::array();
    for (size_t i = 0; i < requests.size(); ++i) {
        try {
            requests[i].validate();
        } catch (const ValidationError& e) {
            throw ValidationError(static_cast<int>(i), e);
        }
        payload.push_back(requests[i].to_json());
    }

    return BulkEmailResponse::from_json(inner_->transport->send_bulk_emails(payload));
}

HealthResponse HuefyClient::health_check() {
    return HealthResponse::from_json(inner_->transport->health_check());
}

// --- Accessors ---

TransportMode HuefyClient::transport_mode() const noexcept { return inner_->transport->mode(); }

const std::string& HuefyClient::endpoint() const noexcept { return inner_->transport->endpoint(); }

std::chrono::milliseconds HuefyClient::timeout() const noexcept {
    return inner_->transport->timeout();
}

const HuefyConfig& HuefyClient::config() const noexcept { return inner_->config; }

} // namespace huefy
