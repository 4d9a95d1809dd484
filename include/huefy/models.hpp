// include/huefy/models.hpp
// Request and response records exchanged with the Huefy backend.

#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace huefy {

// A single template email.
//
// Example:
//   SendEmailRequest req("welcome-email", "john@example.com",
//                        {{"name", "John"}}, EmailProvider::Sendgrid);
struct SendEmailRequest {
    std::string template_key;
    std::string recipient;
    std::map<std::string, std::string> data;
    std::optional<EmailProvider> provider;

    SendEmailRequest() = default;
    SendEmailRequest(std::string template_key, std::string recipient,
                     std::map<std::string, std::string> data = {},
                     std::optional<EmailProvider> provider = std::nullopt)
        : template_key(std::move(template_key)), recipient(std::move(recipient)),
          data(std::move(data)), provider(provider) {}

    // Throws ValidationError on the first violated field rule.
    void validate() const;

    // Wire form: {"templateKey", "recipient", "data", "provider"?}.
    nlohmann::json to_json() const;
    static SendEmailRequest from_json(const nlohmann::json& j);

    bool operator==(const SendEmailRequest& o) const {
        return template_key == o.template_key && recipient == o.recipient && data == o.data &&
               provider == o.provider;
    }
};

struct SendEmailResponse {
    bool success = false;
    std::string message;
    std::string message_id;
    std::string provider;

    static SendEmailResponse from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;

    bool operator==(const SendEmailResponse& o) const {
        return success == o.success && message == o.message && message_id == o.message_id &&
               provider == o.provider;
    }
};

// Outcome of one email inside a bulk submission.
struct BulkEmailResult {
    bool success = false;
    std::string message_id;
    std::string error_code;
    std::string error_message;

    bool operator==(const BulkEmailResult& o) const {
        return success == o.success && message_id == o.message_id &&
               error_code == o.error_code && error_message == o.error_message;
    }
};

struct BulkEmailResponse {
    bool success = false;
    std::string message;
    uint32_t total_emails = 0;
    uint32_t successful_emails = 0;
    uint32_t failed_emails = 0;
    std::vector<BulkEmailResult> results;

    // Counts missing from the payload are derived from `results`.
    static BulkEmailResponse from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;

    bool operator==(const BulkEmailResponse& o) const {
        return success == o.success && message == o.message && total_emails == o.total_emails &&
               successful_emails == o.successful_emails && failed_emails == o.failed_emails &&
               results == o.results;
    }
};

struct HealthResponse {
    std::string status;
    std::string version;
    std::string timestamp;
    int64_t uptime_seconds = 0;

    bool is_healthy() const noexcept { return status == "healthy" || status == "ok"; }

    static HealthResponse from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;

    bool operator==(const HealthResponse& o) const {
        return status == o.status && version == o.version && timestamp == o.timestamp &&
               uptime_seconds == o.uptime_seconds;
    }
};

} // namespace huefy
