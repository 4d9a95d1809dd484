// src/models.cpp
// Request validation and JSON mapping for the wire records.

#include "huefy/error.hpp"
#include "huefy/models.hpp"
#include "validation.hpp"

namespace huefy {

namespace {

using json = nlohmann::json;

// Treat null as an empty object; anything else that is not an object is a
// protocol violation.
const json& as_object(const json& j, const char* what) {
    static const json empty = json::object();
    if (j.is_null()) return empty;
    if (!j.is_object()) {
        throw HuefyError::protocol(std::string("expected a JSON object for ") + what +
                                   ", got " + j.type_name());
    }
    return j;
}

template <typename Fn>
auto decode(const char* what, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const json::exception& e) {
        throw HuefyError::protocol(std::string("failed to decode ") + what + ": " + e.what());
    }
}

} // namespace

// --- SendEmailRequest ---

void SendEmailRequest::validate() const {
    if (validation::trim(template_key).empty()) {
        throw ValidationError("templateKey", "is required");
    }
    if (!validation::check_template_key(template_key)) {
        throw ValidationError("templateKey", "must be at most 100 characters");
    }
    if (recipient.empty()) {
        throw ValidationError("recipient", "is required");
    }
    if (!validation::check_email(recipient)) {
        throw ValidationError("recipient", "must be a valid email address");
    }
    for (const auto& kv : data) {
        if (kv.first.empty()) {
            throw ValidationError("data", "keys must not be empty");
        }
    }
}

json SendEmailRequest::to_json() const {
    json j = {
        {"templateKey", template_key},
        {"recipient", recipient},
        {"data", data},
    };
    if (provider) {
        j["provider"] = huefy::to_string(*provider);
    }
    return j;
}

SendEmailRequest SendEmailRequest::from_json(const json& j) {
    return decode("email request", [&] {
        const auto& o = as_object(j, "email request");
        SendEmailRequest req;
        req.template_key = o.value("templateKey", std::string());
        req.recipient = o.value("recipient", std::string());
        if (o.contains("data") && !o.at("data").is_null()) {
            req.data = o.at("data").get<std::map<std::string, std::string>>();
        }
        if (o.contains("provider") && !o.at("provider").is_null()) {
            req.provider = provider_from_string(o.at("provider").get<std::string>());
        }
        return req;
    });
}

// --- SendEmailResponse ---

SendEmailResponse SendEmailResponse::from_json(const json& j) {
    return decode("send response", [&] {
        const auto& o = as_object(j, "send response");
        SendEmailResponse res;
        res.message_id = o.value("messageId", std::string());
        res.success = o.value("success", !res.message_id.empty());
        res.message = o.value("message", std::string());
        res.provider = o.value("provider", std::string());
        return res;
    });
}

json SendEmailResponse::to_json() const {
    return json{
        {"success", success},
        {"message", message},
        {"messageId", message_id},
        {"provider", provider},
    };
}

// --- BulkEmailResponse ---

BulkEmailResponse BulkEmailResponse::from_json(const json& j) {
    return decode("bulk response", [&] {
        const auto& o = as_object(j, "bulk response");
        BulkEmailResponse res;
        res.message = o.value("message", std::string());

        uint32_t ok = 0;
        if (o.contains("results") && !o.at("results").is_null()) {
            for (const auto& item : o.at("results")) {
                const auto& r = as_object(item, "bulk result");
                BulkEmailResult result;
                result.message_id = r.value("messageId", std::string());
                result.success = r.value("success", !result.message_id.empty());
                if (r.contains("error") && r.at("error").is_object()) {
                    const auto& err = r.at("error");
                    result.error_code = err.value("code", std::string());
                    result.error_message = err.value("message", std::string());
                }
                if (result.success) ++ok;
                res.results.push_back(std::move(result));
            }
        }

        const auto count = static_cast<uint32_t>(res.results.size());
        res.total_emails = o.value("totalEmails", count);
        res.successful_emails = o.value("successfulEmails", ok);
        res.failed_emails = o.value("failedEmails", count - ok);
        res.success = o.value("success", res.failed_emails == 0);
        return res;
    });
}

json BulkEmailResponse::to_json() const {
    json items = json::array();
    for (const auto& r : results) {
        json item = {{"success", r.success}};
        if (!r.message_id.empty()) item["messageId"] = r.message_id;
        if (!r.error_code.empty() || !r.error_message.empty()) {
            item["error"] = {{"code", r.error_code}, {"message", r.error_message}};
        }
        items.push_back(std::move(item));
    }
    return json{
        {"success", success},
        {"message", message},
        {"totalEmails", total_emails},
        {"successfulEmails", successful_emails},
        {"failedEmails", failed_emails},
        {"results", std::move(items)},
    };
}

// --- HealthResponse ---

HealthResponse HealthResponse::from_json(const json& j) {
    return decode("health response", [&] {
        const auto& o = as_object(j, "health response");
        HealthResponse res;
        res.status = o.value("status", std::string());
        res.version = o.value("version", std::string());
        res.timestamp = o.value("timestamp", std::string());
        res.uptime_seconds = o.value("uptime", int64_t(0));
        return res;
    });
}

json HealthResponse::to_json() const {
    return json{
        {"status", status},
        {"version", version},
        {"timestamp", timestamp},
        {"uptime", uptime_seconds},
    };
}

} // namespace huefy
