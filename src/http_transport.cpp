// src/http_transport.cpp
// HTTP transport: request building, retry loop, response and error decoding.

#include "http_transport.hpp"
#include "http_connection.hpp"
#include "huefy/error_registry.hpp"
#include "huefy/huefy.hpp"

#include <optional>
#include <thread>

namespace huefy {

using json = nlohmann::json;

namespace {

json decode_success_body(const http::HttpResponse& res) {
    if (res.body.find_first_not_of(" \t\r\n") == std::string::npos) {
        throw HuefyError::protocol("empty response body received");
    }
    try {
        return json::parse(res.body);
    } catch (const json::parse_error& e) {
        throw HuefyError::protocol(std::string("failed to decode JSON response: ") + e.what());
    }
}

std::string string_field(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return std::string();
    return it->get<std::string>();
}

http::SenderOptions sender_options(const HuefyConfig& config) {
    http::SenderOptions options;
    options.connect_timeout = config.connect_timeout();
    options.timeout = config.timeout();
    options.tls_verify_peer = config.tls_verify_peer();
    options.tls_ca_file = config.tls_ca_file();
    // A bad trust store fails client construction, not the first send.
    options.load_tls = http::parse_url(config.http_endpoint()).tls();
    return options;
}

} // namespace

const char* const HttpTransport::USER_AGENT = "Huefy-CPP-SDK/" HUEFY_SDK_VERSION;

std::exception_ptr translate_error_response(int status, const std::string& status_text,
                                            const std::string& body) {
    std::string code = "HTTP_" + std::to_string(status);
    std::string message = body;
    if (message.empty()) {
        message = "HTTP " + std::to_string(status) + (status_text.empty() ? "" : " " + status_text);
    }

    json parsed = json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (!parsed.is_discarded() && parsed.is_object()) {
        auto err = parsed.find("error");
        if (err != parsed.end() && err->is_object()) {
            auto c = string_field(*err, "code");
            auto m = string_field(*err, "message");
            if (!c.empty()) code = c;
            if (!m.empty()) message = m;
        } else if (err != parsed.end() && err->is_string()) {
            message = err->get<std::string>();
        } else if (!string_field(parsed, "message").empty()) {
            message = string_field(parsed, "message");
        }
    }
    return ErrorRegistry::instance().create(code, message, status);
}

HttpTransport::HttpTransport(const std::string& api_key, const HuefyConfig& config)
    : HttpTransport(api_key, config,
                    std::make_unique<http::SocketHttpSender>(sender_options(config)),
                    Sleeper()) {}

HttpTransport::HttpTransport(const std::string& api_key, const HuefyConfig& config,
                             std::unique_ptr<http::HttpSender> sender, Sleeper sleeper)
    : api_key_(api_key), config_(config), endpoint_(config.http_endpoint()),
      base_(http::parse_url(endpoint_)), sender_(std::move(sender)),
      sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

HttpTransport::~HttpTransport() = default;

json HttpTransport::send_email(const json& request) {
    return make_request("POST", "/emails/send", &request);
}

json HttpTransport::send_bulk_emails(const json& requests) {
    json body = {{"emails", requests}};
    return make_request("POST", "/emails/bulk", &body);
}

json HttpTransport::health_check() {
    return make_request("GET", "/health", nullptr);
}

json HttpTransport::make_request(const char* method, const std::string& path, const json* body) {
    http::HttpRequest req;
    req.method = method;
    req.url = base_;
    req.target = base_.path + path;
    req.headers = {
        {"X-API-Key", api_key_},
        {"Accept", "application/json"},
        {"Content-Type", "application/json"},
        {"User-Agent", USER_AGENT},
    };
    if (body) req.body = body->dump();

    const uint64_t max_retries = config_.retry().effective_max_retries();
    std::string last_failure;
    int last_status = 0;
    bool last_was_timeout = false;

    uint64_t attempt = 0;
    while (true) {
        std::optional<http::HttpResponse> res;
        try {
            res = sender_->send(req);
        } catch (const TimeoutError& e) {
            last_failure = e.what();
            last_status = 0;
            last_was_timeout = true;
        } catch (const NetworkError& e) {
            last_failure = e.what();
            last_status = 0;
            last_was_timeout = false;
        }

        if (res) {
            if (res->ok()) {
                return decode_success_body(*res);
            }
            if (res->status_code < 500) {
                config_.log(LogLevel::Debug, std::string(method) + " " + req.target + " -> HTTP " +
                                                 std::to_string(res->status_code) + ", not retrying");
                std::rethrow_exception(
                    translate_error_response(res->status_code, res->status_text, res->body));
            }
            last_failure = "HTTP " + std::to_string(res->status_code) +
                           (res->status_text.empty() ? "" : " " + res->status_text);
            last_status = res->status_code;
            last_was_timeout = false;
        }

        ++attempt;
        if (attempt > max_retries) break;

        auto delay = config_.retry().delay_for(static_cast<uint32_t>(attempt));
        config_.log(LogLevel::Warning, std::string(method) + " " + req.target + " failed (" +
                                           last_failure + "), retry " + std::to_string(attempt) +
                                           "/" + std::to_string(max_retries) + " in " +
                                           std::to_string(delay.count()) + "ms");
        sleeper_(delay);
    }

    const std::string summary = "request failed after " + std::to_string(max_retries + 1) +
                                " attempts: " + last_failure;
    config_.log(LogLevel::Error, std::string(method) + " " + req.target + ": " + summary);
    if (last_was_timeout) {
        throw TimeoutError(summary);
    }
    throw NetworkError(summary, last_status);
}

} // namespace huefy
