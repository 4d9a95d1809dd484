// tests/client_test.cpp
// Client construction, request validation before I/O, and response decoding.

#include "huefy/client.hpp"
#include "huefy/config.hpp"
#include "huefy/error.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace huefy {
namespace {

using json = nlohmann::json;

struct SpyLog {
    int send_calls = 0;
    int bulk_calls = 0;
    int health_calls = 0;
    std::vector<json> payloads;
};

// Records every call and answers with canned payloads.
class SpyTransport : public Transport {
public:
    explicit SpyTransport(SpyLog& log, json reply = json::object())
        : log_(log), reply_(std::move(reply)) {}

    json send_email(const json& request) override {
        ++log_.send_calls;
        log_.payloads.push_back(request);
        return reply_;
    }

    json send_bulk_emails(const json& requests) override {
        ++log_.bulk_calls;
        log_.payloads.push_back(requests);
        return reply_;
    }

    json health_check() override {
        ++log_.health_calls;
        return reply_;
    }

    TransportMode mode() const noexcept override { return TransportMode::Http; }
    const std::string& endpoint() const noexcept override { return endpoint_; }
    std::chrono::milliseconds timeout() const noexcept override {
        return std::chrono::milliseconds(1234);
    }

private:
    SpyLog& log_;
    json reply_;
    std::string endpoint_ = "spy://endpoint";
};

// Transport that always fails the way a dead server does.
class FailingTransport : public SpyTransport {
public:
    using SpyTransport::SpyTransport;
    json send_email(const json&) override { throw NetworkError("request failed after 4 attempts"); }
};

std::unique_ptr<HuefyClient> make_client(SpyLog& log, json reply = json::object()) {
    return HuefyClient::with_transport("hk_test", HuefyConfig::production(),
                                       std::make_unique<SpyTransport>(log, std::move(reply)));
}

SendEmailRequest valid(const std::string& recipient = "jane@example.com") {
    return SendEmailRequest("welcome-email", recipient, {{"name", "Jane"}});
}

// ==================== Construction ====================

TEST(ClientTest, BlankApiKeyRejected) {
    SpyLog log;
    EXPECT_THROW(HuefyClient::with_transport("", HuefyConfig::production(),
                                             std::make_unique<SpyTransport>(log)),
                 ValidationError);
    EXPECT_THROW(HuefyClient::create("   ", HuefyConfig::production()), ValidationError);
}

TEST(ClientTest, BlankApiKeyCheckedBeforeTransportSetup) {
    // A kernel binary that does not exist must not be looked at.
    auto config = HuefyConfig::builder().kernel_binary("/nonexistent/kernel").build();
    try {
        HuefyClient::create("", config);
        FAIL();
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.field(), "apiKey");
    }
}

TEST(ClientTest, NullTransportRejected) {
    EXPECT_THROW(HuefyClient::with_transport("hk_test", HuefyConfig::production(), nullptr),
                 ConfigurationError);
}

TEST(ClientTest, CreateSelectsHttpTransport) {
    auto config = HuefyConfig::builder()
        .transport(TransportMode::Http)
        .base_url("http://127.0.0.1:9/api")
        .build();
    auto client = HuefyClient::create("hk_test", config);
    EXPECT_EQ(client->transport_mode(), TransportMode::Http);
    EXPECT_EQ(client->endpoint(), "http://127.0.0.1:9/api");
    EXPECT_EQ(client->timeout(), std::chrono::milliseconds(30000));
}

TEST(ClientTest, CreateKernelWithMissingBinaryFails) {
    auto config = HuefyConfig::builder().kernel_binary("/nonexistent/kernel").build();
    EXPECT_THROW(HuefyClient::create("hk_test", config), ConfigurationError);
}

TEST(ClientTest, Accessors) {
    SpyLog log;
    auto client = make_client(log);
    EXPECT_EQ(client->transport_mode(), TransportMode::Http);
    EXPECT_EQ(client->endpoint(), "spy://endpoint");
    EXPECT_EQ(client->timeout(), std::chrono::milliseconds(1234));
    EXPECT_EQ(client->config().http_endpoint(), HuefyConfig::PRODUCTION_HTTP_ENDPOINT);
}

TEST(ClientTest, ConstructionLogged) {
    std::vector<std::string> lines;
    auto config = HuefyConfig::builder()
        .logger([&lines](LogLevel level, const std::string& msg) {
            if (level == LogLevel::Debug) lines.push_back(msg);
        })
        .build();
    SpyLog log;
    auto client = HuefyClient::with_transport("hk_test", config,
                                              std::make_unique<SpyTransport>(log));
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find("http"), std::string::npos);
    EXPECT_NE(lines[0].find("spy://endpoint"), std::string::npos);
    EXPECT_NE(lines[0].find("1234ms"), std::string::npos);
}

TEST(ClientTest, MoveKeepsTransport) {
    SpyLog log;
    auto client = make_client(log);
    HuefyClient moved(std::move(*client));
    moved.health_check();
    EXPECT_EQ(log.health_calls, 1);
}

// ==================== send_email ====================

TEST(ClientTest, SendEmailDecodesResponse) {
    SpyLog log;
    auto client = make_client(
        log, json{{"success", true}, {"message", "queued"}, {"messageId", "msg_123"},
                  {"provider", "sendgrid"}});

    auto res = client->send_email(valid());
    EXPECT_TRUE(res.success);
    EXPECT_EQ(res.message_id, "msg_123");
    EXPECT_EQ(res.provider, "sendgrid");

    ASSERT_EQ(log.send_calls, 1);
    EXPECT_EQ(log.payloads[0], valid().to_json());
}

TEST(ClientTest, InvalidTemplateKeyMakesNoCall) {
    SpyLog log;
    auto client = make_client(log);
    EXPECT_THROW(client->send_email(SendEmailRequest("", "jane@example.com")), ValidationError);
    EXPECT_EQ(log.send_calls, 0);
}

TEST(ClientTest, InvalidRecipientMakesNoCall) {
    SpyLog log;
    auto client = make_client(log);
    for (const char* bad : {"", "jane", "jane@", "@example.com", "ja ne@example.com"}) {
        EXPECT_THROW(client->send_email(valid(bad)), ValidationError) << bad;
    }
    EXPECT_EQ(log.send_calls, 0);
}

TEST(ClientTest, TransportErrorsPropagateUnchanged) {
    SpyLog log;
    auto client = HuefyClient::with_transport("hk_test", HuefyConfig::production(),
                                              std::make_unique<FailingTransport>(log));
    try {
        client->send_email(valid());
        FAIL();
    } catch (const NetworkError& e) {
        EXPECT_NE(std::string(e.what()).find("after 4 attempts"), std::string::npos);
    }
}

TEST(ClientTest, UndecodablePayloadIsProtocolError) {
    SpyLog log;
    auto client = make_client(log, json{{"messageId", json::array()}});
    try {
        client->send_email(valid());
        FAIL();
    } catch (const HuefyError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Protocol);
    }
}

// ==================== send_bulk_emails ====================

TEST(ClientTest, BulkSendsAllRequestsInOneCall) {
    SpyLog log;
    auto client = make_client(
        log, json{{"success", true},
                  {"results", {{{"success", true}, {"messageId", "a"}},
                               {{"success", true}, {"messageId", "b"}}}}});

    auto res = client->send_bulk_emails({valid("a@example.com"), valid("b@example.com")});
    EXPECT_TRUE(res.success);
    EXPECT_EQ(res.total_emails, 2u);
    EXPECT_EQ(res.successful_emails, 2u);

    ASSERT_EQ(log.bulk_calls, 1);
    ASSERT_TRUE(log.payloads[0].is_array());
    EXPECT_EQ(log.payloads[0].size(), 2u);
    EXPECT_EQ(log.payloads[0][1]["recipient"], "b@example.com");
}

TEST(ClientTest, EmptyBulkRejected) {
    SpyLog log;
    auto client = make_client(log);
    EXPECT_THROW(client->send_bulk_emails({}), ValidationError);
    EXPECT_EQ(log.bulk_calls, 0);
}

TEST(ClientTest, BulkReportsFailingIndex) {
    SpyLog log;
    auto client = make_client(log);
    std::vector<SendEmailRequest> requests = {
        valid("a@example.com"), valid("b@example.com"), valid("not-an-email"),
        SendEmailRequest("", "d@example.com")};

    try {
        client->send_bulk_emails(requests);
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.index(), 2);
        EXPECT_EQ(e.field(), "recipient");
        EXPECT_NE(std::string(e.what()).find("request 2"), std::string::npos);
        EXPECT_EQ(std::string(e.what()),
                  "validation failed for request 2: validation error: recipient must be a valid "
                  "email address");
    }
    EXPECT_EQ(log.bulk_calls, 0);
    EXPECT_EQ(log.send_calls, 0);
}

// ==================== health_check ====================

TEST(ClientTest, HealthCheck) {
    SpyLog log;
    auto client = make_client(log, json{{"status", "healthy"}, {"version", "1.4.2"}, {"uptime", 42}});
    auto health = client->health_check();
    EXPECT_TRUE(health.is_healthy());
    EXPECT_EQ(health.version, "1.4.2");
    EXPECT_EQ(health.uptime_seconds, 42);
    EXPECT_EQ(log.health_calls, 1);
}

} // namespace
} // namespace huefy
