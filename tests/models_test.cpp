// tests/models_test.cpp
// Request validation and JSON mapping of the wire records.

#include <gtest/gtest.h>
#include "huefy/error.hpp"
#include "huefy/models.hpp"

using namespace huefy;
using json = nlohmann::json;

namespace {

SendEmailRequest valid_request() {
    return SendEmailRequest("welcome-email", "john@example.com",
                            {{"name", "John"}, {"company", "Acme"}}, EmailProvider::Sendgrid);
}

void expect_invalid(const SendEmailRequest& req, const std::string& field) {
    try {
        req.validate();
        FAIL() << "expected ValidationError for " << field;
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.field(), field);
        EXPECT_EQ(e.kind(), ErrorKind::Validation);
    }
}

} // namespace

// ==================== SendEmailRequest ====================

TEST(SendEmailRequestTest, ValidRequestPasses) {
    EXPECT_NO_THROW(valid_request().validate());
    EXPECT_NO_THROW(SendEmailRequest("t", "a@b.co").validate());
}

TEST(SendEmailRequestTest, EmptyTemplateKey) {
    auto req = valid_request();
    req.template_key = "   ";
    expect_invalid(req, "templateKey");
}

TEST(SendEmailRequestTest, LongTemplateKey) {
    auto req = valid_request();
    req.template_key = std::string(101, 'x');
    try {
        req.validate();
        FAIL();
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.reason(), "must be at most 100 characters");
    }
}

TEST(SendEmailRequestTest, MissingRecipient) {
    auto req = valid_request();
    req.recipient.clear();
    try {
        req.validate();
        FAIL();
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.field(), "recipient");
        EXPECT_EQ(e.reason(), "is required");
        EXPECT_STREQ(e.what(), "validation error: recipient is required");
    }
}

TEST(SendEmailRequestTest, InvalidRecipient) {
    auto req = valid_request();
    req.recipient = "not-an-email";
    expect_invalid(req, "recipient");
}

TEST(SendEmailRequestTest, TemplateKeyCheckedFirst) {
    SendEmailRequest req("", "not-an-email");
    expect_invalid(req, "templateKey");
}

TEST(SendEmailRequestTest, EmptyDataKey) {
    auto req = valid_request();
    req.data[""] = "value";
    expect_invalid(req, "data");
}

TEST(SendEmailRequestTest, WireForm) {
    auto j = valid_request().to_json();
    EXPECT_EQ(j["templateKey"], "welcome-email");
    EXPECT_EQ(j["recipient"], "john@example.com");
    EXPECT_EQ(j["data"]["name"], "John");
    EXPECT_EQ(j["data"]["company"], "Acme");
    EXPECT_EQ(j["provider"], "sendgrid");
}

TEST(SendEmailRequestTest, WireFormOmitsUnsetProvider) {
    SendEmailRequest req("welcome", "a@example.com");
    auto j = req.to_json();
    EXPECT_FALSE(j.contains("provider"));
    EXPECT_TRUE(j["data"].is_object());
    EXPECT_TRUE(j["data"].empty());
}

TEST(SendEmailRequestTest, DecodesWireForm) {
    auto original = valid_request();
    EXPECT_EQ(SendEmailRequest::from_json(original.to_json()), original);
}

TEST(SendEmailRequestTest, UnknownProviderRejected) {
    json j = {{"templateKey", "t"}, {"recipient", "a@b.co"}, {"provider", "pigeon"}};
    EXPECT_THROW(SendEmailRequest::from_json(j), ValidationError);
}

// ==================== Responses ====================

TEST(SendEmailResponseTest, Decode) {
    json j = {{"success", true}, {"message", "queued"}, {"messageId", "msg_1"}, {"provider", "ses"}};
    auto res = SendEmailResponse::from_json(j);
    EXPECT_TRUE(res.success);
    EXPECT_EQ(res.message, "queued");
    EXPECT_EQ(res.message_id, "msg_1");
    EXPECT_EQ(res.provider, "ses");
    EXPECT_EQ(SendEmailResponse::from_json(res.to_json()), res);
}

TEST(SendEmailResponseTest, SuccessDefaultsFromMessageId) {
    auto res = SendEmailResponse::from_json(json{{"messageId", "abc"}});
    EXPECT_TRUE(res.success);
    EXPECT_EQ(res.message_id, "abc");
}

TEST(SendEmailResponseTest, WrongFieldTypeIsProtocolError) {
    try {
        SendEmailResponse::from_json(json{{"messageId", 42}});
        FAIL();
    } catch (const HuefyError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Protocol);
    }
}

TEST(SendEmailResponseTest, NonObjectIsProtocolError) {
    try {
        SendEmailResponse::from_json(json::array({1, 2}));
        FAIL();
    } catch (const HuefyError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Protocol);
    }
}

TEST(BulkEmailResponseTest, Decode) {
    json j = {
        {"success", false},
        {"message", "partial"},
        {"totalEmails", 2},
        {"successfulEmails", 1},
        {"failedEmails", 1},
        {"results",
         {{{"success", true}, {"messageId", "m1"}},
          {{"success", false},
           {"error", {{"code", "INVALID_RECIPIENT"}, {"message", "bounced"}}}}}},
    };
    auto res = BulkEmailResponse::from_json(j);
    EXPECT_FALSE(res.success);
    EXPECT_EQ(res.total_emails, 2u);
    EXPECT_EQ(res.successful_emails, 1u);
    EXPECT_EQ(res.failed_emails, 1u);
    ASSERT_EQ(res.results.size(), 2u);
    EXPECT_EQ(res.results[0].message_id, "m1");
    EXPECT_EQ(res.results[1].error_code, "INVALID_RECIPIENT");
    EXPECT_EQ(res.results[1].error_message, "bounced");
    EXPECT_EQ(BulkEmailResponse::from_json(res.to_json()), res);
}

TEST(BulkEmailResponseTest, CountsDerivedFromResults) {
    json j = {{"results",
               {{{"success", true}, {"messageId", "m1"}},
                {{"success", true}, {"messageId", "m2"}},
                {{"success", false}}}}};
    auto res = BulkEmailResponse::from_json(j);
    EXPECT_EQ(res.total_emails, 3u);
    EXPECT_EQ(res.successful_emails, 2u);
    EXPECT_EQ(res.failed_emails, 1u);
    EXPECT_FALSE(res.success);
}

TEST(BulkEmailResponseTest, EmptyPayload) {
    auto res = BulkEmailResponse::from_json(json::object());
    EXPECT_TRUE(res.success);
    EXPECT_EQ(res.total_emails, 0u);
    EXPECT_TRUE(res.results.empty());
}

TEST(HealthResponseTest, Decode) {
    json j = {{"status", "healthy"}, {"version", "2.1.0"}, {"timestamp", "2024-01-01T00:00:00Z"},
              {"uptime", 3600}};
    auto res = HealthResponse::from_json(j);
    EXPECT_TRUE(res.is_healthy());
    EXPECT_EQ(res.version, "2.1.0");
    EXPECT_EQ(res.uptime_seconds, 3600);
    EXPECT_EQ(HealthResponse::from_json(res.to_json()), res);
}

TEST(HealthResponseTest, HealthyStatuses) {
    EXPECT_TRUE(HealthResponse::from_json(json{{"status", "ok"}}).is_healthy());
    EXPECT_FALSE(HealthResponse::from_json(json{{"status", "degraded"}}).is_healthy());
    EXPECT_FALSE(HealthResponse::from_json(json::object()).is_healthy());
}

// ==================== Providers ====================

TEST(ProviderTest, WireNames) {
    EXPECT_STREQ(to_string(EmailProvider::Ses), "ses");
    EXPECT_STREQ(to_string(EmailProvider::Sendgrid), "sendgrid");
    EXPECT_STREQ(to_string(EmailProvider::Mailgun), "mailgun");
    EXPECT_STREQ(to_string(EmailProvider::Mailchimp), "mailchimp");
    EXPECT_EQ(provider_from_string("mailgun"), EmailProvider::Mailgun);
    EXPECT_THROW(provider_from_string("smtp"), ValidationError);
}
