// tests/error_registry_test.cpp
// Error code table: built-in mappings, fallback and extension.

#include <gtest/gtest.h>
#include "huefy/error_registry.hpp"

using namespace huefy;

namespace {

template <typename T>
void expect_maps_to(const std::string& code) {
    auto ptr = ErrorRegistry::instance().create(code, "boom", 418);
    ASSERT_TRUE(ptr);
    try {
        std::rethrow_exception(ptr);
    } catch (const T& e) {
        EXPECT_EQ(e.code(), code);
        EXPECT_EQ(e.status(), 418);
        return;
    } catch (const std::exception& e) {
        FAIL() << code << " mapped to the wrong type: " << e.what();
    }
}

} // namespace

TEST(ErrorRegistryTest, AuthenticationCodes) {
    expect_maps_to<AuthenticationError>("INVALID_API_KEY");
    expect_maps_to<AuthenticationError>("UNAUTHORIZED");
    expect_maps_to<AuthenticationError>("FORBIDDEN");
}

TEST(ErrorRegistryTest, ApiCodes) {
    expect_maps_to<TemplateNotFoundError>("TEMPLATE_NOT_FOUND");
    expect_maps_to<InvalidRecipientError>("INVALID_RECIPIENT");
    expect_maps_to<RateLimitError>("RATE_LIMIT_EXCEEDED");
    expect_maps_to<RateLimitError>("RATE_LIMITED");
    expect_maps_to<ProviderError>("PROVIDER_ERROR");
    expect_maps_to<ProviderError>("PROVIDER_UNAVAILABLE");
}

TEST(ErrorRegistryTest, ValidationAndTimeoutCodes) {
    expect_maps_to<ValidationError>("VALIDATION_ERROR");
    expect_maps_to<TimeoutError>("TIMEOUT");
}

TEST(ErrorRegistryTest, UnknownCodeFallsBackToApiError) {
    try {
        ErrorRegistry::instance().raise("SOMETHING_NEW", "server said no", 400);
    } catch (const ApiError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Api);
        EXPECT_EQ(e.code(), "SOMETHING_NEW");
        EXPECT_EQ(e.message(), "server said no");
        EXPECT_EQ(e.status(), 400);
    }
}

TEST(ErrorRegistryTest, TypedErrorsAreApiErrors) {
    try {
        ErrorRegistry::instance().raise("TEMPLATE_NOT_FOUND", "missing");
    } catch (const ApiError& e) {
        EXPECT_EQ(e.message(), "missing");
        EXPECT_EQ(e.status(), 0);
    }
}

TEST(ErrorRegistryTest, RegisterNewCode) {
    auto& registry = ErrorRegistry::instance();
    EXPECT_FALSE(registry.contains("QUOTA_EXCEEDED_TEST"));
    registry.register_code("QUOTA_EXCEEDED_TEST", ErrorRegistry::make<RateLimitError>());
    EXPECT_TRUE(registry.contains("QUOTA_EXCEEDED_TEST"));
    expect_maps_to<RateLimitError>("QUOTA_EXCEEDED_TEST");
}

TEST(ErrorRegistryTest, ServerValidationKeepsMessageVerbatim) {
    try {
        ErrorRegistry::instance().raise("VALIDATION_ERROR", "recipient is not allowed", 422);
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.message(), "recipient is not allowed");
        EXPECT_EQ(e.code(), "VALIDATION_ERROR");
        EXPECT_EQ(e.status(), 422);
        EXPECT_TRUE(e.field().empty());
        EXPECT_EQ(e.index(), ValidationError::NO_INDEX);
    }
}

TEST(ErrorRegistryTest, TwoStringValidationErrorNamesField) {
    ValidationError err("templateKey", "is required");
    EXPECT_EQ(err.field(), "templateKey");
    EXPECT_EQ(err.reason(), "is required");
    EXPECT_STREQ(err.what(), "validation error: templateKey is required");
    EXPECT_TRUE(err.code().empty());
    EXPECT_EQ(err.status(), 0);

    auto api = ValidationError::from_api("templateKey", "VALIDATION_ERROR", 400);
    EXPECT_STREQ(api.what(), "templateKey");
    EXPECT_TRUE(api.field().empty());
}

TEST(ErrorRegistryTest, FactoryMayUseRegistry) {
    auto& registry = ErrorRegistry::instance();
    registry.register_code(
        "REENTRANT_TEST", [](const std::string& code, const std::string& message, int status) {
            auto& inner = ErrorRegistry::instance();
            if (!inner.contains("REENTRANT_TEST_SEEN")) {
                inner.register_code("REENTRANT_TEST_SEEN", ErrorRegistry::make<ProviderError>());
            }
            return inner.create("RATE_LIMITED", code + ": " + message, status);
        });

    try {
        registry.raise("REENTRANT_TEST", "nested", 429);
        FAIL() << "expected RateLimitError";
    } catch (const RateLimitError& e) {
        EXPECT_EQ(e.message(), "REENTRANT_TEST: nested");
        EXPECT_EQ(e.status(), 429);
    }
    EXPECT_TRUE(registry.contains("REENTRANT_TEST_SEEN"));
}

TEST(ErrorRegistryTest, KindNames) {
    EXPECT_STREQ(to_string(ErrorKind::Configuration), "configuration");
    EXPECT_STREQ(to_string(ErrorKind::Api), "api");
}
