// src/error_registry.cpp
// Built-in code table and lookup.

#include "huefy/error_registry.hpp"

#include <mutex>

namespace huefy {

ErrorRegistry::ErrorRegistry() {
    factories_ = {
        {"INVALID_API_KEY", make<AuthenticationError>()},
        {"UNAUTHORIZED", make<AuthenticationError>()},
        {"FORBIDDEN", make<AuthenticationError>()},
        {"TEMPLATE_NOT_FOUND", make<TemplateNotFoundError>()},
        {"INVALID_RECIPIENT", make<InvalidRecipientError>()},
        {"RATE_LIMIT_EXCEEDED", make<RateLimitError>()},
        {"RATE_LIMITED", make<RateLimitError>()},
        {"PROVIDER_ERROR", make<ProviderError>()},
        {"PROVIDER_UNAVAILABLE", make<ProviderError>()},
        {"VALIDATION_ERROR",
         [](const std::string& code, const std::string& message, int status) {
             return std::make_exception_ptr(ValidationError::from_api(message, code, status));
         }},
        {"TIMEOUT",
         [](const std::string& code, const std::string& message, int status) {
             return std::make_exception_ptr(TimeoutError(message, code, status));
         }},
    };
}

ErrorRegistry& ErrorRegistry::instance() {
    static ErrorRegistry registry;
    return registry;
}

void ErrorRegistry::register_code(const std::string& code, Factory factory) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    factories_[code] = std::move(factory);
}

bool ErrorRegistry::contains(const std::string& code) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return factories_.count(code) != 0;
}

std::exception_ptr ErrorRegistry::create(const std::string& code, const std::string& message,
                                         int status) const {
    // Factories run unlocked so they may consult or extend the registry.
    Factory factory;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = factories_.find(code);
        if (it != factories_.end()) factory = it->second;
    }
    if (factory) {
        auto err = factory(code, message, status);
        if (err) return err;
    }
    return std::make_exception_ptr(ApiError(code, message, status));
}

void ErrorRegistry::raise(const std::string& code, const std::string& message, int status) const {
    std::rethrow_exception(create(code, message, status));
}

} // namespace huefy
