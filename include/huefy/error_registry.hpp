// include/huefy/error_registry.hpp
// Table from API error code to the error type raised for it.

#pragma once

#include "error.hpp"
#include <exception>
#include <functional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace huefy {

// Maps error codes reported by the API or the kernel binary to typed errors.
//
// Codes without an entry produce an ApiError carrying the original code,
// message and status. New codes can be registered at startup:
//
//   ErrorRegistry::instance().register_code("QUOTA_EXCEEDED",
//       ErrorRegistry::make<RateLimitError>());
class ErrorRegistry {
public:
    using Factory =
        std::function<std::exception_ptr(const std::string& code, const std::string& message,
                                          int status)>;

    static ErrorRegistry& instance();

    // Factory for an ApiError subclass constructed as T(code, message, status).
    template <typename T>
    static Factory make() {
        return [](const std::string& code, const std::string& message, int status) {
            return std::make_exception_ptr(T(code, message, status));
        };
    }

    void register_code(const std::string& code, Factory factory);
    bool contains(const std::string& code) const;

    // Never returns null.
    std::exception_ptr create(const std::string& code, const std::string& message,
                              int status = 0) const;

    [[noreturn]] void raise(const std::string& code, const std::string& message,
                            int status = 0) const;

private:
    ErrorRegistry();

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Factory> factories_;
};

} // namespace huefy
