// include/huefy/error.hpp
// Error taxonomy: one base class with a kind enum, typed subclasses to catch on.

#pragma once

#include <exception>
#include <string>

namespace huefy {

enum class ErrorKind {
    Configuration,  // Invalid config or installation at construction
    Validation,     // Bad input, rejected before any I/O
    Network,        // Connectivity, transport or process failure
    Timeout,        // A deadline was hit (a network failure)
    Api,            // Server-reported error with a code
    Protocol        // Empty or malformed response payload
};

const char* to_string(ErrorKind kind) noexcept;

class HuefyError : public std::exception {
public:
    HuefyError(ErrorKind kind, std::string message, std::string code = std::string(),
               int status = 0)
        : kind_(kind), message_(std::move(message)), code_(std::move(code)), status_(status) {}

    const char* what() const noexcept override { return message_.c_str(); }
    ErrorKind kind() const noexcept { return kind_; }
    const std::string& message() const noexcept { return message_; }

    // Error code reported by the API or kernel, empty when there is none.
    const std::string& code() const noexcept { return code_; }

    // HTTP status of the response that caused the error, or the exit code of a
    // kernel process that failed. 0 when there was neither.
    int status() const noexcept { return status_; }

    static HuefyError protocol(std::string msg) {
        return HuefyError(ErrorKind::Protocol, std::move(msg));
    }

private:
    ErrorKind kind_;
    std::string message_;
    std::string code_;
    int status_;
};

class ConfigurationError : public HuefyError {
public:
    explicit ConfigurationError(const std::string& msg)
        : HuefyError(ErrorKind::Configuration, "configuration error: " + msg) {}
};

class ValidationError : public HuefyError {
public:
    static constexpr int NO_INDEX = -1;

    ValidationError(const std::string& field, const std::string& reason)
        : HuefyError(ErrorKind::Validation, "validation error: " + field + " " + reason),
          field_(field), reason_(reason) {}

    // Re-report a request-level failure as part of a bulk submission.
    ValidationError(int index, const ValidationError& cause)
        : HuefyError(ErrorKind::Validation,
                     "validation failed for request " + std::to_string(index) + ": " +
                         cause.message()),
          field_(cause.field_), reason_(cause.reason_), index_(index) {}

    const std::string& field() const noexcept { return field_; }
    const std::string& reason() const noexcept { return reason_; }
    int index() const noexcept { return index_; }

    // Validation failure reported by the service rather than detected locally.
    static ValidationError from_api(const std::string& msg, std::string code, int status) {
        return ValidationError(ErrorKind::Validation, msg, std::move(code), status);
    }

private:
    ValidationError(ErrorKind kind, const std::string& msg, std::string code, int status)
        : HuefyError(kind, msg, std::move(code), status) {}

    std::string field_;
    std::string reason_;
    int index_ = NO_INDEX;
};

class NetworkError : public HuefyError {
public:
    explicit NetworkError(const std::string& msg, int status = 0)
        : HuefyError(ErrorKind::Network, "network error: " + msg, std::string(), status) {}

    NetworkError(const std::string& msg, std::string code, int status)
        : HuefyError(ErrorKind::Network, "network error: " + msg, std::move(code), status) {}

protected:
    NetworkError(ErrorKind kind, std::string msg, std::string code, int status)
        : HuefyError(kind, std::move(msg), std::move(code), status) {}
};

class TimeoutError : public NetworkError {
public:
    explicit TimeoutError(const std::string& msg, std::string code = std::string(), int status = 0)
        : NetworkError(ErrorKind::Timeout, "timeout: " + msg, std::move(code), status) {}
};

// Business error reported by the service. Unregistered codes surface as this type.
class ApiError : public HuefyError {
public:
    ApiError(std::string code, const std::string& message, int status = 0)
        : HuefyError(ErrorKind::Api, message, std::move(code), status) {}
};

class AuthenticationError : public ApiError {
public:
    using ApiError::ApiError;
};

class TemplateNotFoundError : public ApiError {
public:
    using ApiError::ApiError;
};

class InvalidRecipientError : public ApiError {
public:
    using ApiError::ApiError;
};

class RateLimitError : public ApiError {
public:
    using ApiError::ApiError;
};

class ProviderError : public ApiError {
public:
    using ApiError::ApiError;
};

} // namespace huefy
