// include/huefy/types.hpp
// Core enums shared by the public API.

#pragma once

#include <cstdint>
#include <string>

namespace huefy {

// How the client reaches the Huefy backend. Fixed for the client's lifetime.
enum class TransportMode : uint8_t {
    Kernel = 0,  // local kernel binary, JSON over stdin/stdout
    Http   = 1,  // direct HTTPS/JSON calls
};

// Upstream email service hint for the backend.
enum class EmailProvider : uint8_t {
    Ses       = 0,
    Sendgrid  = 1,
    Mailgun   = 2,
    Mailchimp = 3,
};

// Diagnostic record severity, most severe first.
enum class LogLevel : uint8_t {
    Error   = 0,
    Warning = 1,
    Info    = 2,
    Debug   = 3,
};

const char* to_string(TransportMode mode) noexcept;
const char* to_string(EmailProvider provider) noexcept;
const char* to_string(LogLevel level) noexcept;

// Parse a wire provider name ("ses", "sendgrid", ...). Throws ValidationError.
EmailProvider provider_from_string(const std::string& name);

} // namespace huefy
