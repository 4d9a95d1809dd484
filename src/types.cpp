// src/types.cpp
// Enum names and parsing.

#include "huefy/error.hpp"
#include "huefy/types.hpp"

namespace huefy {

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Configuration: return "configuration";
        case ErrorKind::Validation:    return "validation";
        case ErrorKind::Network:       return "network";
        case ErrorKind::Timeout:       return "timeout";
        case ErrorKind::Api:           return "api";
        case ErrorKind::Protocol:      return "protocol";
    }
    return "unknown";
}

const char* to_string(TransportMode mode) noexcept {
    switch (mode) {
        case TransportMode::Kernel: return "kernel";
        case TransportMode::Http:   return "http";
    }
    return "unknown";
}

const char* to_string(EmailProvider provider) noexcept {
    switch (provider) {
        case EmailProvider::Ses:       return "ses";
        case EmailProvider::Sendgrid:  return "sendgrid";
        case EmailProvider::Mailgun:   return "mailgun";
        case EmailProvider::Mailchimp: return "mailchimp";
    }
    return "unknown";
}

const char* to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Error:   return "error";
        case LogLevel::Warning: return "warning";
        case LogLevel::Info:    return "info";
        case LogLevel::Debug:   return "debug";
    }
    return "unknown";
}

EmailProvider provider_from_string(const std::string& name) {
    if (name == "ses") return EmailProvider::Ses;
    if (name == "sendgrid") return EmailProvider::Sendgrid;
    if (name == "mailgun") return EmailProvider::Mailgun;
    if (name == "mailchimp") return EmailProvider::Mailchimp;
    throw ValidationError("provider", "must be one of: ses, sendgrid, mailgun, mailchimp");
}

} // namespace huefy
