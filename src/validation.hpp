// src/validation.hpp
// Internal input validation functions.

#pragma once

#include <cctype>
#include <cstddef>
#include <string>

namespace huefy {
namespace validation {

static constexpr size_t MAX_TEMPLATE_KEY_LENGTH = 100;
static constexpr size_t MAX_EMAIL_LENGTH = 254;
static constexpr size_t MAX_EMAIL_LOCAL_LENGTH = 64;

inline std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

// API keys are opaque; only blank keys are rejected.
inline bool check_api_key(const std::string& api_key) {
    return !trim(api_key).empty();
}

inline bool check_template_key(const std::string& key) {
    auto trimmed = trim(key);
    return !trimmed.empty() && trimmed.size() <= MAX_TEMPLATE_KEY_LENGTH;
}

// Syntactic address check: local@domain.tld with no whitespace or empty labels.
inline bool check_email(const std::string& email) {
    if (email.empty() || email.size() > MAX_EMAIL_LENGTH) return false;

    auto at = email.find('@');
    if (at == std::string::npos || email.find('@', at + 1) != std::string::npos) return false;

    const std::string local = email.substr(0, at);
    const std::string domain = email.substr(at + 1);
    if (local.empty() || local.size() > MAX_EMAIL_LOCAL_LENGTH) return false;
    if (local.front() == '.' || local.back() == '.') return false;
    if (local.find("..") != std::string::npos) return false;

    for (char c : email) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isspace(uc) || std::iscntrl(uc)) return false;
    }

    // Domain: dot-separated labels, at least two, letters/digits/hyphens.
    if (domain.find('.') == std::string::npos) return false;
    size_t start = 0;
    while (start <= domain.size()) {
        auto dot = domain.find('.', start);
        auto label = domain.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (label.empty() || label.size() > 63) return false;
        if (label.front() == '-' || label.back() == '-') return false;
        for (char c : label) {
            if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') return false;
        }
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return true;
}

} // namespace validation
} // namespace huefy
