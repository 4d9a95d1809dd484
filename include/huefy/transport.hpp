// include/huefy/transport.hpp
// Transport seam: HTTP and kernel implementations live behind it.

#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <string>

namespace huefy {

// Reaches the backend and returns the decoded `data` payload of a call.
// Implementations throw HuefyError subclasses only.
class Transport {
public:
    virtual ~Transport() = default;

    // `request` is the wire form of one SendEmailRequest.
    virtual nlohmann::json send_email(const nlohmann::json& request) = 0;

    // `requests` is a JSON array of wire-form requests.
    virtual nlohmann::json send_bulk_emails(const nlohmann::json& requests) = 0;

    virtual nlohmann::json health_check() = 0;

    virtual TransportMode mode() const noexcept = 0;
    virtual const std::string& endpoint() const noexcept = 0;
    virtual std::chrono::milliseconds timeout() const noexcept = 0;
};

} // namespace huefy
