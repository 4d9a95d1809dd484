// src/kernel_transport.hpp
// Kernel transport: one subprocess per call, JSON command on stdin, JSON
// result on stdout.

#pragma once

#include "huefy/config.hpp"
#include "huefy/transport.hpp"

#include <chrono>
#include <string>

namespace huefy {

// Kernel binary file name for an OS family ("Darwin", "Linux", "Windows")
// and machine string as reported by uname. Throws ConfigurationError for
// unsupported combinations.
std::string kernel_binary_name(const std::string& os_family, const std::string& machine);

// OS family this library was compiled for, in kernel_binary_name() terms.
const char* host_os_family() noexcept;

// Machine architecture of the running host (uname -m).
std::string host_machine();

// Full path of the kernel binary the config resolves to. Does not check it.
std::string resolve_kernel_binary(const HuefyConfig& config);

class KernelTransport : public Transport {
public:
    // Resolves and checks the binary. Throws ConfigurationError when it is
    // missing or not executable.
    KernelTransport(const std::string& api_key, const HuefyConfig& config);

    nlohmann::json send_email(const nlohmann::json& request) override;
    nlohmann::json send_bulk_emails(const nlohmann::json& requests) override;
    nlohmann::json health_check() override;

    TransportMode mode() const noexcept override { return TransportMode::Kernel; }
    const std::string& endpoint() const noexcept override { return endpoint_; }
    std::chrono::milliseconds timeout() const noexcept override { return config_.timeout(); }

    const std::string& binary_path() const noexcept { return binary_path_; }

private:
    nlohmann::json execute(const char* command, const nlohmann::json* data);

    std::string api_key_;
    HuefyConfig config_;
    std::string endpoint_;
    std::string binary_path_;
};

} // namespace huefy
