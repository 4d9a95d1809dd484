// include/huefy/config.hpp
// Client configuration with builder pattern, presets and re-validating setters.

#pragma once

#include "error.hpp"
#include "retry.hpp"
#include "types.hpp"
#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace huefy {

class HuefyConfigBuilder;

// Ambient deployment indicators (APP_ENV, NODE_ENV), captured once when a
// config is built.
struct EnvironmentSignals {
    std::optional<std::string> app_env;
    std::optional<std::string> node_env;

    // Read both variables from the process environment.
    static EnvironmentSignals from_process();

    bool any_set() const noexcept { return app_env.has_value() || node_env.has_value(); }
    bool indicates_production() const noexcept;
};

// Configuration for the Huefy client.
class HuefyConfig {
public:
    using LogCallback = std::function<void(LogLevel, const std::string&)>;

    static constexpr const char* PRODUCTION_HTTP_ENDPOINT = "https://api.huefy.dev/api/v1/sdk";
    static constexpr const char* LOCAL_HTTP_ENDPOINT = "http://localhost:8080/api/v1/sdk";
    static constexpr const char* PRODUCTION_GRPC_ENDPOINT = "api.huefy.dev:50051";
    static constexpr const char* LOCAL_GRPC_ENDPOINT = "localhost:50051";

    // Defaults, with the environment read from the process.
    HuefyConfig();

    static HuefyConfigBuilder builder();

    // Presets.
    static HuefyConfig production();
    static HuefyConfig local();
    static HuefyConfig without_retries();

    const std::optional<std::string>& base_url() const noexcept { return base_url_; }
    std::chrono::milliseconds timeout() const noexcept { return timeout_; }
    std::chrono::milliseconds connect_timeout() const noexcept { return connect_timeout_; }
    const RetryConfig& retry() const noexcept { return retry_; }
    TransportMode transport() const noexcept { return transport_; }
    bool is_kernel_transport() const noexcept { return transport_ == TransportMode::Kernel; }
    bool is_http_transport() const noexcept { return transport_ == TransportMode::Http; }
    bool use_local_endpoints() const noexcept { return use_local_endpoints_; }
    const EnvironmentSignals& environment() const noexcept { return environment_; }
    const std::string& kernel_directory() const noexcept { return kernel_directory_; }
    const std::string& kernel_binary() const noexcept { return kernel_binary_; }
    bool tls_verify_peer() const noexcept { return tls_verify_peer_; }
    const std::string& tls_ca_file() const noexcept { return tls_ca_file_; }
    const LogCallback& logger() const noexcept { return logger_; }

    // Endpoint for the HTTP transport: base_url when set, else local/production.
    std::string http_endpoint() const;

    // Endpoint handed to the kernel binary: base_url when set, else local/production.
    std::string grpc_endpoint() const;

    // Setters re-validate and throw ConfigurationError.
    void set_base_url(std::optional<std::string> base_url);
    void set_timeout(std::chrono::milliseconds timeout);
    void set_connect_timeout(std::chrono::milliseconds timeout);
    void set_retry(RetryConfig retry);
    void set_transport(TransportMode mode);

    // Emit a diagnostic record through the configured callback, if any.
    void log(LogLevel level, const std::string& message) const {
        if (logger_) logger_(level, message);
    }

private:
    friend class HuefyConfigBuilder;

    explicit HuefyConfig(EnvironmentSignals environment);

    std::optional<std::string> base_url_;
    std::chrono::milliseconds timeout_{30000};
    std::chrono::milliseconds connect_timeout_{10000};
    RetryConfig retry_;
    TransportMode transport_ = TransportMode::Kernel;
    bool use_local_endpoints_ = false;
    EnvironmentSignals environment_;
    std::string kernel_directory_;
    std::string kernel_binary_;
    bool tls_verify_peer_ = true;
    std::string tls_ca_file_;
    LogCallback logger_;
};

// Fluent builder for HuefyConfig.
class HuefyConfigBuilder {
public:
    HuefyConfigBuilder() = default;

    HuefyConfigBuilder& base_url(std::string url);
    HuefyConfigBuilder& timeout(std::chrono::milliseconds timeout);
    HuefyConfigBuilder& connect_timeout(std::chrono::milliseconds timeout);
    HuefyConfigBuilder& retry(RetryConfig retry);
    HuefyConfigBuilder& transport(TransportMode mode);
    HuefyConfigBuilder& use_local_endpoints(bool local);
    HuefyConfigBuilder& environment(EnvironmentSignals signals);
    HuefyConfigBuilder& kernel_directory(std::string dir);
    HuefyConfigBuilder& kernel_binary(std::string path);
    HuefyConfigBuilder& tls_verify_peer(bool verify);
    HuefyConfigBuilder& tls_ca_file(std::string path);
    HuefyConfigBuilder& logger(HuefyConfig::LogCallback callback);

    // Build the config. Throws ConfigurationError on invalid values.
    HuefyConfig build() const;

private:
    std::optional<std::string> base_url_;
    std::chrono::milliseconds timeout_{30000};
    std::chrono::milliseconds connect_timeout_{10000};
    RetryConfig retry_;
    TransportMode transport_ = TransportMode::Kernel;
    std::optional<bool> use_local_endpoints_;
    std::optional<EnvironmentSignals> environment_;
    std::string kernel_directory_;
    std::string kernel_binary_;
    bool tls_verify_peer_ = true;
    std::string tls_ca_file_;
    HuefyConfig::LogCallback logger_;
};

} // namespace huefy
