// src/config.cpp
// Configuration builder, presets, endpoint resolution.

#include "huefy/config.hpp"
#include "validation.hpp"

#include <cmath>
#include <cstdlib>

namespace huefy {

namespace {

void check_timeout(const char* name, std::chrono::milliseconds timeout) {
    if (timeout.count() <= 0) {
        throw ConfigurationError(std::string(name) + " must be positive");
    }
}

std::optional<std::string> read_env(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr) return std::nullopt;
    return std::string(value);
}

std::optional<std::string> normalize_base_url(std::optional<std::string> url) {
    if (!url) return std::nullopt;
    auto trimmed = validation::trim(*url);
    while (!trimmed.empty() && trimmed.back() == '/') trimmed.pop_back();
    if (trimmed.empty()) {
        throw ConfigurationError("base URL must not be empty");
    }
    return trimmed;
}

} // namespace

// --- EnvironmentSignals ---

EnvironmentSignals EnvironmentSignals::from_process() {
    EnvironmentSignals signals;
    signals.app_env = read_env("APP_ENV");
    signals.node_env = read_env("NODE_ENV");
    return signals;
}

bool EnvironmentSignals::indicates_production() const noexcept {
    return (app_env && *app_env == "production") || (node_env && *node_env == "production");
}

// --- RetryConfig ---

RetryConfig::RetryConfig(bool enabled, uint32_t max_retries, std::chrono::milliseconds base_delay,
                         std::chrono::milliseconds max_delay, double backoff_multiplier)
    : enabled_(enabled), max_retries_(max_retries), base_delay_(base_delay),
      max_delay_(max_delay), backoff_multiplier_(backoff_multiplier) {
    if (base_delay_.count() <= 0) {
        throw ConfigurationError("retry base delay must be positive");
    }
    if (max_delay_ < base_delay_) {
        throw ConfigurationError("retry max delay must not be below the base delay");
    }
    if (!(backoff_multiplier_ >= 1.0)) {
        throw ConfigurationError("retry backoff multiplier must be at least 1");
    }
}

RetryConfig RetryConfig::disabled() {
    RetryConfig config;
    config.enabled_ = false;
    config.max_retries_ = 0;
    return config;
}

std::chrono::milliseconds RetryConfig::delay_for(uint32_t attempt) const noexcept {
    if (attempt == 0) return std::chrono::milliseconds(0);
    double delay = static_cast<double>(base_delay_.count()) *
                   std::pow(backoff_multiplier_, static_cast<double>(attempt - 1));
    double ceiling = static_cast<double>(max_delay_.count());
    if (!(delay < ceiling)) return max_delay_;
    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

// --- HuefyConfig ---

HuefyConfig::HuefyConfig() : HuefyConfig(EnvironmentSignals::from_process()) {}

HuefyConfig::HuefyConfig(EnvironmentSignals environment)
    : environment_(std::move(environment)) {
    use_local_endpoints_ = environment_.any_set() && !environment_.indicates_production();
}

HuefyConfigBuilder HuefyConfig::builder() {
    return HuefyConfigBuilder();
}

HuefyConfig HuefyConfig::production() {
    return HuefyConfig::builder().use_local_endpoints(false).build();
}

HuefyConfig HuefyConfig::local() {
    return HuefyConfig::builder().use_local_endpoints(true).build();
}

HuefyConfig HuefyConfig::without_retries() {
    return HuefyConfig::builder().retry(RetryConfig::disabled()).build();
}

std::string HuefyConfig::http_endpoint() const {
    if (base_url_) return *base_url_;
    return use_local_endpoints_ ? LOCAL_HTTP_ENDPOINT : PRODUCTION_HTTP_ENDPOINT;
}

std::string HuefyConfig::grpc_endpoint() const {
    if (base_url_) return *base_url_;
    return use_local_endpoints_ ? LOCAL_GRPC_ENDPOINT : PRODUCTION_GRPC_ENDPOINT;
}

void HuefyConfig::set_base_url(std::optional<std::string> base_url) {
    base_url_ = normalize_base_url(std::move(base_url));
}

void HuefyConfig::set_timeout(std::chrono::milliseconds timeout) {
    check_timeout("timeout", timeout);
    timeout_ = timeout;
}

void HuefyConfig::set_connect_timeout(std::chrono::milliseconds timeout) {
    check_timeout("connect timeout", timeout);
    connect_timeout_ = timeout;
}

void HuefyConfig::set_retry(RetryConfig retry) {
    retry_ = retry;
}

void HuefyConfig::set_transport(TransportMode mode) {
    if (mode != TransportMode::Kernel && mode != TransportMode::Http) {
        throw ConfigurationError("transport must be one of: kernel, http");
    }
    transport_ = mode;
}

// --- HuefyConfigBuilder ---

HuefyConfigBuilder& HuefyConfigBuilder::base_url(std::string url) {
    base_url_ = std::move(url);
    return *this;
}

HuefyConfigBuilder& HuefyConfigBuilder::timeout(std::chrono::milliseconds timeout) {
    timeout_ = timeout;
    return *this;
}

HuefyConfigBuilder& HuefyConfigBuilder::connect_timeout(std::chrono::milliseconds timeout) {
    connect_timeout_ = timeout;
    return *this;
}

HuefyConfigBuilder& HuefyConfigBuilder::retry(RetryConfig retry) {
    retry_ = retry;
    return *this;
}

HuefyConfigBuilder& HuefyConfigBuilder::transport(TransportMode mode) {
    transport_ = mode;
    return *this;
}

HuefyConfigBuilder& HuefyConfigBuilder::use_local_endpoints(bool local) {
    use_local_endpoints_ = local;
    return *this;
}

HuefyConfigBuilder& HuefyConfigBuilder::environment(EnvironmentSignals signals) {
    environment_ = std::move(signals);
    return *this;
}

HuefyConfigBuilder& HuefyConfigBuilder::kernel_directory(std::string dir) {
    kernel_directory_ = std::move(dir);
    return *this;
}

HuefyConfigBuilder& HuefyConfigBuilder::kernel_binary(std::string path) {
    kernel_binary_ = std::move(path);
    return *this;
}

HuefyConfigBuilder& HuefyConfigBuilder::tls_verify_peer(bool verify) {
    tls_verify_peer_ = verify;
    return *this;
}

HuefyConfigBuilder& HuefyConfigBuilder::tls_ca_file(std::string path) {
    tls_ca_file_ = std::move(path);
    return *this;
}

HuefyConfigBuilder& HuefyConfigBuilder::logger(HuefyConfig::LogCallback callback) {
    logger_ = std::move(callback);
    return *this;
}

HuefyConfig HuefyConfigBuilder::build() const {
    HuefyConfig result(environment_ ? *environment_ : EnvironmentSignals::from_process());
    if (use_local_endpoints_) {
        result.use_local_endpoints_ = *use_local_endpoints_;
    }
    result.set_base_url(base_url_);
    result.set_timeout(timeout_);
    result.set_connect_timeout(connect_timeout_);
    result.set_retry(retry_);
    result.set_transport(transport_);
    result.kernel_directory_ = kernel_directory_;
    result.kernel_binary_ = kernel_binary_;
    result.tls_verify_peer_ = tls_verify_peer_;
    result.tls_ca_file_ = tls_ca_file_;
    result.logger_ = logger_;
    return result;
}

} // namespace huefy
