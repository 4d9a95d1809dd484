// include/huefy/retry.hpp
// Retry policy for the HTTP transport: exponential backoff with a ceiling.

#pragma once

#include <chrono>
#include <cstdint>

namespace huefy {

class RetryConfig {
public:
    // Defaults: enabled, 3 retries, 1s base delay, 30s ceiling, doubling.
    RetryConfig() = default;

    // Throws ConfigurationError on a non-positive base delay, a ceiling below
    // the base delay, or a multiplier below 1.
    RetryConfig(bool enabled, uint32_t max_retries, std::chrono::milliseconds base_delay,
                std::chrono::milliseconds max_delay, double backoff_multiplier = 2.0);

    static RetryConfig disabled();

    bool enabled() const noexcept { return enabled_; }
    uint32_t max_retries() const noexcept { return max_retries_; }
    std::chrono::milliseconds base_delay() const noexcept { return base_delay_; }
    std::chrono::milliseconds max_delay() const noexcept { return max_delay_; }
    double backoff_multiplier() const noexcept { return backoff_multiplier_; }

    // Retries actually performed: max_retries() when enabled, otherwise 0.
    uint32_t effective_max_retries() const noexcept { return enabled_ ? max_retries_ : 0; }

    // Delay before retry number `attempt` (1-based):
    // min(base_delay * multiplier^(attempt-1), max_delay).
    std::chrono::milliseconds delay_for(uint32_t attempt) const noexcept;

private:
    bool enabled_ = true;
    uint32_t max_retries_ = 3;
    std::chrono::milliseconds base_delay_{1000};
    std::chrono::milliseconds max_delay_{30000};
    double backoff_multiplier_ = 2.0;
};

} // namespace huefy
