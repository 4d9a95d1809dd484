// Full HuefyConfig builder, all available options with defaults.
//
//   cmake -B build -DHUEFY_BUILD_EXAMPLES=ON && cmake --build build
//   ./build/example_config

#include "huefy/huefy.hpp"
#include <chrono>
#include <iostream>

int main() {
    auto config = huefy::HuefyConfig::builder()
        .base_url("https://api.huefy.dev/api/v1/sdk")              // default: unset, endpoint from environment
        .timeout(std::chrono::milliseconds(30000))                 // default: 30s per call
        .connect_timeout(std::chrono::milliseconds(10000))         // default: 10s TCP/TLS connect
        .retry(huefy::RetryConfig(true, 3,                         // default: 3 retries
                                  std::chrono::milliseconds(1000), //   1s base delay
                                  std::chrono::milliseconds(30000),//   30s ceiling
                                  2.0))                            //   doubling
        .transport(huefy::TransportMode::Http)                     // default: Kernel
        .use_local_endpoints(false)                                // default: APP_ENV / NODE_ENV decide
        .tls_verify_peer(true)                                     // default: true
        .tls_ca_file("")                                           // default: system trust store
        .logger([](huefy::LogLevel level, const std::string& msg) {// default: silent
            std::cerr << "[Huefy " << huefy::to_string(level) << "] " << msg << std::endl;
        })
        .build();

    std::cout << "HTTP endpoint:   " << config.http_endpoint() << "\n"
              << "kernel endpoint: " << config.grpc_endpoint() << "\n"
              << "retry #2 delay:  " << config.retry().delay_for(2).count() << "ms\n";

    try {
        auto client = huefy::HuefyClient::create("hk_live_example", std::move(config));
        auto health = client->health_check();
        std::cout << "status: " << health.status << " (" << health.version << ")\n";
    } catch (const huefy::HuefyError& e) {
        std::cerr << to_string(e.kind()) << ": " << e.what() << std::endl;
        return 1;
    }
}
