// Send several emails in one bulk call and report per-recipient results.
//
//   cmake -B build -DHUEFY_BUILD_EXAMPLES=ON && cmake --build build
//   HUEFY_API_KEY=hk_live_... ./build/example_bulk_send a@example.com b@example.com

#include "huefy/huefy.hpp"
#include <cstdlib>
#include <iostream>
#include <map>
#include <vector>

int main(int argc, char** argv) {
    const char* api_key = std::getenv("HUEFY_API_KEY");
    if (!api_key || argc < 2) {
        std::cerr << "usage: HUEFY_API_KEY=... " << argv[0] << " <recipient>..." << std::endl;
        return 2;
    }

    std::vector<huefy::SendEmailRequest> requests;
    for (int i = 1; i < argc; ++i) {
        requests.emplace_back("newsletter", argv[i],
                              std::map<std::string, std::string>{{"issue", "42"}});
    }

    auto config = huefy::HuefyConfig::builder()
        .transport(huefy::TransportMode::Http)
        .logger([](huefy::LogLevel level, const std::string& msg) {
            if (level <= huefy::LogLevel::Warning) std::cerr << "[Huefy] " << msg << std::endl;
        })
        .build();

    try {
        auto client = huefy::HuefyClient::create(api_key, std::move(config));
        auto response = client->send_bulk_emails(requests);
        std::cout << response.successful_emails << "/" << response.total_emails << " sent\n";
        for (size_t i = 0; i < response.results.size() && i < requests.size(); ++i) {
            const auto& r = response.results[i];
            std::cout << "  " << requests[i].recipient << ": "
                      << (r.success ? r.message_id : r.error_code + " " + r.error_message) << "\n";
        }
        return response.success ? 0 : 1;
    } catch (const huefy::ValidationError& e) {
        std::cerr << "request " << e.index() << " is invalid: " << e.what() << std::endl;
        return 1;
    } catch (const huefy::HuefyError& e) {
        std::cerr << "bulk send failed: " << e.what() << std::endl;
        return 1;
    }
}
