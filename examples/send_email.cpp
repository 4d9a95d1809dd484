// Send a single template email.
//
//   cmake -B build -DHUEFY_BUILD_EXAMPLES=ON && cmake --build build
//   HUEFY_API_KEY=hk_live_... ./build/example_send_email jane@example.com

#include "huefy/huefy.hpp"
#include <cstdlib>
#include <iostream>

int main(int argc, char** argv) {
    const char* api_key = std::getenv("HUEFY_API_KEY");
    if (!api_key || argc < 2) {
        std::cerr << "usage: HUEFY_API_KEY=... " << argv[0] << " <recipient>" << std::endl;
        return 2;
    }

    try {
        auto client = huefy::HuefyClient::create(api_key, huefy::HuefyConfig::production());

        huefy::SendEmailRequest request("welcome-email", argv[1],
                                        {{"name", "Jane"}, {"company", "Acme Corp"}},
                                        huefy::EmailProvider::Sendgrid);
        auto response = client->send_email(request);
        std::cout << "sent: " << response.message_id << " via " << response.provider << std::endl;
    } catch (const huefy::ValidationError& e) {
        std::cerr << "invalid request (" << e.field() << "): " << e.what() << std::endl;
        return 1;
    } catch (const huefy::TemplateNotFoundError& e) {
        std::cerr << "no such template: " << e.message() << std::endl;
        return 1;
    } catch (const huefy::HuefyError& e) {
        std::cerr << "send failed [" << e.code() << "]: " << e.what() << std::endl;
        return 1;
    }
}
