// bench/bench_common.hpp
// Shared benchmark scenarios for request and response payloads.

#pragma once

#include "huefy/models.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace huefy_bench {

struct BenchScenario {
    const char* name;
    size_t emails_per_call;
    size_t data_fields;
    size_t field_size;
};

constexpr BenchScenario SCENARIOS[] = {
    {"single_small", 1, 2, 16},
    {"single_rich", 1, 20, 64},
    {"bulk_typical", 100, 4, 32},
    {"bulk_large", 1000, 4, 32},
};

constexpr size_t SCENARIO_COUNT = sizeof(SCENARIOS) / sizeof(SCENARIOS[0]);

// One valid request with `fields` template variables of `field_size` bytes.
inline huefy::SendEmailRequest make_request(size_t index, size_t fields, size_t field_size) {
    huefy::SendEmailRequest req("welcome-email", "user" + std::to_string(index) + "@example.com");
    for (size_t f = 0; f < fields; ++f) {
        req.data["field_" + std::to_string(f)] = std::string(field_size, 'x');
    }
    req.provider = huefy::EmailProvider::Ses;
    return req;
}

inline std::vector<huefy::SendEmailRequest> make_requests(const BenchScenario& s) {
    std::vector<huefy::SendEmailRequest> out;
    out.reserve(s.emails_per_call);
    for (size_t i = 0; i < s.emails_per_call; ++i) {
        out.push_back(make_request(i, s.data_fields, s.field_size));
    }
    return out;
}

// Serialized bulk response with `count` results, every fifth one failed.
inline std::string make_bulk_response(size_t count) {
    nlohmann::json results = nlohmann::json::array();
    for (size_t i = 0; i < count; ++i) {
        if (i % 5 == 4) {
            results.push_back({{"success", false},
                               {"error", {{"code", "INVALID_RECIPIENT"}, {"message", "bounced"}}}});
        } else {
            results.push_back({{"success", true}, {"messageId", "msg_" + std::to_string(i)}});
        }
    }
    return nlohmann::json{{"success", false}, {"message", "processed"}, {"results", results}}.dump();
}

} // namespace huefy_bench
