// src/http.hpp
// Minimal HTTP/1.1 message model, URL parsing and the sender seam.

#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace huefy {
namespace http {

struct Url {
    std::string scheme;  // "http" or "https"
    std::string host;
    uint16_t port = 0;
    std::string path;    // no trailing '/', empty for the root

    bool tls() const noexcept { return scheme == "https"; }
    bool default_port() const noexcept {
        return (scheme == "https" && port == 443) || (scheme == "http" && port == 80);
    }
};

// Parse scheme://host[:port][/path]. Throws ConfigurationError.
Url parse_url(const std::string& text);

struct HttpRequest {
    std::string method;
    Url url;
    std::string target;  // request path, e.g. "/api/v1/sdk/emails/send"
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
};

struct HttpResponse {
    int status_code = 0;
    std::string status_text;
    std::unordered_map<std::string, std::string> headers;  // lower-case names
    std::string body;

    bool ok() const noexcept { return status_code >= 200 && status_code < 300; }

    // Case-insensitive lookup, empty when absent.
    std::string header(const std::string& name) const;
};

// Serialize the request line, headers (plus Host, Content-Length and
// Connection: close) and body.
std::string serialize_request(const HttpRequest& req);

// Parse the status line and headers. Returns false until the blank line
// ending the head has arrived; `head_end` is then the body offset.
// Throws NetworkError on a malformed head.
bool parse_response_head(const std::string& raw, size_t& head_end, HttpResponse& out);

// Decode a chunked body. Returns false while the terminating chunk has not
// arrived. Throws NetworkError on malformed framing.
bool decode_chunked(const std::string& raw, std::string& out);

// Resumable form: decodes from `pos`, appending complete chunks to `out` and
// advancing `pos` past them, so each byte is decoded once as data arrives.
bool decode_chunked(const std::string& raw, size_t& pos, std::string& out);

// Sends one request and returns the response, whatever its status.
// Throws NetworkError (or TimeoutError) when no response was received.
class HttpSender {
public:
    virtual ~HttpSender() = default;
    virtual HttpResponse send(const HttpRequest& req) = 0;
};

} // namespace http
} // namespace huefy
