// src/http.cpp
// URL parsing and HTTP/1.1 framing helpers.

#include "http.hpp"
#include "huefy/error.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace huefy {
namespace http {

namespace {

std::string lower_copy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

void trim_inplace(std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    s = s.substr(b, e - b);
}

} // namespace

Url parse_url(const std::string& text) {
    Url url;
    auto sep = text.find("://");
    if (sep == std::string::npos) {
        throw ConfigurationError("base URL must start with http:// or https://, got: " + text);
    }
    url.scheme = lower_copy(text.substr(0, sep));
    if (url.scheme != "http" && url.scheme != "https") {
        throw ConfigurationError("unsupported URL scheme: " + url.scheme);
    }

    auto rest = text.substr(sep + 3);
    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    url.path = slash == std::string::npos ? std::string() : rest.substr(slash);
    while (!url.path.empty() && url.path.back() == '/') url.path.pop_back();

    url.port = url.scheme == "https" ? 443 : 80;
    std::string port_text;
    if (!authority.empty() && authority[0] == '[') {
        // IPv6 literal: [::1]:8080
        auto close = authority.find(']');
        if (close == std::string::npos) {
            throw ConfigurationError("malformed IPv6 host in URL: " + text);
        }
        url.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                throw ConfigurationError("malformed URL authority: " + text);
            }
            port_text = authority.substr(close + 2);
        }
    } else {
        auto colon = authority.rfind(':');
        url.host = authority.substr(0, colon);
        if (colon != std::string::npos) port_text = authority.substr(colon + 1);
    }

    if (url.host.empty()) {
        throw ConfigurationError("URL has no host: " + text);
    }
    if (!port_text.empty()) {
        int port_int = 0;
        try {
            size_t used = 0;
            port_int = std::stoi(port_text, &used);
            if (used != port_text.size()) port_int = 0;
        } catch (const std::exception&) {
            port_int = 0;
        }
        if (port_int <= 0 || port_int > 65535) {
            throw ConfigurationError("URL port must be 1-65535, got: " + port_text);
        }
        url.port = static_cast<uint16_t>(port_int);
    }
    return url;
}

std::string HttpResponse::header(const std::string& name) const {
    auto it = headers.find(lower_copy(name));
    return it == headers.end() ? std::string() : it->second;
}

std::string serialize_request(const HttpRequest& req) {
    std::ostringstream oss;
    oss << req.method << ' ' << (req.target.empty() ? "/" : req.target) << " HTTP/1.1\r\n";

    const bool ipv6 = req.url.host.find(':') != std::string::npos;
    oss << "Host: " << (ipv6 ? "[" + req.url.host + "]" : req.url.host);
    if (!req.url.default_port()) oss << ':' << req.url.port;
    oss << "\r\n";

    for (const auto& h : req.headers) {
        oss << h.first << ": " << h.second << "\r\n";
    }
    if (!req.body.empty() || req.method == "POST") {
        oss << "Content-Length: " << req.body.size() << "\r\n";
    }
    oss << "Connection: close\r\n\r\n";
    oss << req.body;
    return oss.str();
}

bool parse_response_head(const std::string& raw, size_t& head_end, HttpResponse& out) {
    auto hdr_end = raw.find("\r\n\r\n");
    if (hdr_end == std::string::npos) return false;
    head_end = hdr_end + 4;

    const std::string hdrs = raw.substr(0, hdr_end);
    auto line_end = hdrs.find("\r\n");
    const std::string status = hdrs.substr(0, line_end);

    // "HTTP/1.1 200 OK"
    std::istringstream iss(status);
    std::string version;
    if (!(iss >> version >> out.status_code) || version.compare(0, 5, "HTTP/") != 0) {
        throw NetworkError("malformed HTTP status line: " + status);
    }
    std::getline(iss, out.status_text);
    trim_inplace(out.status_text);

    out.headers.clear();
    size_t pos = line_end == std::string::npos ? hdrs.size() : line_end + 2;
    while (pos < hdrs.size()) {
        auto next = hdrs.find("\r\n", pos);
        if (next == std::string::npos) next = hdrs.size();
        std::string line = hdrs.substr(pos, next - pos);
        pos = next + 2;
        auto c = line.find(':');
        if (c == std::string::npos) continue;
        std::string k = line.substr(0, c);
        std::string v = line.substr(c + 1);
        trim_inplace(k);
        trim_inplace(v);
        out.headers[lower_copy(k)] = v;
    }
    return true;
}

bool decode_chunked(const std::string& raw, std::string& out) {
    out.clear();
    size_t pos = 0;
    return decode_chunked(raw, pos, out);
}

bool decode_chunked(const std::string& raw, size_t& pos, std::string& out) {
    // 15 hex digits stay below 2^60, so the size arithmetic cannot wrap.
    static constexpr size_t MAX_SIZE_DIGITS = 15;

    while (true) {
        auto line_end = raw.find("\r\n", pos);
        if (line_end == std::string::npos) return false;

        std::string size_text = raw.substr(pos, line_end - pos);
        auto ext = size_text.find(';');
        if (ext != std::string::npos) size_text.resize(ext);
        trim_inplace(size_text);

        if (size_text.empty() || size_text.size() > MAX_SIZE_DIGITS ||
            size_text.find_first_not_of("0123456789abcdefABCDEF") != std::string::npos) {
            throw NetworkError("malformed chunk size: " + size_text);
        }
        const size_t chunk = static_cast<size_t>(std::stoull(size_text, nullptr, 16));

        const size_t data = line_end + 2;
        if (chunk == 0) {
            // Trailers end with an empty line.
            if (raw.compare(data, 2, "\r\n") == 0) {
                pos = data + 2;
                return true;
            }
            auto end = raw.find("\r\n\r\n", data);
            if (end == std::string::npos) return false;
            pos = end + 4;
            return true;
        }
        if (raw.size() - data < chunk + 2) return false;
        if (raw.compare(data + chunk, 2, "\r\n") != 0) {
            throw NetworkError("malformed chunk terminator");
        }
        out.append(raw, data, chunk);
        pos = data + chunk + 2;
    }
}

} // namespace http
} // namespace huefy
