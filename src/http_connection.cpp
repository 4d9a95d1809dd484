// src/http_connection.cpp
// TCP connect with timeout, TLS handshake and deadline-bounded HTTP exchange.

#include "http_connection.hpp"
#include "huefy/error.hpp"
#include "sigpipe.hpp"

#include <openssl/err.h>
#include <openssl/x509v3.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <limits>

// POSIX sockets
#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace huefy {
namespace http {

namespace {

using Clock = std::chrono::steady_clock;

// Remaining milliseconds until deadline, clamped to [0, INT_MAX].
int remaining_ms(Clock::time_point deadline) noexcept {
    using namespace std::chrono;
    const auto now = Clock::now();
    if (now >= deadline) return 0;
    const auto ms = duration_cast<milliseconds>(deadline - now).count();
    if (ms > static_cast<long long>(std::numeric_limits<int>::max())) {
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(std::max<long long>(ms, 1));
}

// Drain the OpenSSL error queue into one string.
std::string openssl_errors() {
    std::string out;
    unsigned long e = 0;
    while ((e = ::ERR_get_error()) != 0) {
        char buf[256];
        ::ERR_error_string_n(e, buf, sizeof(buf));
        if (!out.empty()) out += "; ";
        out += buf;
    }
    return out.empty() ? std::string("unknown TLS error") : out;
}

// Block until fd is ready for `events` or the deadline passes.
void wait_fd(int fd, short events, Clock::time_point deadline, const char* what) {
    while (true) {
        int ms = remaining_ms(deadline);
        if (ms <= 0) throw TimeoutError(std::string(what) + " timed out");
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = events;
        int pr = ::poll(&pfd, 1, ms);
        if (pr > 0) return;
        if (pr == 0) throw TimeoutError(std::string(what) + " timed out");
        if (errno != EINTR) {
            throw NetworkError(std::string(what) + " poll failed: " + std::strerror(errno));
        }
    }
}

// A connected non-blocking socket, optionally wrapped in TLS.
class Connection {
public:
    Connection(const Url& url, std::chrono::milliseconds connect_timeout,
               Clock::time_point deadline, TlsContext* tls)
        : deadline_(deadline) {
        connect(url, std::min(deadline, Clock::now() + connect_timeout));
        try {
            if (tls) handshake(url, *tls);
        } catch (...) {
            release();
            throw;
        }
    }

    ~Connection() { release(); }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    void write_all(const std::string& data) {
        size_t off = 0;
        while (off < data.size()) {
            size_t n = ssl_ ? tls_write(data.data() + off, data.size() - off)
                            : plain_write(data.data() + off, data.size() - off);
            off += n;
        }
    }

    // Returns 0 at end of stream.
    size_t read_some(char* buf, size_t len) {
        return ssl_ ? tls_read(buf, len) : plain_read(buf, len);
    }

private:
    void release() {
        if (ssl_) {
            ScopedSigpipeBlock no_sigpipe;
            ::SSL_shutdown(ssl_.get());
            ssl_.reset();
        }
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

    void connect(const Url& url, Clock::time_point connect_deadline) {
        struct addrinfo hints{}, *res = nullptr;
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        hints.ai_protocol = IPPROTO_TCP;

        auto port_str = std::to_string(url.port);
        int err = ::getaddrinfo(url.host.c_str(), port_str.c_str(), &hints, &res);
        if (err != 0 || res == nullptr) {
            throw NetworkError("DNS resolution failed for " + url.host + ": " + ::gai_strerror(err));
        }

        // Try each resolved address (IPv6/IPv4) until one connects.
        bool timed_out = false;
        int last_errno = 0;
        for (struct addrinfo* rp = res; rp != nullptr; rp = rp->ai_next) {
            int fd = ::socket(rp->ai_family, rp->ai_socktype | SOCK_CLOEXEC, rp->ai_protocol);
            if (fd < 0) {
                last_errno = errno;
                continue;
            }

            int flags = ::fcntl(fd, F_GETFL, 0);
            if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
                last_errno = errno;
                ::close(fd);
                continue;
            }

            int ret = ::connect(fd, rp->ai_addr, rp->ai_addrlen);
            if (ret < 0 && errno != EINPROGRESS) {
                last_errno = errno;
                ::close(fd);
                continue;
            }

            if (ret < 0) {
                // Wait for connection with timeout
                pollfd pfd{};
                pfd.fd = fd;
                pfd.events = POLLOUT;
                int pr = 0;
                do {
                    pr = ::poll(&pfd, 1, remaining_ms(connect_deadline));
                } while (pr < 0 && errno == EINTR);
                if (pr == 0) {
                    timed_out = true;
                    ::close(fd);
                    continue;
                }
                int so_error = 0;
                socklen_t len = sizeof(so_error);
                if (pr < 0 || ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0 ||
                    so_error != 0) {
                    last_errno = pr < 0 ? errno : so_error;
                    ::close(fd);
                    continue;
                }
            }

            int nodelay = 1;
            ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));
            fd_ = fd;
            ::freeaddrinfo(res);
            return;
        }

        ::freeaddrinfo(res);
        const std::string target = url.host + ":" + port_str;
        if (timed_out && last_errno == 0) {
            throw TimeoutError("connect to " + target + " timed out");
        }
        throw NetworkError("connect failed to " + target +
                           (last_errno ? std::string(": ") + std::strerror(last_errno) : ""));
    }

    void handshake(const Url& url, TlsContext& tls) {
        ssl_.reset(::SSL_new(tls.get()));
        if (!ssl_) throw NetworkError("SSL_new failed: " + openssl_errors());
        ::SSL_set_fd(ssl_.get(), fd_);
        ::SSL_set_tlsext_host_name(ssl_.get(), url.host.c_str());

        // Chain validation alone is not enough: pin the expected host name or IP.
        if (tls.verify_peer()) {
            unsigned char tmp[16];
            const bool is_ip = ::inet_pton(AF_INET, url.host.c_str(), tmp) == 1 ||
                               ::inet_pton(AF_INET6, url.host.c_str(), tmp) == 1;
            int ok = is_ip ? ::X509_VERIFY_PARAM_set1_ip_asc(::SSL_get0_param(ssl_.get()),
                                                             url.host.c_str())
                           : ::SSL_set1_host(ssl_.get(), url.host.c_str());
            if (ok != 1) throw NetworkError("cannot set TLS peer name: " + openssl_errors());
        }

        while (true) {
            ::ERR_clear_error();
            int rc = ::SSL_connect(ssl_.get());
            if (rc == 1) break;
            int ssl_err = ::SSL_get_error(ssl_.get(), rc);
            if (ssl_err == SSL_ERROR_WANT_READ) {
                wait_fd(fd_, POLLIN, deadline_, "TLS handshake");
            } else if (ssl_err == SSL_ERROR_WANT_WRITE) {
                wait_fd(fd_, POLLOUT, deadline_, "TLS handshake");
            } else if (ssl_err == SSL_ERROR_SYSCALL && errno == EINTR) {
                continue;
            } else {
                throw NetworkError("TLS handshake with " + url.host + " failed: " + openssl_errors());
            }
        }

        if (tls.verify_peer()) {
            long vr = ::SSL_get_verify_result(ssl_.get());
            if (vr != X509_V_OK) {
                throw NetworkError(std::string("TLS verify failed: ") +
                                   ::X509_verify_cert_error_string(vr));
            }
        }
    }

    size_t plain_write(const char* data, size_t len) {
        while (true) {
            ssize_t n = ::send(fd_, data, len, MSG_NOSIGNAL);
            if (n > 0) return static_cast<size_t>(n);
            if (n < 0 && errno == EINTR) continue;
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                wait_fd(fd_, POLLOUT, deadline_, "request write");
                continue;
            }
            throw NetworkError(std::string("send failed: ") + std::strerror(errno));
        }
    }

    size_t plain_read(char* buf, size_t len) {
        while (true) {
            ssize_t n = ::recv(fd_, buf, len, 0);
            if (n >= 0) return static_cast<size_t>(n);
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                wait_fd(fd_, POLLIN, deadline_, "response read");
                continue;
            }
            throw NetworkError(std::string("recv failed: ") + std::strerror(errno));
        }
    }

    size_t tls_write(const char* data, size_t len) {
        const int chunk = static_cast<int>(std::min<size_t>(len, 1u << 30));
        ScopedSigpipeBlock no_sigpipe;
        while (true) {
            ::ERR_clear_error();
            int n = ::SSL_write(ssl_.get(), data, chunk);
            if (n > 0) return static_cast<size_t>(n);
            int ssl_err = ::SSL_get_error(ssl_.get(), n);
            if (ssl_err == SSL_ERROR_WANT_READ) {
                wait_fd(fd_, POLLIN, deadline_, "request write");
            } else if (ssl_err == SSL_ERROR_WANT_WRITE) {
                wait_fd(fd_, POLLOUT, deadline_, "request write");
            } else {
                throw NetworkError("TLS write failed: " + openssl_errors());
            }
        }
    }

    size_t tls_read(char* buf, size_t len) {
        const int chunk = static_cast<int>(std::min<size_t>(len, 1u << 30));
        while (true) {
            ::ERR_clear_error();
            int n = ::SSL_read(ssl_.get(), buf, chunk);
            if (n > 0) return static_cast<size_t>(n);
            int ssl_err = ::SSL_get_error(ssl_.get(), n);
            if (ssl_err == SSL_ERROR_ZERO_RETURN) return 0;
            if (ssl_err == SSL_ERROR_WANT_READ) {
                wait_fd(fd_, POLLIN, deadline_, "response read");
            } else if (ssl_err == SSL_ERROR_WANT_WRITE) {
                wait_fd(fd_, POLLOUT, deadline_, "response read");
            } else if (ssl_err == SSL_ERROR_SYSCALL && errno == 0) {
                return 0;  // peer closed without close_notify
            } else {
                throw NetworkError("TLS read failed: " + openssl_errors());
            }
        }
    }

    Clock::time_point deadline_;
    int fd_ = -1;
    std::unique_ptr<SSL, void (*)(SSL*)> ssl_{nullptr, [](SSL* s) { ::SSL_free(s); }};
};

} // namespace

// --- TlsContext ---

TlsContext::TlsContext(bool verify_peer, const std::string& ca_file)
    : verify_peer_(verify_peer) {
    ctx_ = ::SSL_CTX_new(::TLS_client_method());
    if (!ctx_) {
        throw ConfigurationError("SSL_CTX_new failed: " + openssl_errors());
    }
    ::SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
    ::SSL_CTX_set_options(ctx_, SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif

    // Trust store
    int rc = ca_file.empty() ? ::SSL_CTX_set_default_verify_paths(ctx_)
                             : ::SSL_CTX_load_verify_locations(ctx_, ca_file.c_str(), nullptr);
    if (rc != 1) {
        std::string detail = openssl_errors();
        ::SSL_CTX_free(ctx_);
        ctx_ = nullptr;
        throw ConfigurationError("cannot load TLS trust store" +
                                 (ca_file.empty() ? std::string() : " " + ca_file) + ": " + detail);
    }

    ::SSL_CTX_set_verify(ctx_, verify_peer ? SSL_VERIFY_PEER : SSL_VERIFY_NONE, nullptr);
}

TlsContext::~TlsContext() {
    if (ctx_) {
        ::SSL_CTX_free(ctx_);
        ctx_ = nullptr;
    }
}

// --- SocketHttpSender ---

SocketHttpSender::SocketHttpSender(SenderOptions options) : options_(std::move(options)) {
    if (options_.load_tls) {
        tls_context();
    }
}

SocketHttpSender::~SocketHttpSender() = default;

TlsContext& SocketHttpSender::tls_context() {
    if (!tls_) {
        tls_ = std::make_unique<TlsContext>(options_.tls_verify_peer, options_.tls_ca_file);
    }
    return *tls_;
}

HttpResponse SocketHttpSender::send(const HttpRequest& req) {
    const auto deadline = Clock::now() + options_.timeout;
    Connection conn(req.url, options_.connect_timeout, deadline,
                    req.url.tls() ? &tls_context() : nullptr);

    conn.write_all(serialize_request(req));

    HttpResponse out;
    std::string raw;
    size_t head_end = 0;
    size_t chunk_pos = 0;
    bool have_head = false;
    bool eof = false;
    char buf[8192];

    while (true) {
        if (!have_head) {
            have_head = parse_response_head(raw, head_end, out);
            if (have_head) {
                chunk_pos = head_end;
                out.body.clear();
            }
        }
        if (have_head) {
            // Interim 1xx responses carry no body; skip to the final one.
            if (out.status_code >= 100 && out.status_code < 200) {
                raw.erase(0, head_end);
                have_head = false;
                continue;
            }
            if (out.status_code == 204 || out.status_code == 304 || req.method == "HEAD") {
                break;
            }
            const std::string te = out.header("transfer-encoding");
            const std::string cl = out.header("content-length");
            if (te.find("chunked") != std::string::npos) {
                if (decode_chunked(raw, chunk_pos, out.body)) return out;
            } else if (!cl.empty()) {
                size_t want = 0;
                try {
                    want = static_cast<size_t>(std::stoull(cl));
                } catch (const std::exception&) {
                    throw NetworkError("malformed Content-Length: " + cl);
                }
                if (raw.size() - head_end >= want) {
                    out.body = raw.substr(head_end, want);
                    return out;
                }
            } else if (eof) {
                out.body = raw.substr(head_end);
                return out;
            }
        }
        if (eof) {
            throw NetworkError("connection closed before the response was complete");
        }

        size_t n = conn.read_some(buf, sizeof(buf));
        if (n == 0) {
            eof = true;
            continue;
        }
        raw.append(buf, n);
        if (raw.size() > options_.max_response_bytes) {
            throw NetworkError("response exceeds " + std::to_string(options_.max_response_bytes) +
                               " bytes");
        }
    }

    out.body.clear();
    return out;
}

} // namespace http
} // namespace huefy
