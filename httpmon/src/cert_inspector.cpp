#include "cert_inspector.hpp"
#include "util.hpp"
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <spdlog/spdlog.h>
#include <netdb.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <memory>

namespace {

struct AddrInfoDeleter {
    void operator()(addrinfo* info) const { freeaddrinfo(info); }
};

struct SslCtxDeleter {
    void operator()(SSL_CTX* ctx) const { SSL_CTX_free(ctx); }
};

struct SslDeleter {
    void operator()(SSL* ssl) const {
        SSL_shutdown(ssl);
        SSL_free(ssl);
    }
};

struct X509Deleter {
    void operator()(X509* cert) const { X509_free(cert); }
};

class SocketGuard {
public:
    explicit SocketGuard(int fd) : fd_(fd) {}
    ~SocketGuard() {
        if (fd_ >= 0) {
            close(fd_);
        }
    }
    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;

    int get() const { return fd_; }

private:
    int fd_;
};

int connect_with_timeout(const std::string& host, int port, std::chrono::seconds timeout) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* raw = nullptr;
    if (getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &raw) != 0) {
        return -1;
    }
    std::unique_ptr<addrinfo, AddrInfoDeleter> res(raw);

    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count());

    for (addrinfo* ai = res.get(); ai != nullptr; ai = ai->ai_next) {
        int sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock < 0) {
            continue;
        }

        // Linux applies SO_SNDTIMEO to connect() as well
        setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

        if (::connect(sock, ai->ai_addr, ai->ai_addrlen) == 0) {
            return sock;
        }
        close(sock);
    }
    return -1;
}

} // namespace

TlsCertInspector::TlsCertInspector(std::chrono::seconds connect_timeout, std::chrono::seconds cache_ttl)
    : connect_timeout_(connect_timeout), cache_ttl_(cache_ttl) {
}

std::optional<TlsCertInspector::Endpoint> TlsCertInspector::parse_endpoint(const std::string& url) {
    const std::string scheme = "https://";
    if (!util::starts_with(util::to_lower(url), scheme)) {
        return std::nullopt;
    }

    std::string authority = url.substr(scheme.size());
    auto slash = authority.find_first_of("/?#");
    if (slash != std::string::npos) {
        authority = authority.substr(0, slash);
    }
    auto at = authority.rfind('@');
    if (at != std::string::npos) {
        authority = authority.substr(at + 1);
    }
    if (authority.empty()) {
        return std::nullopt;
    }

    Endpoint endpoint;
    std::string port_part;
    if (authority.front() == '[') {
        // IPv6 literal
        auto close_bracket = authority.find(']');
        if (close_bracket == std::string::npos) {
            return std::nullopt;
        }
        endpoint.host = authority.substr(1, close_bracket - 1);
        if (close_bracket + 1 < authority.size() && authority[close_bracket + 1] == ':') {
            port_part = authority.substr(close_bracket + 2);
        }
    } else {
        auto colon = authority.find(':');
        endpoint.host = authority.substr(0, colon);
        if (colon != std::string::npos) {
            port_part = authority.substr(colon + 1);
        }
    }

    if (!port_part.empty()) {
        try {
            endpoint.port = std::stoi(port_part);
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }

    if (endpoint.host.empty() || endpoint.port <= 0 || endpoint.port > 65535) {
        return std::nullopt;
    }
    return endpoint;
}

std::optional<uint32_t> TlsCertInspector::days_until_expiry(const std::string& url) {
    auto endpoint = parse_endpoint(url);
    if (!endpoint) {
        return std::nullopt;
    }

    std::string key = endpoint->host + ":" + std::to_string(endpoint->port);
    auto now = std::chrono::steady_clock::now();

    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto it = cache_.find(key);
        if (it != cache_.end() && now - it->second.fetched_at < cache_ttl_) {
            return it->second.days;
        }
    }

    auto days = fetch_days(*endpoint);

    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        cache_[key] = {days, now};
    }

    return days;
}

std::optional<uint32_t> TlsCertInspector::fetch_days(const Endpoint& endpoint) {
    SocketGuard sock(connect_with_timeout(endpoint.host, endpoint.port, connect_timeout_));
    if (sock.get() < 0) {
        spdlog::debug("Certificate check: cannot connect to {}:{}", endpoint.host, endpoint.port);
        return std::nullopt;
    }

    std::unique_ptr<SSL_CTX, SslCtxDeleter> ctx(SSL_CTX_new(TLS_client_method()));
    if (!ctx) {
        return std::nullopt;
    }

    std::unique_ptr<SSL, SslDeleter> ssl(SSL_new(ctx.get()));
    if (!ssl) {
        return std::nullopt;
    }
    SSL_set_fd(ssl.get(), sock.get());
    SSL_set_tlsext_host_name(ssl.get(), endpoint.host.c_str());

    if (SSL_connect(ssl.get()) != 1) {
        unsigned long err = ERR_get_error();
        char buf[256];
        ERR_error_string_n(err, buf, sizeof(buf));
        spdlog::debug("Certificate check: TLS handshake with {} failed: {}", endpoint.host, buf);
        return std::nullopt;
    }

    std::unique_ptr<X509, X509Deleter> cert(SSL_get_peer_certificate(ssl.get()));
    if (!cert) {
        return std::nullopt;
    }

    int days = 0;
    int seconds = 0;
    if (ASN1_TIME_diff(&days, &seconds, nullptr, X509_get0_notAfter(cert.get())) != 1) {
        return std::nullopt;
    }

    if (days < 0 || (days == 0 && seconds < 0)) {
        return 0u;
    }
    return static_cast<uint32_t>(days);
}
