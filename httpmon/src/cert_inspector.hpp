
#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

class CertInspector {
public:
    virtual ~CertInspector() = default;

    // Whole days until the server certificate expires, nullopt when unknown
    virtual std::optional<uint32_t> days_until_expiry(const std::string& url) = 0;
};

// Reads the peer certificate over a TLS handshake. Results are cached per
// host:port so that a busy target does not open an extra connection per check.
class TlsCertInspector : public CertInspector {
public:
    explicit TlsCertInspector(std::chrono::seconds connect_timeout = std::chrono::seconds(5),
                              std::chrono::seconds cache_ttl = std::chrono::hours(1));

    std::optional<uint32_t> days_until_expiry(const std::string& url) override;

    struct Endpoint {
        std::string host;
        int port = 443;
    };

    static std::optional<Endpoint> parse_endpoint(const std::string& url);

private:
    struct CacheEntry {
        std::optional<uint32_t> days;
        std::chrono::steady_clock::time_point fetched_at;
    };

    std::optional<uint32_t> fetch_days(const Endpoint& endpoint);

    std::chrono::seconds connect_timeout_;
    std::chrono::seconds cache_ttl_;
    std::unordered_map<std::string, CacheEntry> cache_;
    std::mutex cache_mutex_;
};
