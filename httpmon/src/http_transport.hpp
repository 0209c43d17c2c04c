
#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
    std::chrono::milliseconds timeout{10000};
    bool read_body = true;
};

struct HttpResponse {
    int status_code = 0;
    std::string body;

    // Set when no response was received (DNS, refused connection, timeout)
    std::optional<std::string> transport_error;

    // Set when a status line arrived but the body could not be read
    std::optional<std::string> body_error;

    bool received() const { return !transport_error.has_value(); }
};

class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // Performs one request. Never throws for network-level failures.
    virtual HttpResponse send(const HttpRequest& request) = 0;
};

class CprTransport : public HttpTransport {
public:
    CprTransport() = default;

    HttpResponse send(const HttpRequest& request) override;

    // Non-copyable
    CprTransport(const CprTransport&) = delete;
    CprTransport& operator=(const CprTransport&) = delete;
};
