
#include "prober.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>

Prober::Prober(std::shared_ptr<HttpTransport> transport, std::shared_ptr<CertInspector> cert_inspector)
    : transport_(std::move(transport)), cert_inspector_(std::move(cert_inspector)) {
}

bool Prober::status_accepted(const Target& target, int status_code) {
    if (target.expected_status.empty()) {
        return status_code >= 200 && status_code < 300;
    }
    return std::find(target.expected_status.begin(), target.expected_status.end(), status_code) !=
           target.expected_status.end();
}

HttpRequest Prober::build_request(const Target& target) {
    HttpRequest request;
    request.method = target.method;
    request.url = target.url;
    request.headers = target.headers;
    // A zero timeout would mean "wait forever" to libcurl
    double timeout_ms = target.timeout_seconds * 1000.0;
    if (!(timeout_ms >= 1.0)) {
        timeout_ms = 1.0;
    }
    timeout_ms = std::min(timeout_ms, Config::kMaxTimeoutSeconds * 1000.0);
    request.timeout = std::chrono::milliseconds(static_cast<int64_t>(timeout_ms));
    request.read_body = target.expected_content.has_value();

    bool has_user_agent = std::any_of(request.headers.begin(), request.headers.end(),
        [](const auto& header) { return util::to_lower(header.first) == "user-agent"; });
    if (!has_user_agent) {
        request.headers["User-Agent"] = util::random_user_agent();
    }

    return request;
}

HealthCheck Prober::probe(const Target& target) {
    HealthCheck check;
    check.target = target.name;

    auto request = build_request(target);

    auto start = std::chrono::steady_clock::now();
    HttpResponse response;
    try {
        response = transport_->send(request);
    } catch (const std::exception& e) {
        response = HttpResponse{};
        response.transport_error = fmt::format("Request failed: {}", e.what());
    }
    check.response_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    if (!response.received()) {
        check.success = false;
        check.error = response.transport_error;
        check.timestamp = std::chrono::system_clock::now();
        spdlog::debug("Check for {} failed at transport level: {}", target.name, *check.error);
        return check;
    }

    check.status_code = response.status_code;
    bool status_ok = status_accepted(target, response.status_code);
    bool content_ok = true;

    if (target.expected_content) {
        if (response.body_error) {
            content_ok = false;
            check.error = fmt::format("Failed to read response body: {}", *response.body_error);
        } else if (response.body.find(*target.expected_content) == std::string::npos) {
            content_ok = false;
            check.error = fmt::format("Expected content '{}' not found in response", *target.expected_content);
        }
    }

    if (target.is_https() && cert_inspector_) {
        try {
            check.cert_expires_days = cert_inspector_->days_until_expiry(target.url);
        } catch (const std::exception& e) {
            // Expiry stays unknown; the check result itself stands
            spdlog::debug("Certificate lookup for {} failed: {}", target.name, e.what());
        }
    }

    check.success = status_ok && content_ok;
    check.timestamp = std::chrono::system_clock::now();
    return check;
}
