
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

enum class HealthStatus {
    Unknown,
    Healthy,
    Degraded,
    Unhealthy
};

std::string health_status_to_string(HealthStatus status);

// Outcome of a single probe. Immutable once built by the Prober.
struct HealthCheck {
    std::string target;
    std::chrono::system_clock::time_point timestamp;
    bool success = false;
    std::optional<int> status_code;
    std::chrono::milliseconds response_time{0};
    std::optional<std::string> error;
    std::optional<uint32_t> cert_expires_days;

    nlohmann::json to_json() const;
};
