
#include "types.hpp"
#include "util.hpp"

std::string health_status_to_string(HealthStatus status) {
    switch (status) {
        case HealthStatus::Healthy: return "healthy";
        case HealthStatus::Degraded: return "degraded";
        case HealthStatus::Unhealthy: return "unhealthy";
        case HealthStatus::Unknown: return "unknown";
    }
    return "unknown";
}

nlohmann::json HealthCheck::to_json() const {
    nlohmann::json j = {
        {"target", target},
        {"timestamp", util::format_iso8601(timestamp)},
        {"success", success},
        {"response_time_ms", response_time.count()}
    };
    j["status_code"] = status_code ? nlohmann::json(*status_code) : nlohmann::json(nullptr);
    j["error"] = error ? nlohmann::json(*error) : nlohmann::json(nullptr);
    j["cert_expires_days"] = cert_expires_days ? nlohmann::json(*cert_expires_days) : nlohmann::json(nullptr);
    return j;
}
