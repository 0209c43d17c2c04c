
#pragma once

#include "config.hpp"
#include "types.hpp"
#include <chrono>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

// Point-in-time copy of a target's aggregate, safe to hand across threads.
struct TargetHealthSnapshot {
    std::string name;
    std::string url;
    HealthStatus current_status = HealthStatus::Unknown;
    uint32_t consecutive_failures = 0;
    uint64_t total_checks = 0;
    uint64_t successful_checks = 0;
    double uptime_percentage = 0.0;
    double avg_response_ms = 0.0;
    std::chrono::milliseconds min_response_time{0};
    std::chrono::milliseconds max_response_time{0};
    std::optional<std::chrono::system_clock::time_point> last_check;
    double health_score = 1.0;
    std::optional<double> window_uptime_percentage;

    nlohmann::json to_json() const;
};

// Rolling health state for one target. Not synchronized: the owning poll loop
// serializes updates and readers go through snapshot() under the same lock.
class TargetHealth {
public:
    static constexpr std::size_t kHistoryCapacity = 100;

    explicit TargetHealth(const Target& target, uint32_t unhealthy_after = 3,
                          std::chrono::minutes health_window = std::chrono::minutes(60));

    void update_with_check(const HealthCheck& check);

    TargetHealthSnapshot snapshot(std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;

    const std::string& name() const { return name_; }
    HealthStatus current_status() const { return current_status_; }
    uint32_t consecutive_failures() const { return consecutive_failures_; }
    uint64_t total_checks() const { return total_checks_; }
    uint64_t successful_checks() const { return successful_checks_; }
    double uptime_percentage() const { return uptime_percentage_; }
    double health_score() const { return health_score_; }
    std::chrono::milliseconds min_response_time() const;
    std::chrono::milliseconds max_response_time() const { return max_response_time_; }
    const std::deque<HealthCheck>& recent_checks() const { return recent_checks_; }

    // Exact mean over every recorded response time
    double avg_response_ms() const;
    std::chrono::milliseconds avg_response_time() const;

    // Response-time tier used by the health score
    static double response_time_score(double avg_ms);

private:
    HealthStatus classify() const;

    std::string name_;
    std::string url_;
    uint32_t unhealthy_after_;
    std::chrono::minutes health_window_;

    HealthStatus current_status_ = HealthStatus::Unknown;
    uint32_t consecutive_failures_ = 0;
    uint64_t total_checks_ = 0;
    uint64_t successful_checks_ = 0;
    double uptime_percentage_ = 0.0;
    uint64_t total_response_ms_ = 0;
    std::optional<std::chrono::milliseconds> min_response_time_;
    std::chrono::milliseconds max_response_time_{0};
    std::optional<std::chrono::system_clock::time_point> last_check_;
    double health_score_ = 1.0;
    std::deque<HealthCheck> recent_checks_;
};
