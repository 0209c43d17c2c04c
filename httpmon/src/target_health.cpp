
#include "target_health.hpp"
#include "util.hpp"
#include <algorithm>

nlohmann::json TargetHealthSnapshot::to_json() const {
    nlohmann::json j = {
        {"name", name},
        {"url", url},
        {"status", health_status_to_string(current_status)},
        {"consecutive_failures", consecutive_failures},
        {"total_checks", total_checks},
        {"successful_checks", successful_checks},
        {"uptime_percentage", uptime_percentage},
        {"avg_response_ms", avg_response_ms},
        {"min_response_ms", min_response_time.count()},
        {"max_response_ms", max_response_time.count()},
        {"health_score", health_score}
    };
    j["last_check"] = last_check ? nlohmann::json(util::format_iso8601(*last_check)) : nlohmann::json(nullptr);
    j["window_uptime_percentage"] = window_uptime_percentage ? nlohmann::json(*window_uptime_percentage) : nlohmann::json(nullptr);
    return j;
}

TargetHealth::TargetHealth(const Target& target, uint32_t unhealthy_after, std::chrono::minutes health_window)
    : name_(target.name),
      url_(target.url),
      unhealthy_after_(std::max<uint32_t>(unhealthy_after, 1)),
      health_window_(health_window) {
}

void TargetHealth::update_with_check(const HealthCheck& check) {
    total_checks_++;
    last_check_ = check.timestamp;

    if (check.success) {
        successful_checks_++;
        consecutive_failures_ = 0;
    } else {
        consecutive_failures_++;
    }

    // Response time stats
    if (!min_response_time_ || check.response_time < *min_response_time_) {
        min_response_time_ = check.response_time;
    }
    if (check.response_time > max_response_time_) {
        max_response_time_ = check.response_time;
    }
    total_response_ms_ += static_cast<uint64_t>(std::max<int64_t>(check.response_time.count(), 0));

    uptime_percentage_ = 100.0 * static_cast<double>(successful_checks_) / static_cast<double>(total_checks_);

    current_status_ = classify();

    double uptime_score = uptime_percentage_ / 100.0;
    health_score_ = std::clamp(uptime_score * 0.7 + response_time_score(avg_response_ms()) * 0.3, 0.0, 1.0);

    recent_checks_.push_back(check);
    while (recent_checks_.size() > kHistoryCapacity) {
        recent_checks_.pop_front();
    }
}

HealthStatus TargetHealth::classify() const {
    if (total_checks_ == 0) {
        return HealthStatus::Unknown;
    }

    if (consecutive_failures_ == 0) {
        if (uptime_percentage_ >= 99.0) {
            return HealthStatus::Healthy;
        }
        if (uptime_percentage_ >= 95.0) {
            return HealthStatus::Degraded;
        }
        return HealthStatus::Unhealthy;
    }

    if (consecutive_failures_ >= unhealthy_after_) {
        return HealthStatus::Unhealthy;
    }
    return HealthStatus::Degraded;
}

double TargetHealth::response_time_score(double avg_ms) {
    if (avg_ms <= 500.0) {
        return 1.0;
    } else if (avg_ms <= 2000.0) {
        return 0.8;
    } else if (avg_ms <= 5000.0) {
        return 0.5;
    }
    return 0.2;
}

double TargetHealth::avg_response_ms() const {
    if (total_checks_ == 0) {
        return 0.0;
    }
    return static_cast<double>(total_response_ms_) / static_cast<double>(total_checks_);
}

std::chrono::milliseconds TargetHealth::avg_response_time() const {
    if (total_checks_ == 0) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::milliseconds(static_cast<int64_t>(total_response_ms_ / total_checks_));
}

std::chrono::milliseconds TargetHealth::min_response_time() const {
    return min_response_time_.value_or(std::chrono::milliseconds(0));
}

TargetHealthSnapshot TargetHealth::snapshot(std::chrono::system_clock::time_point now) const {
    TargetHealthSnapshot snap;
    snap.name = name_;
    snap.url = url_;
    snap.current_status = current_status_;
    snap.consecutive_failures = consecutive_failures_;
    snap.total_checks = total_checks_;
    snap.successful_checks = successful_checks_;
    snap.uptime_percentage = uptime_percentage_;
    snap.avg_response_ms = avg_response_ms();
    snap.min_response_time = min_response_time();
    snap.max_response_time = max_response_time_;
    snap.last_check = last_check_;
    snap.health_score = health_score_;

    // Uptime over the recent window, bounded by what the history still holds
    auto cutoff = now - health_window_;
    uint64_t window_total = 0;
    uint64_t window_ok = 0;
    for (const auto& check : recent_checks_) {
        if (check.timestamp >= cutoff) {
            window_total++;
            if (check.success) {
                window_ok++;
            }
        }
    }
    if (window_total > 0) {
        snap.window_uptime_percentage = static_cast<double>(window_ok) / static_cast<double>(window_total) * 100.0;
    }

    return snap;
}
