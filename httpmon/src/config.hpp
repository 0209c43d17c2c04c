
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

enum class OutputFormat {
    Pretty,
    Json,
    Csv,
    Prometheus
};

std::string output_format_to_string(OutputFormat format);
OutputFormat output_format_from_string(const std::string& name);

struct Target {
    std::string name;
    std::string url;
    std::string method = "GET";
    std::map<std::string, std::string> headers;
    std::vector<int> expected_status; // empty means any 2xx
    std::optional<std::string> expected_content;
    double timeout_seconds = 10.0;
    double interval_seconds = 60.0;

    bool is_https() const;
};

enum class TriggerKind {
    ConsecutiveFailures,
    ResponseTimeMs,
    HealthScoreBelow,
    CertExpiringDays
};

struct AlertTrigger {
    TriggerKind kind;
    double threshold = 0.0;

    static AlertTrigger consecutive_failures(uint32_t n);
    static AlertTrigger response_time_ms(uint64_t ms);
    static AlertTrigger health_score_below(double score);
    static AlertTrigger cert_expiring_days(uint32_t days);

    std::string describe() const;
};

struct AlertRule {
    std::string name;
    std::string webhook_url;
    std::vector<AlertTrigger> trigger_on;
    uint32_t cooldown_minutes = 30;
};

struct Settings {
    double default_interval = 60.0;
    double default_timeout = 10.0;
    uint32_t max_consecutive_failures = 3;
    uint32_t health_check_window_minutes = 60;
    OutputFormat output_format = OutputFormat::Pretty;
    bool enable_colors = true;
    std::optional<std::string> log_file;
    std::string log_level = "info";
    int summary_interval_seconds = 30;

    // Status endpoint, disabled when port is 0
    std::string status_host = "0.0.0.0";
    int status_port = 0;
};

class Config {
public:
    static constexpr double kMinTimeoutSeconds = 0.001;
    static constexpr double kMaxTimeoutSeconds = 3600.0;
    static constexpr double kMaxIntervalSeconds = 86400.0;

    std::vector<Target> targets;
    Settings settings;
    std::vector<AlertRule> alerts;

    static Config from_json(const nlohmann::json& j);
    static Config from_file(const std::string& path);
    static Config example();

    // Environment overrides for the ambient settings
    void apply_env_overrides();
    void validate() const;

    nlohmann::json to_json() const;
};
