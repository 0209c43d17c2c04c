
#include "config.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>
#include <set>
#include <stdexcept>

namespace {

const std::set<std::string> kSupportedMethods = {
    "GET", "POST", "PUT", "DELETE", "HEAD", "OPTIONS", "PATCH"
};

const std::set<std::string> kLogLevels = {
    "trace", "debug", "info", "warn", "error", "critical", "off"
};

Settings parse_settings(const nlohmann::json& j) {
    Settings settings;
    if (!j.is_object()) {
        return settings;
    }

    settings.default_interval = j.value("default_interval", settings.default_interval);
    settings.default_timeout = j.value("default_timeout", settings.default_timeout);
    settings.max_consecutive_failures = j.value("max_consecutive_failures", settings.max_consecutive_failures);
    settings.health_check_window_minutes = j.value("health_check_window_minutes", settings.health_check_window_minutes);
    settings.output_format = output_format_from_string(j.value("output_format", std::string("pretty")));
    settings.enable_colors = j.value("enable_colors", settings.enable_colors);
    if (j.contains("log_file") && j["log_file"].is_string()) {
        settings.log_file = j["log_file"].get<std::string>();
    }
    settings.log_level = j.value("log_level", settings.log_level);
    settings.summary_interval_seconds = j.value("summary_interval_seconds", settings.summary_interval_seconds);
    settings.status_host = j.value("status_host", settings.status_host);
    settings.status_port = j.value("status_port", settings.status_port);
    return settings;
}

Target parse_target(const nlohmann::json& j, const Settings& settings) {
    Target target;
    target.name = j.at("name").get<std::string>();
    target.url = j.at("url").get<std::string>();
    target.method = util::to_upper(j.value("method", std::string("GET")));
    if (j.contains("headers")) {
        target.headers = j["headers"].get<std::map<std::string, std::string>>();
    }
    if (j.contains("expected_status")) {
        target.expected_status = j["expected_status"].get<std::vector<int>>();
    }
    if (j.contains("expected_content") && j["expected_content"].is_string()) {
        target.expected_content = j["expected_content"].get<std::string>();
    }
    target.timeout_seconds = j.value("timeout_seconds", settings.default_timeout);
    target.interval_seconds = j.value("interval_seconds", settings.default_interval);
    return target;
}

AlertTrigger parse_trigger(const nlohmann::json& j) {
    if (!j.is_object() || j.size() != 1) {
        throw std::runtime_error("Alert trigger must be an object with exactly one key: " + j.dump());
    }

    auto it = j.begin();
    const std::string key = it.key();
    const auto& value = it.value();
    if (key == "consecutive_failures") {
        return AlertTrigger::consecutive_failures(value.get<uint32_t>());
    }
    if (key == "response_time_ms") {
        return AlertTrigger::response_time_ms(value.get<uint64_t>());
    }
    if (key == "health_score_below") {
        return AlertTrigger::health_score_below(value.get<double>());
    }
    if (key == "cert_expiring_days") {
        return AlertTrigger::cert_expiring_days(value.get<uint32_t>());
    }
    throw std::runtime_error("Unknown alert trigger: " + key);
}

AlertRule parse_alert(const nlohmann::json& j) {
    AlertRule rule;
    rule.name = j.at("name").get<std::string>();
    rule.webhook_url = j.at("webhook_url").get<std::string>();
    for (const auto& trigger : j.at("trigger_on")) {
        rule.trigger_on.push_back(parse_trigger(trigger));
    }
    rule.cooldown_minutes = j.value("cooldown_minutes", rule.cooldown_minutes);
    return rule;
}

nlohmann::json trigger_to_json(const AlertTrigger& trigger) {
    switch (trigger.kind) {
        case TriggerKind::ConsecutiveFailures:
            return {{"consecutive_failures", static_cast<uint32_t>(trigger.threshold)}};
        case TriggerKind::ResponseTimeMs:
            return {{"response_time_ms", static_cast<uint64_t>(trigger.threshold)}};
        case TriggerKind::HealthScoreBelow:
            return {{"health_score_below", trigger.threshold}};
        case TriggerKind::CertExpiringDays:
            return {{"cert_expiring_days", static_cast<uint32_t>(trigger.threshold)}};
    }
    return {};
}

} // namespace

std::string output_format_to_string(OutputFormat format) {
    switch (format) {
        case OutputFormat::Pretty: return "pretty";
        case OutputFormat::Json: return "json";
        case OutputFormat::Csv: return "csv";
        case OutputFormat::Prometheus: return "prometheus";
    }
    return "pretty";
}

OutputFormat output_format_from_string(const std::string& name) {
    auto lower = util::to_lower(name);
    if (lower == "pretty") return OutputFormat::Pretty;
    if (lower == "json") return OutputFormat::Json;
    if (lower == "csv") return OutputFormat::Csv;
    if (lower == "prometheus") return OutputFormat::Prometheus;
    throw std::runtime_error("Unknown output format: " + name);
}

bool Target::is_https() const {
    return util::starts_with(util::to_lower(url), "https://");
}

AlertTrigger AlertTrigger::consecutive_failures(uint32_t n) {
    return {TriggerKind::ConsecutiveFailures, static_cast<double>(n)};
}

AlertTrigger AlertTrigger::response_time_ms(uint64_t ms) {
    return {TriggerKind::ResponseTimeMs, static_cast<double>(ms)};
}

AlertTrigger AlertTrigger::health_score_below(double score) {
    return {TriggerKind::HealthScoreBelow, score};
}

AlertTrigger AlertTrigger::cert_expiring_days(uint32_t days) {
    return {TriggerKind::CertExpiringDays, static_cast<double>(days)};
}

std::string AlertTrigger::describe() const {
    switch (kind) {
        case TriggerKind::ConsecutiveFailures:
            return fmt::format("consecutive failures >= {}", static_cast<uint32_t>(threshold));
        case TriggerKind::ResponseTimeMs:
            return fmt::format("response time > {}ms", static_cast<uint64_t>(threshold));
        case TriggerKind::HealthScoreBelow:
            return fmt::format("health score < {:.2f}", threshold);
        case TriggerKind::CertExpiringDays:
            return fmt::format("certificate expires within {} days", static_cast<uint32_t>(threshold));
    }
    return "unknown trigger";
}

Config Config::from_json(const nlohmann::json& j) {
    Config config;
    config.settings = parse_settings(j.value("settings", nlohmann::json::object()));

    for (const auto& target : j.at("targets")) {
        config.targets.push_back(parse_target(target, config.settings));
    }

    if (j.contains("alerts")) {
        for (const auto& alert : j["alerts"]) {
            config.alerts.push_back(parse_alert(alert));
        }
    }

    return config;
}

Config Config::from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open configuration file: " + path);
    }

    try {
        auto j = nlohmann::json::parse(file);
        return from_json(j);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(fmt::format("Invalid configuration file {}: {}", path, e.what()));
    }
}

Config Config::example() {
    Config config;

    Target api;
    api.name = "Production API";
    api.url = "https://api.example.com/health";
    api.expected_status = {200};
    api.expected_content = "\"status\":\"ok\"";
    api.timeout_seconds = 5.0;
    api.interval_seconds = 30.0;
    config.targets.push_back(api);

    Target website;
    website.name = "Main Website";
    website.url = "https://example.com";
    website.expected_status = {200, 301, 302};
    website.timeout_seconds = 10.0;
    website.interval_seconds = 60.0;
    config.targets.push_back(website);

    AlertRule slack;
    slack.name = "Slack Alerts";
    slack.webhook_url = "https://hooks.slack.com/services/YOUR/WEBHOOK/URL";
    slack.trigger_on = {
        AlertTrigger::consecutive_failures(3),
        AlertTrigger::response_time_ms(5000),
        AlertTrigger::cert_expiring_days(7)
    };
    slack.cooldown_minutes = 30;
    config.alerts.push_back(slack);

    return config;
}

void Config::apply_env_overrides() {
    settings.log_level = util::get_env_var("LOG_LEVEL", settings.log_level);

    auto log_file = util::get_env_var("HTTPMON_LOG_FILE");
    if (!log_file.empty()) {
        settings.log_file = log_file;
    }

    auto status_port = util::get_env_var("HTTPMON_STATUS_PORT");
    if (!status_port.empty()) {
        try {
            settings.status_port = std::stoi(status_port);
        } catch (const std::exception&) {
            throw std::runtime_error("HTTPMON_STATUS_PORT is not a number: " + status_port);
        }
    }
}

void Config::validate() const {
    if (targets.empty()) {
        throw std::runtime_error("At least one target is required");
    }

    std::set<std::string> names;
    for (const auto& target : targets) {
        if (target.name.empty()) {
            throw std::runtime_error("Target name must not be empty");
        }
        if (!names.insert(target.name).second) {
            throw std::runtime_error("Duplicate target name: " + target.name);
        }

        auto url = util::to_lower(target.url);
        if (!util::starts_with(url, "http://") && !util::starts_with(url, "https://")) {
            throw std::runtime_error(fmt::format("Target '{}' has an invalid URL: {}", target.name, target.url));
        }
        if (kSupportedMethods.count(target.method) == 0) {
            throw std::runtime_error(fmt::format("Target '{}' uses unsupported method {}", target.name, target.method));
        }
        if (!(target.timeout_seconds >= kMinTimeoutSeconds && target.timeout_seconds <= kMaxTimeoutSeconds)) {
            throw std::runtime_error(fmt::format("Target '{}' timeout must be between {}s and {}s",
                                                 target.name, kMinTimeoutSeconds, kMaxTimeoutSeconds));
        }
        if (!(target.interval_seconds > 0.0 && target.interval_seconds <= kMaxIntervalSeconds)) {
            throw std::runtime_error(fmt::format("Target '{}' interval must be positive and at most {}s",
                                                 target.name, kMaxIntervalSeconds));
        }
    }

    for (const auto& alert : alerts) {
        if (alert.name.empty()) {
            throw std::runtime_error("Alert name must not be empty");
        }
        if (alert.webhook_url.empty()) {
            throw std::runtime_error(fmt::format("Alert '{}' has no webhook_url", alert.name));
        }
        if (alert.trigger_on.empty()) {
            throw std::runtime_error(fmt::format("Alert '{}' has no triggers", alert.name));
        }
    }

    if (settings.max_consecutive_failures < 1) {
        throw std::runtime_error("max_consecutive_failures must be at least 1");
    }
    if (settings.summary_interval_seconds < 1) {
        throw std::runtime_error("summary_interval_seconds must be at least 1");
    }
    if (settings.status_port < 0 || settings.status_port > 65535) {
        throw std::runtime_error("status_port must be between 0 and 65535");
    }
    if (kLogLevels.count(util::to_lower(settings.log_level)) == 0) {
        throw std::runtime_error("Unknown log level: " + settings.log_level);
    }

    spdlog::debug("Configuration validated: {} targets, {} alert rules", targets.size(), alerts.size());
}

nlohmann::json Config::to_json() const {
    nlohmann::json j;

    j["targets"] = nlohmann::json::array();
    for (const auto& target : targets) {
        nlohmann::json t = {
            {"name", target.name},
            {"url", target.url},
            {"method", target.method},
            {"headers", target.headers},
            {"expected_status", target.expected_status},
            {"timeout_seconds", target.timeout_seconds},
            {"interval_seconds", target.interval_seconds}
        };
        t["expected_content"] = target.expected_content ? nlohmann::json(*target.expected_content) : nlohmann::json(nullptr);
        j["targets"].push_back(t);
    }

    j["settings"] = {
        {"default_interval", settings.default_interval},
        {"default_timeout", settings.default_timeout},
        {"max_consecutive_failures", settings.max_consecutive_failures},
        {"health_check_window_minutes", settings.health_check_window_minutes},
        {"output_format", output_format_to_string(settings.output_format)},
        {"enable_colors", settings.enable_colors},
        {"log_level", settings.log_level},
        {"summary_interval_seconds", settings.summary_interval_seconds},
        {"status_host", settings.status_host},
        {"status_port", settings.status_port}
    };
    j["settings"]["log_file"] = settings.log_file ? nlohmann::json(*settings.log_file) : nlohmann::json(nullptr);

    j["alerts"] = nlohmann::json::array();
    for (const auto& alert : alerts) {
        nlohmann::json triggers = nlohmann::json::array();
        for (const auto& trigger : alert.trigger_on) {
            triggers.push_back(trigger_to_json(trigger));
        }
        j["alerts"].push_back({
            {"name", alert.name},
            {"webhook_url", alert.webhook_url},
            {"trigger_on", triggers},
            {"cooldown_minutes", alert.cooldown_minutes}
        });
    }

    return j;
}
