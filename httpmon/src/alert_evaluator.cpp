
#include "alert_evaluator.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>

AlertEvaluator::AlertEvaluator(std::vector<AlertRule> rules, std::shared_ptr<WebhookSink> sink)
    : rules_(std::move(rules)), sink_(std::move(sink)) {
}

bool AlertEvaluator::trigger_fires(const AlertTrigger& trigger, const HealthCheck& check,
                                   const TargetHealthSnapshot& health) {
    switch (trigger.kind) {
        case TriggerKind::ResponseTimeMs:
            return check.response_time.count() > static_cast<int64_t>(trigger.threshold);
        case TriggerKind::CertExpiringDays:
            return check.cert_expires_days.has_value() &&
                   *check.cert_expires_days <= static_cast<uint32_t>(trigger.threshold);
        case TriggerKind::ConsecutiveFailures:
            return health.consecutive_failures >= static_cast<uint32_t>(trigger.threshold);
        case TriggerKind::HealthScoreBelow:
            return health.total_checks > 0 && health.health_score < trigger.threshold;
    }
    return false;
}

std::optional<AlertTrigger> AlertEvaluator::first_fired(const AlertRule& rule, const HealthCheck& check,
                                                        const TargetHealthSnapshot& health) {
    for (const auto& trigger : rule.trigger_on) {
        if (trigger_fires(trigger, check, health)) {
            return trigger;
        }
    }
    return std::nullopt;
}

std::vector<std::string> AlertEvaluator::evaluate(const Target& target, const HealthCheck& check,
                                                  const TargetHealthSnapshot& health) {
    std::vector<std::string> dispatched;

    for (const auto& rule : rules_) {
        auto fired = first_fired(rule, check, health);
        if (!fired) {
            continue;
        }

        auto cooldown = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::minutes(rule.cooldown_minutes));
        if (!ledger_.try_acquire(rule.name, target.name, cooldown, check.timestamp)) {
            spdlog::debug("Alert '{}' for {} suppressed by cooldown ({})", rule.name, target.name, fired->describe());
            continue;
        }

        spdlog::info("Alert '{}' fired for {}: {}", rule.name, target.name, fired->describe());
        if (sink_) {
            sink_->dispatch(rule.webhook_url, build_payload(rule, target, check));
        }
        dispatched.push_back(rule.name);
    }

    return dispatched;
}

nlohmann::json AlertEvaluator::build_payload(const AlertRule& rule, const Target& target, const HealthCheck& check) {
    std::string status = check.status_code ? std::to_string(*check.status_code) : "Error";

    return {
        {"text", fmt::format("🚨 Alert: {} - {}", rule.name, target.name)},
        {"attachments", nlohmann::json::array({
            {
                {"color", "danger"},
                {"fields", nlohmann::json::array({
                    {{"title", "Target"}, {"value", target.name}, {"short", true}},
                    {{"title", "URL"}, {"value", target.url}, {"short", true}},
                    {{"title", "Status"}, {"value", status}, {"short", true}},
                    {{"title", "Response Time"}, {"value", fmt::format("{}ms", check.response_time.count())}, {"short", true}},
                    {{"title", "Error"}, {"value", check.error.value_or("N/A")}, {"short", false}}
                })}
            }
        })}
    };
}
