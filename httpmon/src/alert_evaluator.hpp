
#pragma once

#include "config.hpp"
#include "cooldown_ledger.hpp"
#include "target_health.hpp"
#include "types.hpp"
#include "webhook_dispatcher.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

class AlertEvaluator {
public:
    AlertEvaluator(std::vector<AlertRule> rules, std::shared_ptr<WebhookSink> sink);

    // Evaluates every rule for a fresh check and the aggregate it produced.
    // Returns the names of the rules that dispatched a notification.
    std::vector<std::string> evaluate(const Target& target, const HealthCheck& check,
                                      const TargetHealthSnapshot& health);

    static bool trigger_fires(const AlertTrigger& trigger, const HealthCheck& check,
                              const TargetHealthSnapshot& health);
    static std::optional<AlertTrigger> first_fired(const AlertRule& rule, const HealthCheck& check,
                                                   const TargetHealthSnapshot& health);

    static nlohmann::json build_payload(const AlertRule& rule, const Target& target, const HealthCheck& check);

    CooldownLedger& ledger() { return ledger_; }

private:
    std::vector<AlertRule> rules_;
    std::shared_ptr<WebhookSink> sink_;
    CooldownLedger ledger_;
};
