#include "cooldown_ledger.hpp"

bool CooldownLedger::try_acquire(const std::string& rule, const std::string& target,
                                 std::chrono::seconds cooldown, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);

    Key key{rule, target};
    auto it = last_sent_.find(key);
    if (it != last_sent_.end() && now - it->second < cooldown) {
        return false;
    }

    last_sent_[key] = now;
    return true;
}

std::optional<CooldownLedger::Clock::time_point> CooldownLedger::last_dispatch(const std::string& rule,
                                                                               const std::string& target) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = last_sent_.find(Key{rule, target});
    if (it == last_sent_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void CooldownLedger::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    last_sent_.clear();
}
