
#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

// Last dispatch time per (rule, target). Check and record happen under one
// lock so two loops cannot both pass the same cooldown.
class CooldownLedger {
public:
    using Clock = std::chrono::system_clock;

    // Returns true and records `now` when the key is outside its cooldown
    bool try_acquire(const std::string& rule, const std::string& target,
                     std::chrono::seconds cooldown, Clock::time_point now);

    std::optional<Clock::time_point> last_dispatch(const std::string& rule, const std::string& target);

    void clear();

private:
    using Key = std::pair<std::string, std::string>;

    std::map<Key, Clock::time_point> last_sent_;
    std::mutex mutex_;
};
