#include <gtest/gtest.h>
#include "../src/cooldown_ledger.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

TEST(CooldownLedgerTest, FirstDispatchAlwaysAllowed) {
    CooldownLedger ledger;
    auto now = CooldownLedger::Clock::now();

    EXPECT_TRUE(ledger.try_acquire("rule", "api", 30min, now));
    ASSERT_TRUE(ledger.last_dispatch("rule", "api").has_value());
    EXPECT_EQ(*ledger.last_dispatch("rule", "api"), now);
}

TEST(CooldownLedgerTest, SuppressedInsideWindowAllowedAtBoundary) {
    CooldownLedger ledger;
    auto now = CooldownLedger::Clock::now();

    ASSERT_TRUE(ledger.try_acquire("rule", "api", 30min, now));
    EXPECT_FALSE(ledger.try_acquire("rule", "api", 30min, now + 29min));
    EXPECT_TRUE(ledger.try_acquire("rule", "api", 30min, now + 30min));
}

TEST(CooldownLedgerTest, SuppressedAttemptDoesNotExtendWindow) {
    CooldownLedger ledger;
    auto now = CooldownLedger::Clock::now();

    ASSERT_TRUE(ledger.try_acquire("rule", "api", 10min, now));
    ASSERT_FALSE(ledger.try_acquire("rule", "api", 10min, now + 9min));
    EXPECT_EQ(*ledger.last_dispatch("rule", "api"), now);
    EXPECT_TRUE(ledger.try_acquire("rule", "api", 10min, now + 11min));
}

TEST(CooldownLedgerTest, KeysAreIndependent) {
    CooldownLedger ledger;
    auto now = CooldownLedger::Clock::now();

    EXPECT_TRUE(ledger.try_acquire("rule", "api", 30min, now));
    EXPECT_TRUE(ledger.try_acquire("rule", "web", 30min, now));
    EXPECT_TRUE(ledger.try_acquire("other", "api", 30min, now));
    EXPECT_FALSE(ledger.last_dispatch("other", "web").has_value());
}

TEST(CooldownLedgerTest, ClearForgetsDispatches) {
    CooldownLedger ledger;
    auto now = CooldownLedger::Clock::now();

    ledger.try_acquire("rule", "api", 30min, now);
    ledger.clear();
    EXPECT_TRUE(ledger.try_acquire("rule", "api", 30min, now + 1s));
}

TEST(CooldownLedgerTest, ConcurrentCallersGetOneDispatch) {
    CooldownLedger ledger;
    auto now = CooldownLedger::Clock::now();
    std::atomic<int> granted{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([&]() {
            if (ledger.try_acquire("rule", "api", 30min, now)) {
                granted++;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(granted.load(), 1);
}
