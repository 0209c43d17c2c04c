#include <gtest/gtest.h>
#include "../src/target_health.hpp"
#include "test_fakes.hpp"

using namespace std::chrono_literals;

class TargetHealthTest : public ::testing::Test {
protected:
    TargetHealthTest() : health(make_target("api", "https://api.example.test/health")) {}

    void record(bool success, std::chrono::milliseconds elapsed = 100ms) {
        health.update_with_check(make_check("api", success, elapsed));
    }

    TargetHealth health;
};

TEST_F(TargetHealthTest, StartsUnknownWithNoChecks) {
    EXPECT_EQ(health.current_status(), HealthStatus::Unknown);
    EXPECT_EQ(health.total_checks(), 0u);
    EXPECT_DOUBLE_EQ(health.health_score(), 1.0);
    EXPECT_DOUBLE_EQ(health.avg_response_ms(), 0.0);

    auto snap = health.snapshot();
    EXPECT_EQ(snap.current_status, HealthStatus::Unknown);
    EXPECT_FALSE(snap.last_check.has_value());
    EXPECT_FALSE(snap.window_uptime_percentage.has_value());
}

TEST_F(TargetHealthTest, HundredFastSuccessesAreHealthyWithPerfectScore) {
    for (int i = 0; i < 100; ++i) {
        record(true, std::chrono::milliseconds(50 + i * 4));
    }

    EXPECT_EQ(health.current_status(), HealthStatus::Healthy);
    EXPECT_DOUBLE_EQ(health.health_score(), 1.0);
    EXPECT_DOUBLE_EQ(health.uptime_percentage(), 100.0);
    EXPECT_EQ(health.total_checks(), 100u);
}

TEST_F(TargetHealthTest, FourFailuresAfterLongHistoryAreUnhealthy) {
    for (int i = 0; i < 500; ++i) {
        record(true);
    }
    for (int i = 0; i < 4; ++i) {
        record(false);
    }

    EXPECT_EQ(health.consecutive_failures(), 4u);
    EXPECT_EQ(health.current_status(), HealthStatus::Unhealthy);
}

TEST_F(TargetHealthTest, FewerFailuresThanThresholdAreDegraded) {
    record(true);
    record(false);
    EXPECT_EQ(health.current_status(), HealthStatus::Degraded);
    record(false);
    EXPECT_EQ(health.current_status(), HealthStatus::Degraded);
    record(false);
    EXPECT_EQ(health.current_status(), HealthStatus::Unhealthy);
}

TEST_F(TargetHealthTest, ThresholdIsConfigurable) {
    TargetHealth strict(make_target("api"), 1);
    strict.update_with_check(make_check("api", false));
    EXPECT_EQ(strict.current_status(), HealthStatus::Unhealthy);
}

TEST_F(TargetHealthTest, SuccessResetsConsecutiveFailures) {
    record(false);
    record(false);
    record(true);
    EXPECT_EQ(health.consecutive_failures(), 0u);
    EXPECT_EQ(health.successful_checks(), 1u);
    EXPECT_EQ(health.total_checks(), 3u);
}

TEST_F(TargetHealthTest, UptimeIsExactRatio) {
    for (int i = 0; i < 7; ++i) {
        record(i % 3 != 0);
    }
    // successes at i = 1, 2, 4, 5
    EXPECT_DOUBLE_EQ(health.uptime_percentage(), 100.0 * 4 / 7);
}

TEST_F(TargetHealthTest, ClassificationUsesUptimeWhenLastCheckSucceeded) {
    // 96 of 100: degraded band
    for (int i = 0; i < 4; ++i) {
        record(false);
    }
    for (int i = 0; i < 96; ++i) {
        record(true);
    }
    EXPECT_EQ(health.current_status(), HealthStatus::Degraded);

    TargetHealth poor(make_target("api"));
    for (int i = 0; i < 10; ++i) {
        poor.update_with_check(make_check("api", i >= 5));
    }
    EXPECT_EQ(poor.current_status(), HealthStatus::Unhealthy);
}

TEST_F(TargetHealthTest, AverageIsExactMeanWithoutDrift) {
    record(true, 1ms);
    record(true, 2ms);
    EXPECT_DOUBLE_EQ(health.avg_response_ms(), 1.5);

    TargetHealth long_run(make_target("api"));
    for (int i = 0; i < 10000; ++i) {
        long_run.update_with_check(make_check("api", true, std::chrono::milliseconds(i % 2 == 0 ? 100 : 101)));
    }
    EXPECT_DOUBLE_EQ(long_run.avg_response_ms(), 100.5);
}

TEST_F(TargetHealthTest, MinAndMaxTrackExtremes) {
    record(true, 300ms);
    record(true, 20ms);
    record(false, 900ms);

    EXPECT_EQ(health.min_response_time(), 20ms);
    EXPECT_EQ(health.max_response_time(), 900ms);
}

TEST_F(TargetHealthTest, HistoryKeepsMostRecentHundred) {
    auto base = std::chrono::system_clock::now();
    for (int i = 0; i < 150; ++i) {
        health.update_with_check(make_check("api", true, std::chrono::milliseconds(i), base + std::chrono::seconds(i)));
    }

    const auto& history = health.recent_checks();
    ASSERT_EQ(history.size(), TargetHealth::kHistoryCapacity);
    EXPECT_EQ(history.front().response_time, 50ms);
    EXPECT_EQ(history.back().response_time, 149ms);
    EXPECT_EQ(health.total_checks(), 150u);
}

TEST_F(TargetHealthTest, ScoreFollowsResponseTimeTiers) {
    EXPECT_DOUBLE_EQ(TargetHealth::response_time_score(500.0), 1.0);
    EXPECT_DOUBLE_EQ(TargetHealth::response_time_score(500.5), 0.8);
    EXPECT_DOUBLE_EQ(TargetHealth::response_time_score(2000.0), 0.8);
    EXPECT_DOUBLE_EQ(TargetHealth::response_time_score(5000.0), 0.5);
    EXPECT_DOUBLE_EQ(TargetHealth::response_time_score(5001.0), 0.2);
}

TEST_F(TargetHealthTest, ScoreCombinesUptimeAndLatency) {
    record(true, 3000ms);
    record(false, 3000ms);

    // 0.5 uptime * 0.7 + 0.5 tier * 0.3
    EXPECT_NEAR(health.health_score(), 0.5, 1e-9);
}

TEST_F(TargetHealthTest, SnapshotReportsWindowUptime) {
    TargetHealth windowed(make_target("api"), 3, std::chrono::minutes(10));
    auto now = std::chrono::system_clock::now();

    windowed.update_with_check(make_check("api", false, 100ms, now - std::chrono::minutes(30)));
    windowed.update_with_check(make_check("api", false, 100ms, now - std::chrono::minutes(20)));
    windowed.update_with_check(make_check("api", true, 100ms, now - std::chrono::minutes(5)));
    windowed.update_with_check(make_check("api", false, 100ms, now - std::chrono::minutes(1)));

    auto snap = windowed.snapshot(now);
    ASSERT_TRUE(snap.window_uptime_percentage.has_value());
    EXPECT_DOUBLE_EQ(*snap.window_uptime_percentage, 50.0);
    EXPECT_DOUBLE_EQ(snap.uptime_percentage, 25.0);
}

TEST_F(TargetHealthTest, SnapshotJsonCarriesAggregate) {
    record(true, 120ms);
    auto j = health.snapshot().to_json();

    EXPECT_EQ(j["name"], "api");
    EXPECT_EQ(j["status"], "healthy");
    EXPECT_EQ(j["total_checks"], 1);
    EXPECT_DOUBLE_EQ(j["avg_response_ms"].get<double>(), 120.0);
    EXPECT_TRUE(j["last_check"].is_string());
}
