/// @file tests/tracking/test_live_tracker.cpp
/// @brief Unit Tests — LiveVsBacktestTracker
///
/// Tests cover:
///   - Divergence signs and alert classification
///   - Live data without an expectation
///   - Rolling report averages, trend and recent alerts
///   - Per-version live summary
///   - Persistence across reopen

#include "wfv/live_tracker.hpp"
#include "support/fakes.hpp"

#include <gtest/gtest.h>

using namespace wfv;
using wfv::testing::TempDir;

// ─── Helpers ──────────────────────────────────────────────────────────────────

namespace {

/// Record `n` periods whose Sharpe divergence is `divergence(i)`.
template <typename Fn>
void record_periods(LiveVsBacktestTracker& t, int n, Fn divergence) {
    for (int i = 0; i < n; ++i) {
        ASSERT_TRUE(t.record_live("alpha", 1.5 - divergence(i), 10.0, 5.0,
                                  "2025-01-01", "2025-01-31").has_value());
    }
}

} // anonymous namespace

// ─── Classification ───────────────────────────────────────────────────────────

TEST(LiveTracker_Classify, Thresholds_FollowAlertTable) {
    TempDir dir;
    const LiveVsBacktestTracker t(dir.file("tracker.json"));
    EXPECT_EQ(t.classify(0.1, 5.0, 2.0), AlertLevel::Ok);
    EXPECT_EQ(t.classify(0.6, 5.0, 2.0), AlertLevel::Warning);
    EXPECT_EQ(t.classify(0.1, 25.0, 2.0), AlertLevel::Warning);
    EXPECT_EQ(t.classify(0.1, 5.0, 12.0), AlertLevel::Critical);
    EXPECT_EQ(t.classify(0.9, 30.0, 12.0), AlertLevel::Critical);
    EXPECT_EQ(t.classify(0.5, 20.0, 10.0), AlertLevel::Ok);
}

TEST(LiveTracker_RecordLive, Divergence_UsesLatestExpectation) {
    TempDir dir;
    LiveVsBacktestTracker t(dir.file("tracker.json"));
    ASSERT_TRUE(t.record_expectation("alpha", 0.8, 5.0, 4.0, "2025-01-01T00:00:00"));
    ASSERT_TRUE(t.record_expectation("alpha", 1.5, 12.0, 8.0, "2025-02-01T00:00:00", "v2"));

    const auto r = t.record_live("alpha", 0.7, 2.0, 22.0, "2025-02-01", "2025-02-28");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->expectation_version, "v2");
    EXPECT_NEAR(r->sharpe_divergence, 0.8, 1e-12);
    EXPECT_NEAR(r->return_divergence, 10.0, 1e-12);
    EXPECT_NEAR(r->drawdown_divergence, 14.0, 1e-12);
    EXPECT_EQ(r->alert_level, AlertLevel::Critical);
    ASSERT_EQ(r->alerts.size(), 2u);
    EXPECT_EQ(r->alerts[0], "Sharpe divergence: 0.80");
    EXPECT_EQ(r->alerts[1], "Drawdown divergence: 14.0%");
}

TEST(LiveTracker_RecordLive, NoExpectation_Nullopt) {
    TempDir dir;
    LiveVsBacktestTracker t(dir.file("tracker.json"));
    EXPECT_FALSE(t.record_live("alpha", 1.0, 1.0, 1.0, "2025-01-01", "2025-01-31").has_value());
    EXPECT_TRUE(t.live_records("alpha").empty());
    EXPECT_FALSE(t.divergence_report("alpha").has_value());
}

// ─── Report ───────────────────────────────────────────────────────────────────

TEST(LiveTracker_Report, Averages_LastTenRecords) {
    TempDir dir;
    LiveVsBacktestTracker t(dir.file("tracker.json"));
    ASSERT_TRUE(t.record_expectation("alpha", 1.5, 10.0, 5.0, "2025-01-01T00:00:00"));
    // 2 old records with divergence 5.0, then 10 records with 0.1
    record_periods(t, 12, [](int i) { return i < 2 ? 5.0 : 0.1; });

    const auto report = t.divergence_report("alpha");
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->periods_recorded, 12u);
    EXPECT_NEAR(report->avg_sharpe_divergence, 0.1, 1e-12);
    EXPECT_TRUE(report->recent_alerts.empty());
}

TEST(LiveTracker_Report, FewerThanFive_InsufficientTrend) {
    TempDir dir;
    LiveVsBacktestTracker t(dir.file("tracker.json"));
    ASSERT_TRUE(t.record_expectation("alpha", 1.5, 10.0, 5.0, "2025-01-01T00:00:00"));
    record_periods(t, 4, [](int) { return 0.2; });
    EXPECT_EQ(t.divergence_report("alpha")->trend, Trend::InsufficientData);
}

TEST(LiveTracker_Report, ShrinkingDivergence_Improving) {
    TempDir dir;
    LiveVsBacktestTracker t(dir.file("tracker.json"));
    ASSERT_TRUE(t.record_expectation("alpha", 1.5, 10.0, 5.0, "2025-01-01T00:00:00"));
    record_periods(t, 10, [](int i) { return 1.0 - 0.1 * i; });

    const auto report = t.divergence_report("alpha");
    EXPECT_EQ(report->trend, Trend::Improving);
    // The first records diverge by more than 0.5 Sharpe.
    EXPECT_FALSE(report->recent_alerts.empty());
}

TEST(LiveTracker_Report, GrowingDivergence_Deteriorating) {
    TempDir dir;
    LiveVsBacktestTracker t(dir.file("tracker.json"));
    ASSERT_TRUE(t.record_expectation("alpha", 1.5, 10.0, 5.0, "2025-01-01T00:00:00"));
    record_periods(t, 7, [](int i) { return 0.05 * i; });
    EXPECT_EQ(t.divergence_report("alpha")->trend, Trend::Deteriorating);
}

// ─── Per-Version Summary ──────────────────────────────────────────────────────

TEST(LiveTracker_Summary, PinnedToVersion) {
    TempDir dir;
    LiveVsBacktestTracker t(dir.file("tracker.json"));
    ASSERT_TRUE(t.record_expectation("alpha", 1.0, 8.0, 5.0, "2025-01-01T00:00:00", "v1"));
    ASSERT_TRUE(t.record_live("alpha", 0.9, 7.0, 4.0, "2025-01-01", "2025-01-31"));
    ASSERT_TRUE(t.record_expectation("alpha", 1.6, 12.0, 5.0, "2025-02-01T00:00:00", "v2"));
    ASSERT_TRUE(t.record_live("alpha", 0.4, 2.0, 6.0, "2025-02-01", "2025-02-28"));
    ASSERT_TRUE(t.record_live("alpha", 0.6, 4.0, 9.0, "2025-03-01", "2025-03-31"));

    const auto v2 = t.live_summary("alpha", "v2");
    ASSERT_TRUE(v2.has_value());
    EXPECT_EQ(v2->periods, 2u);
    EXPECT_NEAR(v2->mean_sharpe, 0.5, 1e-12);
    EXPECT_NEAR(v2->mean_return, 3.0, 1e-12);
    EXPECT_DOUBLE_EQ(v2->max_drawdown, 9.0);

    EXPECT_EQ(t.live_summary("alpha", "v1")->periods, 1u);
    EXPECT_FALSE(t.live_summary("alpha", "v3").has_value());
}

// ─── Persistence ──────────────────────────────────────────────────────────────

TEST(LiveTracker_Persistence, Reopen_RecordsSurvive) {
    TempDir dir;
    {
        LiveVsBacktestTracker t(dir.file("tracker.json"));
        ASSERT_TRUE(t.record_expectation("alpha", 1.5, 10.0, 5.0, "2025-01-01T00:00:00", "v1"));
        ASSERT_TRUE(t.record_live("alpha", 0.5, 10.0, 5.0, "2025-01-01", "2025-01-31"));
    }
    const LiveVsBacktestTracker reopened(dir.file("tracker.json"));
    ASSERT_EQ(reopened.expectations("alpha").size(), 1u);
    const auto live = reopened.live_records("alpha");
    ASSERT_EQ(live.size(), 1u);
    EXPECT_EQ(live[0].alert_level, AlertLevel::Warning);
    EXPECT_EQ(live[0].expectation_version, "v1");
    EXPECT_EQ(live[0].alerts.size(), 1u);
}
