/// @file tests/window/test_window_generator.cpp
/// @brief Unit Tests — generate_windows and Embargo
///
/// Tests cover:
///   - Window count and exact boundaries for a simple range
///   - Ascending order and train/test separation
///   - Fixed and percentage embargo
///   - Ranges too short for a single window
///   - Non-positive window parameters

#include "wfv/window_generator.hpp"
#include "support/fakes.hpp"

#include <gtest/gtest.h>

using namespace wfv;
using wfv::testing::date;

// ─── Helpers ──────────────────────────────────────────────────────────────────

namespace {

WindowSpec spec(int train, int test, int step, Embargo embargo = Embargo{}) {
    return WindowSpec{
        .train_days = train,
        .test_days  = test,
        .step_days  = step,
        .embargo    = embargo,
    };
}

} // anonymous namespace

// ─── Boundaries ───────────────────────────────────────────────────────────────

TEST(WindowGenerator_Generate, FirstWindow_BoundariesFollowLengths) {
    const auto w = generate_windows(spec(100, 20, 20),
                                    DateRange{date("2024-01-01"), date("2024-12-31")});
    ASSERT_FALSE(w.empty());
    EXPECT_EQ(w[0].window_id, 1);
    EXPECT_EQ(w[0].train.start, date("2024-01-01"));
    EXPECT_EQ(w[0].train.end, date("2024-04-10"));
    EXPECT_EQ(w[0].test.start, date("2024-04-10"));
    EXPECT_EQ(w[0].test.end, date("2024-04-30"));
}

TEST(WindowGenerator_Generate, Count_MatchesRollingFormula) {
    // span 365: starts at 0, 20, ... while s + 120 <= 365 → s ≤ 245 → 13 windows
    const auto w = generate_windows(spec(100, 20, 20),
                                    DateRange{date("2023-01-01"), date("2024-01-01")});
    EXPECT_EQ(w.size(), 13u);
    EXPECT_LE(w.back().test.end, date("2024-01-01"));
}

TEST(WindowGenerator_Generate, Windows_OrderedWithSequentialIds) {
    const auto w = generate_windows(spec(60, 15, 10),
                                    DateRange{date("2022-01-01"), date("2023-06-30")});
    ASSERT_GT(w.size(), 2u);
    for (std::size_t i = 0; i < w.size(); ++i) {
        EXPECT_EQ(w[i].window_id, static_cast<int>(i) + 1);
        EXPECT_LE(w[i].train.end, w[i].test.start);
        EXPECT_LT(w[i].test.start, w[i].test.end);
        if (i > 0) {
            EXPECT_LT(w[i - 1].train.start, w[i].train.start);
        }
    }
}

// ─── Embargo ──────────────────────────────────────────────────────────────────

TEST(WindowGenerator_Embargo, FixedDays_SeparatesTrainAndTest) {
    const auto w = generate_windows(spec(100, 20, 30, Embargo::fixed(5)),
                                    DateRange{date("2024-01-01"), date("2024-12-31")});
    ASSERT_FALSE(w.empty());
    for (const auto& b : w) {
        EXPECT_EQ((b.test.start - b.train.end).days(), 5);
    }
}

TEST(WindowGenerator_Embargo, Percent_ResolvesAgainstSpan) {
    EXPECT_EQ(Embargo::percent(1.0).resolve(365), 3);
    EXPECT_EQ(Embargo::percent(0.0).resolve(365), 0);
    EXPECT_EQ(Embargo::fixed(-4).resolve(365), 0);
    EXPECT_EQ(Embargo::percent(2.0).resolve(0), 0);
}

TEST(WindowGenerator_Embargo, ConsumesRemainingRoom_NoWindows) {
    // 120 days of train + test fit, 121 with a one-day embargo do not.
    const DateRange range{date("2024-01-01"), date("2024-04-30")};
    EXPECT_EQ(generate_windows(spec(100, 20, 20), range).size(), 1u);
    EXPECT_TRUE(generate_windows(spec(100, 20, 20, Embargo::fixed(1)), range).empty());
}

// ─── Degenerate Input ─────────────────────────────────────────────────────────

TEST(WindowGenerator_Generate, ShortRange_Empty) {
    EXPECT_TRUE(generate_windows(spec(252, 63, 21),
                                 DateRange{date("2024-01-01"), date("2024-06-30")}).empty());
}

TEST(WindowGenerator_Generate, NonPositiveLengths_Empty) {
    const DateRange range{date("2020-01-01"), date("2024-01-01")};
    EXPECT_TRUE(generate_windows(spec(0, 63, 21), range).empty());
    EXPECT_TRUE(generate_windows(spec(252, -1, 21), range).empty());
    EXPECT_TRUE(generate_windows(spec(252, 63, 0), range).empty());
}

TEST(WindowGenerator_Generate, ReversedRange_Empty) {
    EXPECT_TRUE(generate_windows(spec(10, 5, 5),
                                 DateRange{date("2024-06-01"), date("2024-01-01")}).empty());
}
