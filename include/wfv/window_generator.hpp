#pragma once

/// @file include/wfv/window_generator.hpp
/// @brief Walk-forward train/test window generation.
///
/// # Module: WindowGenerator
///
/// ## Responsibility
/// Turn (train length, test length, step, embargo) and a calendar range into
/// an ordered sequence of train/test window pairs:
///
///     train = [s, s + train_days]
///     test  = [train_end + embargo, test_start + test_days]
///     s    += step_days      while test_end ≤ range.end
///
/// ## Guarantees
/// - Windows are emitted in ascending chronological order
/// - Train and test ranges never overlap for embargo ≥ 0
/// - A range shorter than train + embargo + test yields zero windows; this is
///   insufficient data, not an error
/// - Pure: no I/O, no logging, never throws on valid dates

#include "wfv/types.hpp"
#include "wfv/constants.hpp"

#include <vector>

namespace wfv {

// ─── Embargo ──────────────────────────────────────────────────────────────────

/// Gap between the end of training and the start of testing.
///
/// Either a fixed number of days or a percentage of the total span.
class Embargo {
public:
    /// No gap.
    Embargo() = default;

    [[nodiscard]] static Embargo fixed(int days) noexcept;
    [[nodiscard]] static Embargo percent(double pct) noexcept;

    /// Resolve to whole days for a range spanning `total_span_days`.
    /// Negative or non-finite settings resolve to 0.
    [[nodiscard]] int resolve(long total_span_days) const noexcept;

    [[nodiscard]] bool is_percent() const noexcept { return is_percent_; }
    [[nodiscard]] double value() const noexcept { return value_; }

private:
    Embargo(bool is_percent, double value) noexcept
        : is_percent_(is_percent), value_(value) {}

    bool   is_percent_ = false;
    double value_      = 0.0;
};

// ─── WindowSpec ───────────────────────────────────────────────────────────────

/// Shape of the rolling walk-forward windows, in calendar days.
struct WindowSpec {
    int     train_days = constants::DEFAULT_TRAIN_DAYS;
    int     test_days  = constants::DEFAULT_TEST_DAYS;
    int     step_days  = constants::DEFAULT_STEP_DAYS;
    Embargo embargo{};
};

/// Date boundaries of one train/test fold.
struct WindowBounds {
    int       window_id = 0;  ///< 1-based ordinal
    DateRange train;
    DateRange test;
};

/// Generate the walk-forward windows covering `range`.
///
/// # Returns
/// Windows in ascending order of `train.start`.  Empty if the range is too
/// short or any of train/test/step is non-positive.
[[nodiscard]] std::vector<WindowBounds>
generate_windows(const WindowSpec& spec, const DateRange& range);

}  // namespace wfv
