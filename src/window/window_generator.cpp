/// @file src/window/window_generator.cpp
/// @brief Rolling train/test window generation.

#include "wfv/window_generator.hpp"

#include <cmath>

namespace wfv {

// ─── Embargo ──────────────────────────────────────────────────────────────────

Embargo Embargo::fixed(int days) noexcept {
    return Embargo(false, static_cast<double>(days));
}

Embargo Embargo::percent(double pct) noexcept {
    return Embargo(true, pct);
}

int Embargo::resolve(long total_span_days) const noexcept {
    if (!std::isfinite(value_) || value_ <= 0.0) return 0;
    if (!is_percent_) return static_cast<int>(value_);
    if (total_span_days <= 0) return 0;

    // T_embargo = ⌊pct/100 · span⌋
    return static_cast<int>(
        std::floor(static_cast<double>(total_span_days) * value_ / 100.0));
}

// ─── generate_windows ─────────────────────────────────────────────────────────

std::vector<WindowBounds>
generate_windows(const WindowSpec& spec, const DateRange& range) {
    std::vector<WindowBounds> windows;

    if (spec.train_days <= 0 || spec.test_days <= 0 || spec.step_days <= 0) {
        return windows;
    }
    if (range.start.is_special() || range.end.is_special() || range.end < range.start) {
        return windows;
    }

    const long span    = range.span_days();
    const int  embargo = spec.embargo.resolve(span);
    if (span < static_cast<long>(spec.train_days) + embargo + spec.test_days) {
        return windows;
    }

    const boost::gregorian::date_duration train_len(spec.train_days);
    const boost::gregorian::date_duration test_len(spec.test_days);
    const boost::gregorian::date_duration gap(embargo);
    const boost::gregorian::date_duration step(spec.step_days);

    int id = 0;
    for (auto train_start = range.start;; train_start += step) {
        const auto train_end  = train_start + train_len;
        const auto test_start = train_end + gap;
        const auto test_end   = test_start + test_len;
        if (test_end > range.end) break;

        windows.push_back(WindowBounds{
            .window_id = ++id,
            .train     = DateRange{train_start, train_end},
            .test      = DateRange{test_start, test_end},
        });
    }
    return windows;
}

}  // namespace wfv
