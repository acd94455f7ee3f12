/// @file src/validation/walk_forward_validator.cpp
/// @brief WalkForwardValidator: per-window evaluation, aggregation, verdict.

#include "wfv/validator.hpp"
#include "wfv/logging.hpp"

#include "statistics.hpp"

#include <fmt/format.h>

#include <exception>
#include <utility>

namespace wfv {

namespace {

/// Extract one metric from every window into a contiguous series.
template <typename Fn>
[[nodiscard]] std::vector<double>
collect(std::span<const WalkForwardWindow> windows, Fn&& metric) {
    std::vector<double> out;
    out.reserve(windows.size());
    for (const auto& w : windows) {
        out.push_back(metric(w));
    }
    return out;
}

/// Append PASS/FAIL for one threshold check and return whether it passed.
bool check(std::vector<std::string>& messages,
           bool ok,
           std::string pass_text,
           std::string fail_text) {
    messages.push_back(ok ? "PASS: " + std::move(pass_text)
                          : "FAIL: " + std::move(fail_text));
    return ok;
}

}  // namespace

// ─── Construction ─────────────────────────────────────────────────────────────

WalkForwardValidator::WalkForwardValidator(ValidatorConfig config,
                                           BacktestRunner& runner,
                                           const RegimeClassifier& classifier)
    : config_(std::move(config))
    , runner_(runner)
    , classifier_(classifier)
{}

// ─── evaluate ─────────────────────────────────────────────────────────────────

BacktestMatrixResults
WalkForwardValidator::evaluate(const std::string& strategy_id,
                               const ParameterSet& params,
                               const dates::Date& start,
                               const dates::Date& end,
                               double capital,
                               const dates::Timestamp& now) const {
    BacktestMatrixResults results;
    results.strategy_id     = strategy_id;
    results.evaluation_date = dates::format_timestamp(now);

    const auto bounds = generate_windows(config_.windows, DateRange{start, end});
    results.windows_generated = bounds.size();

    logger()->info("Walk-forward evaluation of {}: {} to {}, {} windows",
                   strategy_id, dates::format_date(start), dates::format_date(end),
                   bounds.size());

    if (bounds.size() < config_.min_windows) {
        results.insufficient_data = true;
        results.passed            = false;
        results.validation_messages.push_back(fmt::format(
            "FAIL: insufficient windows ({} generated, need at least {})",
            bounds.size(), config_.min_windows));
        return results;
    }

    results.windows.reserve(bounds.size());
    for (const auto& b : bounds) {
        auto window = evaluate_window(strategy_id, params, b, capital);
        if (window) {
            results.windows.push_back(std::move(*window));
        }
    }

    aggregate(results, config_);
    return results;
}

std::optional<WalkForwardWindow>
WalkForwardValidator::evaluate_window(const std::string& strategy_id,
                                      const ParameterSet& params,
                                      const WindowBounds& b,
                                      double capital) const {
    const std::string train_start = dates::format_date(b.train.start);
    const std::string train_end   = dates::format_date(b.train.end);
    const std::string test_start  = dates::format_date(b.test.start);
    const std::string test_end    = dates::format_date(b.test.end);

    std::optional<PerformanceRecord> is;
    std::optional<PerformanceRecord> oos;
    try {
        is  = runner_.run(strategy_id, params, train_start, train_end, capital);
        if (is) {
            oos = runner_.run(strategy_id, params, test_start, test_end, capital);
        }
    } catch (const std::exception& ex) {
        logger()->warn("Window {} ({} to {} / {} to {}) evaluation failed: {}",
                       b.window_id, train_start, train_end, test_start, test_end,
                       ex.what());
        return std::nullopt;
    }

    if (!is || !oos) {
        logger()->warn("Window {} ({} to {} / {} to {}) produced no backtest result",
                       b.window_id, train_start, train_end, test_start, test_end);
        return std::nullopt;
    }

    WalkForwardWindow w;
    w.window_id     = b.window_id;
    w.train         = b.train;
    w.test          = b.test;
    w.train_periods = is->trading_days;
    w.test_periods  = oos->trading_days;
    w.in_sample     = *is;
    w.out_of_sample = *oos;
    w.sharpe_decay  = is->sharpe_ratio - oos->sharpe_ratio;
    w.return_decay  = is->total_return - oos->total_return;
    w.regime        = classifier_.classify_period(b.test);
    w.params        = params;

    logger()->debug("Window {}: IS Sharpe {:.3f}, OOS Sharpe {:.3f}, regime {}",
                    w.window_id, is->sharpe_ratio, oos->sharpe_ratio,
                    to_string(w.regime));
    return w;
}

// ─── Aggregation ──────────────────────────────────────────────────────────────

double WalkForwardValidator::overfitting_score(double avg_sharpe_decay) noexcept {
    return stats::clamp_finite(
        avg_sharpe_decay / constants::OVERFITTING_SATURATION_DECAY, 0.0, 1.0);
}

std::map<Regime, RegimeStats>
WalkForwardValidator::regime_performance(std::span<const WalkForwardWindow> windows) {
    std::map<Regime, std::vector<const WalkForwardWindow*>> groups;
    for (const auto& w : windows) {
        groups[w.regime].push_back(&w);
    }

    std::map<Regime, RegimeStats> out;
    for (const auto& [regime, members] : groups) {
        std::vector<double> sharpe, ret, dd, win;
        for (const auto* w : members) {
            sharpe.push_back(w->out_of_sample.sharpe_ratio);
            ret.push_back(w->out_of_sample.total_return);
            dd.push_back(w->out_of_sample.max_drawdown);
            win.push_back(w->out_of_sample.win_rate);
        }
        out[regime] = RegimeStats{
            .count         = members.size(),
            .mean_sharpe   = stats::mean(sharpe),
            .mean_return   = stats::mean(ret),
            .mean_drawdown = stats::mean(dd),
            .mean_win_rate = stats::mean(win),
        };
    }
    return out;
}

void WalkForwardValidator::aggregate(BacktestMatrixResults& r,
                                     const ValidatorConfig& config) {
    const std::span<const WalkForwardWindow> windows(r.windows);

    const auto sharpes   = collect(windows, [](const auto& w) { return w.out_of_sample.sharpe_ratio; });
    const auto returns   = collect(windows, [](const auto& w) { return w.out_of_sample.total_return; });
    const auto drawdowns = collect(windows, [](const auto& w) { return w.out_of_sample.max_drawdown; });
    const auto win_rates = collect(windows, [](const auto& w) { return w.out_of_sample.win_rate; });
    const auto decays    = collect(windows, [](const auto& w) { return w.sharpe_decay; });

    r.mean_oos_sharpe       = stats::mean(sharpes);
    r.std_oos_sharpe        = stats::population_stddev(sharpes, constants::MIN_WINDOWS_FOR_STDDEV);
    r.mean_oos_return       = stats::mean(returns);
    r.mean_oos_max_drawdown = stats::mean(drawdowns);
    r.mean_oos_win_rate     = stats::mean(win_rates);
    r.sharpe_consistency    = stats::positive_fraction(sharpes);
    r.return_consistency    = stats::positive_fraction(returns);
    r.avg_sharpe_decay      = stats::mean(decays);
    r.overfitting_score     = overfitting_score(r.avg_sharpe_decay);
    r.regime_performance    = regime_performance(windows);

    r.validation_messages.clear();

    if (r.windows.size() < config.min_windows) {
        r.insufficient_data = true;
        r.passed            = false;
        r.validation_messages.push_back(fmt::format(
            "FAIL: insufficient windows ({} of {} completed, need at least {})",
            r.windows.size(), r.windows_generated, config.min_windows));
        return;
    }
    r.insufficient_data = false;

    // Every check runs; the verdict is their conjunction.
    const ValidationThresholds& t = config.thresholds;
    auto& m = r.validation_messages;
    bool passed = true;

    passed &= check(m, r.mean_oos_sharpe >= t.min_oos_sharpe,
        fmt::format("Mean OOS Sharpe {:.2f} >= {}", r.mean_oos_sharpe, t.min_oos_sharpe),
        fmt::format("Mean OOS Sharpe {:.2f} < {}", r.mean_oos_sharpe, t.min_oos_sharpe));

    passed &= check(m, r.avg_sharpe_decay <= t.max_sharpe_decay,
        fmt::format("Avg Sharpe decay {:.2f} <= {}", r.avg_sharpe_decay, t.max_sharpe_decay),
        fmt::format("Avg Sharpe decay {:.2f} > {}", r.avg_sharpe_decay, t.max_sharpe_decay));

    passed &= check(m, r.mean_oos_max_drawdown <= t.max_oos_drawdown,
        fmt::format("Mean OOS drawdown {:.1f}% <= {:.0f}%", r.mean_oos_max_drawdown, t.max_oos_drawdown),
        fmt::format("Mean OOS drawdown {:.1f}% > {:.0f}%", r.mean_oos_max_drawdown, t.max_oos_drawdown));

    passed &= check(m, r.mean_oos_win_rate >= t.min_oos_win_rate,
        fmt::format("Mean OOS win rate {:.1f}% >= {:.0f}%", r.mean_oos_win_rate, t.min_oos_win_rate),
        fmt::format("Mean OOS win rate {:.1f}% < {:.0f}%", r.mean_oos_win_rate, t.min_oos_win_rate));

    if (r.sharpe_consistency < t.min_sharpe_consistency) {
        m.push_back(fmt::format(
            "WARN: Sharpe consistency {:.0f}% < {:.0f}% (some windows underperform)",
            r.sharpe_consistency * 100.0, t.min_sharpe_consistency * 100.0));
    }

    r.passed = passed;
}

}  // namespace wfv
