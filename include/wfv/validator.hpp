#pragma once

/// @file include/wfv/validator.hpp
/// @brief Walk-Forward Validator — rolling out-of-sample evaluation.
///
/// # Module: WalkForwardValidator
///
/// ## Responsibility
/// Drive WindowGenerator + BacktestRunner + RegimeClassifier across every
/// window of a date range, then aggregate the per-window in-sample (IS) and
/// out-of-sample (OOS) metrics into robustness and overfitting statistics and
/// a pass/fail verdict.
///
/// ## Per-Window Metrics
///   sharpe_decay = IS Sharpe − OOS Sharpe       (exact, no smoothing)
///   return_decay = IS return − OOS return
///
/// ## Aggregates
///   mean / population σ of OOS Sharpe
///   sharpe_consistency = #{OOS Sharpe > 0} / N
///   return_consistency = #{OOS return > 0} / N
///   overfitting_score  = clamp(mean(sharpe_decay) / 2, 0, 1)
///
/// ## Verdict
/// Logical AND of four independent checks (OOS Sharpe, decay, drawdown,
/// win rate).  Each check emits its own PASS/FAIL message; a WARN is added
/// when Sharpe consistency is below 0.6 but never affects the verdict.
///
/// ## Guarantees
/// - One failing window never aborts the evaluation
/// - Insufficient data is a normal result (`passed = false`), not an error
/// - `evaluate` never throws
///
/// ## NOT Responsible For
/// - Simulation (see BacktestRunner)
/// - Choosing parameters (see ReOptimizationScheduler)

#include "wfv/backtest_runner.hpp"
#include "wfv/constants.hpp"
#include "wfv/dates.hpp"
#include "wfv/regime.hpp"
#include "wfv/types.hpp"
#include "wfv/window_generator.hpp"

#include <cstddef>
#include <map>
#include <span>
#include <string>
#include <vector>

namespace wfv {

// ─── WalkForwardWindow ────────────────────────────────────────────────────────

/// One completed evaluation fold.  Immutable once produced.
struct WalkForwardWindow {
    int       window_id = 0;
    DateRange train;
    DateRange test;
    int       train_periods = 0;  ///< Usable periods reported by the IS run
    int       test_periods  = 0;  ///< Usable periods reported by the OOS run

    PerformanceRecord in_sample;
    PerformanceRecord out_of_sample;

    double sharpe_decay = 0.0;  ///< in_sample.sharpe − out_of_sample.sharpe
    double return_decay = 0.0;  ///< in_sample.return − out_of_sample.return

    Regime       regime = Regime::Unknown;  ///< Regime of the test period
    ParameterSet params;                    ///< Parameters evaluated
};

// ─── Aggregates ───────────────────────────────────────────────────────────────

/// OOS metrics averaged over the windows of one regime.
struct RegimeStats {
    std::size_t count         = 0;
    double      mean_sharpe   = 0.0;
    double      mean_return   = 0.0;
    double      mean_drawdown = 0.0;
    double      mean_win_rate = 0.0;
};

/// Output of one full validator run.
struct BacktestMatrixResults {
    std::string strategy_id;
    std::string evaluation_date;          ///< ISO-8601 timestamp
    std::size_t windows_generated = 0;    ///< Windows produced by the generator
    std::vector<WalkForwardWindow> windows;  ///< Completed windows, in order

    double mean_oos_sharpe       = 0.0;
    double std_oos_sharpe        = 0.0;  ///< Population σ; 0 for < 2 windows
    double mean_oos_return       = 0.0;
    double mean_oos_max_drawdown = 0.0;
    double mean_oos_win_rate     = 0.0;

    double sharpe_consistency = 0.0;  ///< ∈ [0, 1]
    double return_consistency = 0.0;  ///< ∈ [0, 1]
    double avg_sharpe_decay   = 0.0;
    double overfitting_score  = 0.0;  ///< ∈ [0, 1]

    std::map<Regime, RegimeStats> regime_performance;

    bool insufficient_data = false;
    bool passed            = false;
    std::vector<std::string> validation_messages;

    [[nodiscard]] std::size_t total_windows() const noexcept { return windows.size(); }

    /// Human-readable summary table (uses only exported fields).
    [[nodiscard]] std::string to_string() const;
};

// ─── Configuration ────────────────────────────────────────────────────────────

struct ValidationThresholds {
    double min_oos_sharpe         = constants::DEFAULT_MIN_OOS_SHARPE;
    double max_sharpe_decay       = constants::DEFAULT_MAX_SHARPE_DECAY;
    double max_oos_drawdown       = constants::DEFAULT_MAX_OOS_DRAWDOWN_PCT;   ///< percent
    double min_oos_win_rate       = constants::DEFAULT_MIN_OOS_WIN_RATE_PCT;   ///< percent
    double min_sharpe_consistency = constants::DEFAULT_MIN_SHARPE_CONSISTENCY; ///< WARN only
};

struct ValidatorConfig {
    WindowSpec           windows{};
    ValidationThresholds thresholds{};
    std::size_t          min_windows = constants::DEFAULT_MIN_WINDOWS;
};

// ─── WalkForwardValidator ─────────────────────────────────────────────────────

class WalkForwardValidator {
public:
    /// `runner` and `classifier` must outlive the validator.
    WalkForwardValidator(ValidatorConfig config,
                         BacktestRunner& runner,
                         const RegimeClassifier& classifier);

    /// Run the full walk-forward evaluation of one parameter set.
    ///
    /// # Arguments
    /// * `strategy_id` — identifier passed through to the runner
    /// * `params`      — the parameter set under test
    /// * `start`, `end`— overall evaluation range
    /// * `capital`     — initial capital of every simulated run
    /// * `now`         — evaluation timestamp recorded in the result
    ///
    /// # Returns
    /// Always a result.  `insufficient_data` is set and `passed` is false
    /// when fewer than `min_windows` windows complete.
    [[nodiscard]] BacktestMatrixResults
    evaluate(const std::string& strategy_id,
             const ParameterSet& params,
             const dates::Date& start,
             const dates::Date& end,
             double capital = constants::DEFAULT_INITIAL_CAPITAL,
             const dates::Timestamp& now = dates::now_utc()) const;

    /// Fill every aggregate of `results` from `results.windows` and render
    /// the verdict.  Exposed for callers that assemble windows themselves.
    static void aggregate(BacktestMatrixResults& results,
                          const ValidatorConfig& config);

    /// clamp(avg_sharpe_decay / 2, 0, 1).  Non-finite input maps to 1.
    [[nodiscard]] static double overfitting_score(double avg_sharpe_decay) noexcept;

    /// Group windows by regime and average their OOS metrics.
    [[nodiscard]] static std::map<Regime, RegimeStats>
    regime_performance(std::span<const WalkForwardWindow> windows);

    [[nodiscard]] const ValidatorConfig& config() const noexcept { return config_; }

private:
    /// Evaluate one fold.  Returns `nullopt` if either backtest run fails.
    [[nodiscard]] std::optional<WalkForwardWindow>
    evaluate_window(const std::string& strategy_id,
                    const ParameterSet& params,
                    const WindowBounds& bounds,
                    double capital) const;

    ValidatorConfig         config_;
    BacktestRunner&         runner_;
    const RegimeClassifier& classifier_;
};

}  // namespace wfv
