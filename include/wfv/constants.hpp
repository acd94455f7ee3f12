#pragma once

#include <cstddef>

/// @file include/wfv/constants.hpp
/// @brief Default thresholds for validation, governance and live tracking.
///
/// Every default used by a config struct is named here once.

namespace wfv::constants {

// ─── Walk-Forward Windows ─────────────────────────────────────────────────────

/// One trading year of training data.
static constexpr int DEFAULT_TRAIN_DAYS = 252;

/// One trading quarter of test data.
static constexpr int DEFAULT_TEST_DAYS = 63;

/// Roll forward by one trading month.
static constexpr int DEFAULT_STEP_DAYS = 21;

/// Fewer completed windows than this → insufficient data.
static constexpr std::size_t DEFAULT_MIN_WINDOWS = 4;

/// Standard-deviation aggregates need at least this many windows.
static constexpr std::size_t MIN_WINDOWS_FOR_STDDEV = 2;

/// Largest accepted `min_windows` override.
static constexpr std::size_t MAX_MIN_WINDOWS = 10000;

// ─── Validation Thresholds ────────────────────────────────────────────────────

static constexpr double DEFAULT_MIN_OOS_SHARPE        = 0.8;
static constexpr double DEFAULT_MAX_SHARPE_DECAY      = 0.5;
static constexpr double DEFAULT_MAX_OOS_DRAWDOWN_PCT  = 15.0;
static constexpr double DEFAULT_MIN_OOS_WIN_RATE_PCT  = 52.0;
static constexpr double DEFAULT_MIN_SHARPE_CONSISTENCY = 0.6;

/// Average decay at which the overfitting score saturates at 1.0.
static constexpr double OVERFITTING_SATURATION_DECAY = 2.0;

// ─── Regime Classification ────────────────────────────────────────────────────

static constexpr double DEFAULT_REGIME_RETURN_THRESHOLD   = 0.05;
static constexpr double DEFAULT_REGIME_VOL_THRESHOLD      = 0.20;
static constexpr double DEFAULT_SIDEWAYS_VOL_THRESHOLD    = 0.25;
static constexpr double ANNUALISATION_FACTOR              = 252.0;
static constexpr const char* DEFAULT_BENCHMARK_SYMBOL     = "SPY";

// ─── Re-Optimization Governance ───────────────────────────────────────────────

static constexpr int    DEFAULT_MIN_DAYS_BETWEEN_RUNS     = 7;
static constexpr double DEFAULT_MAX_PARAMETER_CHANGE_PCT  = 50.0;
static constexpr double DEFAULT_MIN_IMPROVEMENT_PCT       = 5.0;
static constexpr int    DEFAULT_AUTO_ROLLBACK_DAYS        = 30;
static constexpr int    MAX_AUTO_ROLLBACK_DAYS            = 3650;
static constexpr double DEFAULT_INITIAL_CAPITAL           = 100000.0;
static constexpr std::size_t DEFAULT_HISTORY_LIMIT        = 50;

// ─── Live vs Backtest Divergence ──────────────────────────────────────────────

static constexpr double DEFAULT_SHARPE_DIVERGENCE     = 0.5;
static constexpr double DEFAULT_RETURN_DIVERGENCE_PCT = 20.0;
static constexpr double DEFAULT_DRAWDOWN_DIVERGENCE_PCT = 10.0;

/// Rolling window of the divergence report.
static constexpr std::size_t DIVERGENCE_REPORT_WINDOW = 10;

/// Half-window compared by the divergence trend.
static constexpr std::size_t DIVERGENCE_TREND_WINDOW = 5;

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

static constexpr double FLOAT_EPSILON = 1e-12;

}  // namespace wfv::constants
