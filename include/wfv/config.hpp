#pragma once

/// @file include/wfv/config.hpp
/// @brief Pipeline configuration: defaults, JSON file, environment overrides.
///
/// ## File Format
/// ```json
/// {
///   "log_level": "info",
///   "state_dir": "data",
///   "benchmark_symbol": "SPY",
///   "windows":    { "train_days": 252, "test_days": 63, "step_days": 21,
///                   "embargo_days": 0, "embargo_pct": 0.0 },
///   "validation": { "min_oos_sharpe": 0.8, "max_sharpe_decay": 0.5,
///                   "max_oos_drawdown": 15.0, "min_oos_win_rate": 52.0,
///                   "min_windows": 4 },
///   "scheduler":  { "strategy_id": "core", "frequency": "monthly", ... },
///   "tracker":    { "sharpe_divergence": 0.5, ... },
///   "regime":     { "return_threshold": 0.05, ... }
/// }
/// ```
/// Every key is optional; missing keys keep their defaults.
///
/// ## Environment Overrides
/// `WFV_MIN_OOS_SHARPE`, `WFV_MAX_SHARPE_DECAY`, `WFV_MAX_OOS_DRAWDOWN`,
/// `WFV_MIN_WIN_RATE`, `WFV_MIN_WINDOWS`, `WFV_LOG_LEVEL`.  Unparseable
/// values are ignored with a warning.

#include "wfv/live_tracker.hpp"
#include "wfv/regime.hpp"
#include "wfv/scheduler.hpp"
#include "wfv/validator.hpp"

#include <json/json.h>

#include <optional>
#include <string>

namespace wfv {

struct PipelineConfig {
    std::string      log_level        = "info";
    std::string      state_dir        = "data";
    std::string      benchmark_symbol = constants::DEFAULT_BENCHMARK_SYMBOL;
    ValidatorConfig  validator{};
    SchedulerConfig  scheduler{};
    TrackerConfig    tracker{};
    RegimeThresholds regime{};

    [[nodiscard]] std::string versions_path() const { return state_dir + "/model_versions.json"; }
    [[nodiscard]] std::string scheduler_path() const { return state_dir + "/reoptimization_state.json"; }
    [[nodiscard]] std::string tracker_path() const { return state_dir + "/live_vs_backtest_state.json"; }
};

/// Overlay the keys present in `doc` onto `base`.
[[nodiscard]] PipelineConfig config_from_json(const Json::Value& doc,
                                              PipelineConfig base = PipelineConfig{});

/// Load a JSON config file.
///
/// # Returns
/// `nullopt` if the file cannot be opened or is not a JSON object.
[[nodiscard]] std::optional<PipelineConfig> load_config(const std::string& path);

/// Apply `WFV_*` environment variables to `config`.
void apply_env_overrides(PipelineConfig& config);

}  // namespace wfv
