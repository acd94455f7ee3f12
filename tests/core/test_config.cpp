/// @file tests/core/test_config.cpp
/// @brief Unit Tests — PipelineConfig loading
///
/// Tests cover:
///   - Defaults match the documented thresholds
///   - Keys present in the file override defaults; others are kept
///   - Parameter bounds become a schema
///   - Unreadable files, out-of-range probation length
///   - WFV_* environment overrides and their bounds

#include "wfv/config.hpp"
#include "support/fakes.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <fstream>

using namespace wfv;
using wfv::testing::TempDir;

// ─── Helpers ──────────────────────────────────────────────────────────────────

namespace {

/// Sets an environment variable for the lifetime of the guard.
class EnvGuard {
public:
    EnvGuard(const char* name, const char* value) : name_(name) {
        ::setenv(name, value, 1);
    }
    ~EnvGuard() { ::unsetenv(name_); }

    EnvGuard(const EnvGuard&) = delete;
    EnvGuard& operator=(const EnvGuard&) = delete;

private:
    const char* name_;
};

} // anonymous namespace

// ─── Defaults ─────────────────────────────────────────────────────────────────

TEST(Config_Defaults, MatchDocumentedThresholds) {
    const PipelineConfig cfg;
    EXPECT_EQ(cfg.validator.windows.train_days, 252);
    EXPECT_EQ(cfg.validator.windows.test_days, 63);
    EXPECT_EQ(cfg.validator.windows.step_days, 21);
    EXPECT_DOUBLE_EQ(cfg.validator.thresholds.min_oos_sharpe, 0.8);
    EXPECT_DOUBLE_EQ(cfg.validator.thresholds.max_sharpe_decay, 0.5);
    EXPECT_DOUBLE_EQ(cfg.validator.thresholds.max_oos_drawdown, 15.0);
    EXPECT_DOUBLE_EQ(cfg.validator.thresholds.min_oos_win_rate, 52.0);
    EXPECT_EQ(cfg.scheduler.frequency, OptimizationFrequency::Monthly);
    EXPECT_DOUBLE_EQ(cfg.scheduler.max_parameter_change_pct, 50.0);
    EXPECT_EQ(cfg.scheduler.auto_rollback_days, 30);
    EXPECT_EQ(cfg.versions_path(), "data/model_versions.json");
}

// ─── File ─────────────────────────────────────────────────────────────────────

TEST(Config_Load, PresentKeys_OverrideDefaults) {
    TempDir dir;
    std::ofstream(dir.file("wfv.json")) << R"({
        "state_dir": "/var/lib/wfv",
        "windows":    { "train_days": 504, "embargo_days": 5 },
        "validation": { "min_oos_sharpe": 1.0, "min_windows": 6 },
        "scheduler":  { "strategy_id": "core", "frequency": "quarterly",
                        "require_improvement": false,
                        "parameters": { "lookback": { "type": "int", "min": 5, "max": 60 } } },
        "tracker":    { "drawdown_divergence": 8.0 }
    })";

    const auto cfg = load_config(dir.file("wfv.json"));
    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->validator.windows.train_days, 504);
    EXPECT_EQ(cfg->validator.windows.test_days, 63);
    EXPECT_EQ(cfg->validator.windows.embargo.resolve(1000), 5);
    EXPECT_DOUBLE_EQ(cfg->validator.thresholds.min_oos_sharpe, 1.0);
    EXPECT_DOUBLE_EQ(cfg->validator.thresholds.max_sharpe_decay, 0.5);
    EXPECT_EQ(cfg->validator.min_windows, 6u);
    EXPECT_EQ(cfg->scheduler.strategy_id, "core");
    EXPECT_EQ(cfg->scheduler.frequency, OptimizationFrequency::Quarterly);
    EXPECT_FALSE(cfg->scheduler.require_improvement);
    EXPECT_TRUE(cfg->scheduler.schema.admits({{"lookback", 20}}));
    EXPECT_FALSE(cfg->scheduler.schema.admits({{"lookback", 2}}));
    EXPECT_DOUBLE_EQ(cfg->tracker.drawdown_divergence_threshold, 8.0);
    EXPECT_EQ(cfg->scheduler_path(), "/var/lib/wfv/reoptimization_state.json");
}

TEST(Config_Load, UnknownFrequency_KeepsDefault) {
    Json::Value doc(Json::objectValue);
    doc["scheduler"]["frequency"] = "hourly";
    EXPECT_EQ(config_from_json(doc).scheduler.frequency, OptimizationFrequency::Monthly);
}

TEST(Config_Load, UnreadableFile_Nullopt) {
    TempDir dir;
    EXPECT_FALSE(load_config(dir.file("missing.json")).has_value());
    std::ofstream(dir.file("bad.json")) << "[1, 2";
    EXPECT_FALSE(load_config(dir.file("bad.json")).has_value());
}

// ─── Environment ──────────────────────────────────────────────────────────────

TEST(Config_Env, Overrides_Thresholds) {
    EnvGuard sharpe("WFV_MIN_OOS_SHARPE", "1.25");
    EnvGuard windows("WFV_MIN_WINDOWS", "8");
    EnvGuard bogus("WFV_MAX_SHARPE_DECAY", "lots");

    PipelineConfig cfg;
    apply_env_overrides(cfg);
    EXPECT_DOUBLE_EQ(cfg.validator.thresholds.min_oos_sharpe, 1.25);
    EXPECT_EQ(cfg.validator.min_windows, 8u);
    EXPECT_DOUBLE_EQ(cfg.validator.thresholds.max_sharpe_decay, 0.5);
}

TEST(Config_Load, OutOfRangeProbation_KeepsDefault) {
    for (const int days : {0, -5, 3000000}) {
        Json::Value doc(Json::objectValue);
        doc["scheduler"]["auto_rollback_days"] = days;
        EXPECT_EQ(config_from_json(doc).scheduler.auto_rollback_days, 30) << days;
    }

    Json::Value doc(Json::objectValue);
    doc["scheduler"]["auto_rollback_days"] = 45;
    EXPECT_EQ(config_from_json(doc).scheduler.auto_rollback_days, 45);
}

TEST(Config_Env, UnboundedMinWindows_Ignored) {
    for (const char* raw : {"inf", "1e30", "nan", "0.5"}) {
        EnvGuard windows("WFV_MIN_WINDOWS", raw);
        PipelineConfig cfg;
        apply_env_overrides(cfg);
        EXPECT_EQ(cfg.validator.min_windows, 4u) << raw;
    }
}
