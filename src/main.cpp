/// @file src/main.cpp
/// @brief wfv CLI: inspect and govern a strategy's validated parameter sets.
///
/// Usage:
///   wfv --status   <config.json>                     Active version, probation, history
///   wfv --check    <config.json>                     Confirm or roll back the version on probation
///   wfv --rollback <config.json> <version_id> [why]  Reactivate a previous version
///   wfv --report   <results.json>                    Print a saved validation report
///   wfv --help                                       Print usage
///
/// The CLI never runs backtests; optimization runs are driven by the host
/// process that owns a BacktestRunner.

#include "wfv/config.hpp"
#include "wfv/logging.hpp"
#include "wfv/model_version.hpp"
#include "wfv/results_io.hpp"
#include "wfv/scheduler.hpp"

#include <fmt/core.h>
#include <fmt/ranges.h>

#include <optional>
#include <stdexcept>
#include <string>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  wfv --status   <config.json>                     Show governance state\n"
        "  wfv --check    <config.json>                     Resolve a pending confirmation\n"
        "  wfv --rollback <config.json> <version_id> [why]  Reactivate a version\n"
        "  wfv --report   <results.json>                    Print a validation report\n"
        "  wfv --help                                       Show this help\n"
        "\n"
        "Environment: WFV_LOG_LEVEL, WFV_MIN_OOS_SHARPE, WFV_MAX_SHARPE_DECAY,\n"
        "             WFV_MAX_OOS_DRAWDOWN, WFV_MIN_WIN_RATE, WFV_MIN_WINDOWS\n"
    );
}

/// Stand-in runner for commands that never evaluate a candidate.
class DetachedRunner final : public wfv::BacktestRunner {
public:
    std::optional<wfv::PerformanceRecord>
    run(const std::string& strategy_id, const wfv::ParameterSet&,
        const std::string&, const std::string&, double) override {
        throw std::runtime_error("no backtest engine attached for " + strategy_id);
    }
};

/// Everything a governance command needs, wired from one config file.
struct Pipeline {
    explicit Pipeline(const wfv::PipelineConfig& cfg)
        : config(cfg)
        , classifier(cfg.regime)
        , validator(cfg.validator, runner, classifier)
        , versions(cfg.versions_path())
        , tracker(cfg.tracker_path(), cfg.tracker)
        , scheduler(cfg.scheduler, validator, versions, tracker, cfg.scheduler_path())
    {}

    wfv::PipelineConfig           config;
    DetachedRunner                runner;
    wfv::RegimeClassifier         classifier;
    wfv::WalkForwardValidator     validator;
    wfv::ModelVersionStore        versions;
    wfv::LiveVsBacktestTracker    tracker;
    wfv::ReOptimizationScheduler  scheduler;
};

std::optional<wfv::PipelineConfig> load(const std::string& path) {
    auto cfg = wfv::load_config(path);
    if (!cfg) {
        fmt::print(stderr, "Error: cannot load config '{}'\n", path);
        return std::nullopt;
    }
    wfv::apply_env_overrides(*cfg);
    if (!wfv::set_log_level(cfg->log_level)) {
        fmt::print(stderr, "Warning: unknown log level '{}'\n", cfg->log_level);
    }
    if (cfg->scheduler.strategy_id.empty()) {
        fmt::print(stderr, "Error: scheduler.strategy_id is not set in '{}'\n", path);
        return std::nullopt;
    }
    return cfg;
}

int run_status(const std::string& config_path) {
    const auto cfg = load(config_path);
    if (!cfg) return 1;

    Pipeline p(*cfg);
    const std::string& strategy = cfg->scheduler.strategy_id;
    const auto now = wfv::dates::now_utc();

    fmt::print("Strategy:  {}\n", strategy);
    fmt::print("Frequency: {}  (due now: {})\n",
               wfv::to_string(cfg->scheduler.frequency),
               p.scheduler.should_run(now) ? "yes" : "no");

    if (const auto active = p.versions.active(strategy)) {
        fmt::print("Active:    {}  created {}  mean OOS Sharpe {:.2f}\n",
                   active->version_id, active->created_at,
                   active->validation.mean_oos_sharpe);
        for (const auto& [name, value] : active->parameters) {
            fmt::print("           {} = {}\n", name, value);
        }
    } else {
        fmt::print("Active:    none\n");
    }

    if (const auto pending = p.scheduler.pending()) {
        fmt::print("Probation: {} until {} (previous {})\n",
                   pending->version_id, pending->deadline, pending->previous_version);
    }

    fmt::print("\nVersions:\n");
    for (const auto& v : p.versions.history(strategy)) {
        fmt::print("  {}  {}  {:<8}  superseded_by={}\n",
                   v.version_id, v.created_at, v.is_active ? "ACTIVE" : "inactive",
                   v.superseded_by.value_or("-"));
    }

    fmt::print("\nOptimization history:\n");
    for (const auto& h : p.scheduler.history()) {
        fmt::print("  {}  {:<11}  {:6.1f}s  {}\n",
                   h.optimization_id, wfv::to_string(h.status), h.duration_seconds,
                   h.reason.value_or(h.new_version.value_or("")));
    }

    if (const auto report = p.tracker.divergence_report(strategy)) {
        fmt::print("\nLive vs backtest ({} periods, trend {}):\n",
                   report->periods_recorded, wfv::to_string(report->trend));
        fmt::print("  avg Sharpe divergence   {:+.2f}\n", report->avg_sharpe_divergence);
        fmt::print("  avg return divergence   {:+.1f}%\n", report->avg_return_divergence);
        fmt::print("  avg drawdown divergence {:+.1f}%\n", report->avg_drawdown_divergence);
        for (const auto& a : report->recent_alerts) {
            fmt::print("  {} {}..{}: {}\n", wfv::to_string(a.alert_level),
                       a.period_start, a.period_end, fmt::join(a.alerts, "; "));
        }
    }
    return 0;
}

int run_check(const std::string& config_path) {
    const auto cfg = load(config_path);
    if (!cfg) return 1;

    Pipeline p(*cfg);
    const auto outcome = p.scheduler.check_pending_confirmation(wfv::dates::now_utc());
    fmt::print("{}: {} {}\n", wfv::to_string(outcome.status), outcome.version_id, outcome.message);
    return outcome.status == wfv::ConfirmationStatus::Error ? 1 : 0;
}

int run_rollback(const std::string& config_path,
                 const std::string& version_id,
                 const std::string& reason) {
    const auto cfg = load(config_path);
    if (!cfg) return 1;

    Pipeline p(*cfg);
    if (!p.scheduler.rollback_to(version_id, reason, wfv::dates::now_utc())) {
        fmt::print(stderr, "Error: rollback to '{}' failed\n", version_id);
        return 1;
    }
    fmt::print("Version {} is now active for {}\n", version_id, cfg->scheduler.strategy_id);
    return 0;
}

int run_report(const std::string& results_path) {
    const auto results = wfv::load_results(results_path);
    if (!results) {
        fmt::print(stderr, "Error: cannot read validation results '{}'\n", results_path);
        return 1;
    }
    fmt::print("{}\n", results->to_string());
    return results->passed ? 0 : 2;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string mode(argv[1]);

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    if (argc < 3) {
        fmt::print(stderr, "Error: {} requires a file path\n", mode);
        print_usage();
        return 1;
    }
    const std::string path(argv[2]);

    if (mode == "--status") return run_status(path);
    if (mode == "--check")  return run_check(path);
    if (mode == "--report") return run_report(path);

    if (mode == "--rollback") {
        if (argc < 4) {
            fmt::print(stderr, "Error: --rollback requires a version id\n");
            print_usage();
            return 1;
        }
        const std::string reason = argc >= 5 ? std::string(argv[4]) : "Manual rollback";
        return run_rollback(path, std::string(argv[3]), reason);
    }

    fmt::print(stderr, "Unknown option: {}\n", mode);
    print_usage();
    return 1;
}
