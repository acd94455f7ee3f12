#pragma once

/// @file include/wfv/scheduler.hpp
/// @brief Re-Optimization Scheduler — governed parameter promotion.
///
/// # Module: ReOptimizationScheduler
///
/// ## State Machine
///   idle → due → searching → validated | rejected
///   validated → probation → confirmed | rolled back
///
/// ## Promotion Gates (in order)
/// 1. At least one grid candidate passes walk-forward validation
/// 2. The best candidate (highest mean OOS Sharpe) meets the scheduler's own
///    minimum OOS Sharpe and maximum decay
/// 3. No parameter changes by more than `max_parameter_change_pct` relative
///    to the active version
/// 4. If `require_improvement`, mean OOS Sharpe improves on the active
///    version's by at least `min_improvement_pct`
///
/// A run rejected at any gate returns FAILED and leaves the version store
/// untouched.  Gates 3 and 4 are skipped when no version is active yet.
///
/// ## Probation
/// A promoted version stays pending until `now + auto_rollback_days`.  After
/// the deadline, live Sharpe recorded against that version's expectation is
/// compared with the validated Sharpe; a shortfall above `max_sharpe_decay`
/// rolls the promotion back.  Missing live data never confirms.
///
/// ## Concurrency
/// One mutex serialises every mutating operation of a scheduler; construct
/// one scheduler per strategy.

#include "wfv/constants.hpp"
#include "wfv/dates.hpp"
#include "wfv/json_store.hpp"
#include "wfv/live_tracker.hpp"
#include "wfv/model_version.hpp"
#include "wfv/parameter_grid.hpp"
#include "wfv/types.hpp"
#include "wfv/validator.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace wfv {

// ─── Enumerations ─────────────────────────────────────────────────────────────

enum class OptimizationFrequency {
    Weekly,
    Biweekly,
    Monthly,
    Quarterly,
};

[[nodiscard]] const char* to_string(OptimizationFrequency f) noexcept;
[[nodiscard]] std::optional<OptimizationFrequency>
frequency_from_string(const std::string& s) noexcept;

/// Period of a frequency in days (7 / 14 / 30 / 90).
[[nodiscard]] int frequency_days(OptimizationFrequency f) noexcept;

enum class OptimizationStatus {
    Pending,
    Running,
    Passed,
    Failed,
    RolledBack,
};

[[nodiscard]] const char* to_string(OptimizationStatus s) noexcept;
[[nodiscard]] std::optional<OptimizationStatus>
status_from_string(const std::string& s) noexcept;

enum class FailureReason {
    NoValidCombination,
    ValidationCriteria,
    ParameterBoundExceeded,
    InsufficientImprovement,
    Exception,
};

[[nodiscard]] const char* to_string(FailureReason r) noexcept;

enum class ConfirmationStatus {
    NoPending,  ///< Nothing on probation
    Pending,    ///< Deadline not reached
    Confirmed,
    RolledBack,
    Error,      ///< Live data unavailable or version missing; state untouched
};

[[nodiscard]] const char* to_string(ConfirmationStatus s) noexcept;

// ─── Results ──────────────────────────────────────────────────────────────────

struct OptimizationResult {
    std::string optimization_id;
    std::string timestamp;
    OptimizationFrequency frequency = OptimizationFrequency::Monthly;
    OptimizationStatus    status    = OptimizationStatus::Pending;
    std::string previous_version;          ///< "none" if nothing was active
    std::optional<std::string> new_version;
    bool validation_passed = false;
    std::optional<BacktestMatrixResults> validation;  ///< Winning candidate
    ParameterSet best_parameters;
    std::map<std::string, ParameterChange> parameter_changes;
    std::vector<ParameterSensitivity> parameter_sensitivity;
    std::optional<FailureReason> failure;
    std::optional<std::string>   rollback_reason;  ///< Human-readable detail
    std::size_t candidates_evaluated = 0;
    double duration_seconds = 0.0;
};

struct PendingConfirmation {
    std::string version_id;
    std::string previous_version;
    std::string deadline;  ///< ISO-8601 timestamp
};

struct ConfirmationOutcome {
    ConfirmationStatus status = ConfirmationStatus::NoPending;
    std::string version_id;
    std::string message;
    long   days_remaining  = 0;
    double expected_sharpe = 0.0;
    double live_sharpe     = 0.0;
};

/// Compact record kept in the scheduler's run history.
struct OptimizationHistoryEntry {
    std::string optimization_id;
    std::string timestamp;
    OptimizationStatus status = OptimizationStatus::Pending;
    bool validation_passed = false;
    std::optional<std::string> new_version;
    std::optional<std::string> reason;
    double duration_seconds = 0.0;
};

// ─── SchedulerConfig ──────────────────────────────────────────────────────────

struct SchedulerConfig {
    std::string           strategy_id;
    OptimizationFrequency frequency = OptimizationFrequency::Monthly;
    int    min_days_between_runs    = constants::DEFAULT_MIN_DAYS_BETWEEN_RUNS;
    double min_oos_sharpe           = constants::DEFAULT_MIN_OOS_SHARPE;
    double max_sharpe_decay         = constants::DEFAULT_MAX_SHARPE_DECAY;
    double max_parameter_change_pct = constants::DEFAULT_MAX_PARAMETER_CHANGE_PCT;
    bool   require_improvement      = true;
    double min_improvement_pct      = constants::DEFAULT_MIN_IMPROVEMENT_PCT;
    int    auto_rollback_days       = constants::DEFAULT_AUTO_ROLLBACK_DAYS;
    double initial_capital          = constants::DEFAULT_INITIAL_CAPITAL;
    std::size_t history_limit       = constants::DEFAULT_HISTORY_LIMIT;
    ParameterSchema schema{};
};

// ─── ReOptimizationScheduler ──────────────────────────────────────────────────

class ReOptimizationScheduler {
public:
    /// All collaborators must outlive the scheduler.  `state_path` is the
    /// scheduler's own document (run history and pending marker).
    ReOptimizationScheduler(SchedulerConfig config,
                            const WalkForwardValidator& validator,
                            ModelVersionStore& versions,
                            LiveVsBacktestTracker& tracker,
                            std::string state_path);

    /// True iff no run has passed yet, or
    /// now − last_run ≥ max(min_days_between_runs, frequency period).
    [[nodiscard]] bool should_run(const dates::Timestamp& now) const;

    /// Grid-search `grid` over `range`, gate the winner, and promote it.
    ///
    /// Never throws: any exception is logged and reported as FAILED.
    [[nodiscard]] OptimizationResult
    run_optimization(const ParameterGrid& grid,
                     const DateRange& range,
                     const dates::Timestamp& now);

    /// Confirm or roll back the version on probation once its deadline has
    /// passed.  Before the deadline this is a no-op returning `Pending`.
    [[nodiscard]] ConfirmationOutcome
    check_pending_confirmation(const dates::Timestamp& now);

    /// Manual override: activate `version_id` now.  Clears any pending
    /// confirmation.
    [[nodiscard]] bool rollback_to(const std::string& version_id,
                                   const std::string& reason,
                                   const dates::Timestamp& now);

    [[nodiscard]] ParameterSet active_parameters() const;
    [[nodiscard]] std::optional<PendingConfirmation> pending() const;
    [[nodiscard]] std::optional<dates::Timestamp> last_run() const;
    [[nodiscard]] std::vector<OptimizationHistoryEntry> history() const;

    [[nodiscard]] const SchedulerConfig& config() const noexcept { return config_; }

private:
    struct State {
        std::optional<std::string> last_run;
        std::optional<PendingConfirmation> pending;
        std::vector<OptimizationHistoryEntry> history;
    };

    /// Body of `run_optimization`; may throw.
    OptimizationResult optimize(const ParameterGrid& grid,
                                const DateRange& range,
                                const dates::Timestamp& now,
                                OptimizationResult result);

    OptimizationResult fail(OptimizationResult result,
                            FailureReason reason,
                            const std::string& detail);

    void record(const OptimizationResult& result);
    /// Write this strategy's key of the state document; failures are logged.
    void persist_state();
    void load_state();

    SchedulerConfig             config_;
    const WalkForwardValidator& validator_;
    ModelVersionStore&          versions_;
    LiveVsBacktestTracker&      tracker_;
    JsonDocumentStore           state_store_;
    State                       state_;
    mutable std::mutex          mutex_;
};

}  // namespace wfv
