/// @file src/optimize/reoptimization_scheduler.cpp
/// @brief ReOptimizationScheduler implementation.
///
/// Persisted layout (one key per strategy, other strategies untouched):
///
///   { "<strategy_id>": { "last_optimization_run": "...",
///                        "pending_confirmation": { "version_id", "previous_version",
///                                                  "confirmation_date" },
///                        "optimization_history": [ ... ] } }

#include "wfv/scheduler.hpp"
#include "wfv/logging.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <exception>
#include <stdexcept>
#include <utility>

namespace wfv {

// ─── Enumerations ─────────────────────────────────────────────────────────────

const char* to_string(OptimizationFrequency f) noexcept {
    switch (f) {
        case OptimizationFrequency::Weekly:    return "weekly";
        case OptimizationFrequency::Biweekly:  return "biweekly";
        case OptimizationFrequency::Monthly:   return "monthly";
        case OptimizationFrequency::Quarterly: return "quarterly";
    }
    return "monthly";
}

std::optional<OptimizationFrequency>
frequency_from_string(const std::string& s) noexcept {
    if (s == "weekly")    return OptimizationFrequency::Weekly;
    if (s == "biweekly")  return OptimizationFrequency::Biweekly;
    if (s == "monthly")   return OptimizationFrequency::Monthly;
    if (s == "quarterly") return OptimizationFrequency::Quarterly;
    return std::nullopt;
}

int frequency_days(OptimizationFrequency f) noexcept {
    switch (f) {
        case OptimizationFrequency::Weekly:    return 7;
        case OptimizationFrequency::Biweekly:  return 14;
        case OptimizationFrequency::Monthly:   return 30;
        case OptimizationFrequency::Quarterly: return 90;
    }
    return 30;
}

const char* to_string(OptimizationStatus s) noexcept {
    switch (s) {
        case OptimizationStatus::Pending:    return "pending";
        case OptimizationStatus::Running:    return "running";
        case OptimizationStatus::Passed:     return "passed";
        case OptimizationStatus::Failed:     return "failed";
        case OptimizationStatus::RolledBack: return "rolled_back";
    }
    return "pending";
}

std::optional<OptimizationStatus>
status_from_string(const std::string& s) noexcept {
    if (s == "pending")     return OptimizationStatus::Pending;
    if (s == "running")     return OptimizationStatus::Running;
    if (s == "passed")      return OptimizationStatus::Passed;
    if (s == "failed")      return OptimizationStatus::Failed;
    if (s == "rolled_back") return OptimizationStatus::RolledBack;
    return std::nullopt;
}

const char* to_string(FailureReason r) noexcept {
    switch (r) {
        case FailureReason::NoValidCombination:      return "no valid combination";
        case FailureReason::ValidationCriteria:      return "validation criteria not met";
        case FailureReason::ParameterBoundExceeded:  return "parameter bound exceeded";
        case FailureReason::InsufficientImprovement: return "insufficient improvement";
        case FailureReason::Exception:               return "exception";
    }
    return "exception";
}

const char* to_string(ConfirmationStatus s) noexcept {
    switch (s) {
        case ConfirmationStatus::NoPending:  return "no_pending";
        case ConfirmationStatus::Pending:    return "pending";
        case ConfirmationStatus::Confirmed:  return "confirmed";
        case ConfirmationStatus::RolledBack: return "rolled_back";
        case ConfirmationStatus::Error:      return "error";
    }
    return "error";
}

// ─── State Encoding ───────────────────────────────────────────────────────────

namespace {

Json::Value optional_text(const std::optional<std::string>& s) {
    return s ? Json::Value(*s) : Json::Value(Json::nullValue);
}

std::optional<std::string> text_if_present(const Json::Value& v) {
    if (v.isString()) return v.asString();
    return std::nullopt;
}

Json::Value encode(const OptimizationHistoryEntry& e) {
    Json::Value v(Json::objectValue);
    v["optimization_id"]   = e.optimization_id;
    v["timestamp"]         = e.timestamp;
    v["status"]            = to_string(e.status);
    v["validation_passed"] = e.validation_passed;
    v["new_version"]       = optional_text(e.new_version);
    v["reason"]            = optional_text(e.reason);
    v["duration_seconds"]  = e.duration_seconds;
    return v;
}

OptimizationHistoryEntry decode_history(const Json::Value& v) {
    OptimizationHistoryEntry e;
    e.optimization_id   = v["optimization_id"].isString() ? v["optimization_id"].asString() : "";
    e.timestamp         = v["timestamp"].isString() ? v["timestamp"].asString() : "";
    e.status            = status_from_string(v["status"].isString() ? v["status"].asString() : "")
                              .value_or(OptimizationStatus::Failed);
    e.validation_passed = v["validation_passed"].isBool() && v["validation_passed"].asBool();
    e.new_version       = text_if_present(v["new_version"]);
    e.reason            = text_if_present(v["reason"]);
    e.duration_seconds  = v["duration_seconds"].isNumeric() ? v["duration_seconds"].asDouble() : 0.0;
    return e;
}

}  // namespace

// ─── Construction & Persistence ───────────────────────────────────────────────

ReOptimizationScheduler::ReOptimizationScheduler(SchedulerConfig config,
                                                 const WalkForwardValidator& validator,
                                                 ModelVersionStore& versions,
                                                 LiveVsBacktestTracker& tracker,
                                                 std::string state_path)
    : config_(std::move(config))
    , validator_(validator)
    , versions_(versions)
    , tracker_(tracker)
    , state_store_(std::move(state_path))
{
    load_state();
    logger()->info("Re-optimization scheduler for {}: {} (min {} days between runs)",
                   config_.strategy_id, to_string(config_.frequency),
                   config_.min_days_between_runs);
}

void ReOptimizationScheduler::load_state() {
    const Json::Value doc = state_store_.load();
    const Json::Value& s = doc[config_.strategy_id];
    if (!s.isObject()) return;

    state_.last_run = text_if_present(s["last_optimization_run"]);

    const Json::Value& p = s["pending_confirmation"];
    if (p.isObject() && p["version_id"].isString() && p["confirmation_date"].isString()) {
        state_.pending = PendingConfirmation{
            .version_id       = p["version_id"].asString(),
            .previous_version = p["previous_version"].isString() ? p["previous_version"].asString() : "none",
            .deadline         = p["confirmation_date"].asString(),
        };
    }

    for (const auto& h : s["optimization_history"]) {
        if (h.isObject()) state_.history.push_back(decode_history(h));
    }
}

void ReOptimizationScheduler::persist_state() {
    Json::Value s(Json::objectValue);
    s["last_optimization_run"] = optional_text(state_.last_run);
    if (state_.pending) {
        Json::Value p(Json::objectValue);
        p["version_id"]        = state_.pending->version_id;
        p["previous_version"]  = state_.pending->previous_version;
        p["confirmation_date"] = state_.pending->deadline;
        s["pending_confirmation"] = p;
    } else {
        s["pending_confirmation"] = Json::Value(Json::nullValue);
    }
    Json::Value history(Json::arrayValue);
    for (const auto& e : state_.history) history.append(encode(e));
    s["optimization_history"] = history;

    Json::Value doc = state_store_.load();
    doc[config_.strategy_id] = s;
    if (!state_store_.save(doc)) {
        logger()->error("Failed to persist scheduler state for {}", config_.strategy_id);
    }
}

void ReOptimizationScheduler::record(const OptimizationResult& result) {
    state_.history.push_back(OptimizationHistoryEntry{
        .optimization_id   = result.optimization_id,
        .timestamp         = result.timestamp,
        .status            = result.status,
        .validation_passed = result.validation_passed,
        .new_version       = result.new_version,
        .reason            = result.rollback_reason,
        .duration_seconds  = result.duration_seconds,
    });
    if (state_.history.size() > config_.history_limit) {
        state_.history.erase(state_.history.begin(),
                             state_.history.end() - static_cast<std::ptrdiff_t>(config_.history_limit));
    }
    persist_state();
}

// ─── Scheduling ───────────────────────────────────────────────────────────────

bool ReOptimizationScheduler::should_run(const dates::Timestamp& now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!state_.last_run) return true;

    const auto last = dates::parse_timestamp(*state_.last_run);
    if (!last) {
        logger()->warn("Unreadable last run timestamp '{}'; treating as never run",
                       *state_.last_run);
        return true;
    }

    const int required = std::max(config_.min_days_between_runs,
                                  frequency_days(config_.frequency));
    return now - *last >= boost::posix_time::hours(24 * required);
}

// ─── Optimization ─────────────────────────────────────────────────────────────

OptimizationResult
ReOptimizationScheduler::run_optimization(const ParameterGrid& grid,
                                          const DateRange& range,
                                          const dates::Timestamp& now) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto started = std::chrono::steady_clock::now();

    OptimizationResult result;
    result.optimization_id = "opt_" + dates::compact_timestamp(now);
    result.timestamp       = dates::format_timestamp(now);
    result.frequency       = config_.frequency;
    result.status          = OptimizationStatus::Running;

    const auto current = versions_.active(config_.strategy_id);
    result.previous_version = current ? current->version_id : "none";

    logger()->info("Starting optimization {} for {}", result.optimization_id, config_.strategy_id);

    try {
        result = optimize(grid, range, now, result);
    } catch (const std::exception& e) {
        logger()->error("Optimization {} failed with error: {}", result.optimization_id, e.what());
        result.status            = OptimizationStatus::Failed;
        result.new_version.reset();
        result.failure           = FailureReason::Exception;
        result.rollback_reason   = std::string("exception: ") + e.what();
    }

    result.duration_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - started).count();
    record(result);
    return result;
}

OptimizationResult
ReOptimizationScheduler::fail(OptimizationResult result,
                              FailureReason reason,
                              const std::string& detail) {
    result.status          = OptimizationStatus::Failed;
    result.failure         = reason;
    result.rollback_reason = detail;
    logger()->warn("Optimization {} FAILED ({}): {}",
                   result.optimization_id, to_string(reason), detail);
    return result;
}

OptimizationResult
ReOptimizationScheduler::optimize(const ParameterGrid& grid,
                                  const DateRange& range,
                                  const dates::Timestamp& now,
                                  OptimizationResult result) {
    // Gate 1: grid search with the validator as oracle
    const std::vector<ParameterSet> all = expand(grid);
    const std::vector<ParameterSet> candidates = filter_admitted(all, config_.schema);
    if (candidates.size() < all.size()) {
        logger()->warn("{} of {} grid candidates rejected by the parameter schema",
                       all.size() - candidates.size(), all.size());
    }

    std::vector<CandidateScore> scores;
    std::optional<BacktestMatrixResults> best;
    for (const auto& params : candidates) {
        BacktestMatrixResults r = validator_.evaluate(config_.strategy_id, params,
                                                      range.start, range.end,
                                                      config_.initial_capital, now);
        ++result.candidates_evaluated;
        scores.push_back(CandidateScore{params, r.mean_oos_sharpe});
        logger()->debug("Candidate {}: mean OOS Sharpe {:.3f}, {}",
                        result.candidates_evaluated, r.mean_oos_sharpe,
                        r.passed ? "passed" : "rejected");

        if (r.passed && (!best || r.mean_oos_sharpe > best->mean_oos_sharpe)) {
            result.best_parameters = params;
            best = std::move(r);
        }
    }
    result.parameter_sensitivity = sensitivity(scores);

    if (!best) {
        const std::string detail = fmt::format(
            "No valid parameter combination found among {} candidates",
            result.candidates_evaluated);
        return fail(std::move(result), FailureReason::NoValidCombination, detail);
    }
    result.validation = *best;

    // Gate 2: the scheduler's own promotion criteria
    if (best->mean_oos_sharpe < config_.min_oos_sharpe ||
        best->avg_sharpe_decay > config_.max_sharpe_decay) {
        const std::string detail = fmt::format(
            "Mean OOS Sharpe {:.2f} (min {}) / Sharpe decay {:.2f} (max {})",
            best->mean_oos_sharpe, config_.min_oos_sharpe,
            best->avg_sharpe_decay, config_.max_sharpe_decay);
        return fail(std::move(result), FailureReason::ValidationCriteria, detail);
    }
    result.validation_passed = true;

    const auto current = versions_.active(config_.strategy_id);
    if (current) {
        // Gate 3: bounded parameter drift
        result.parameter_changes = parameter_changes(current->parameters, result.best_parameters);
        for (const auto& [name, change] : result.parameter_changes) {
            if (change.change_pct > config_.max_parameter_change_pct) {
                const std::string detail = fmt::format(
                    "Parameter {} change {:.1f}% exceeds max {}%",
                    name, change.change_pct, config_.max_parameter_change_pct);
                return fail(std::move(result), FailureReason::ParameterBoundExceeded, detail);
            }
        }

        // Gate 4: material improvement over the active version
        if (config_.require_improvement) {
            const double cur = current->validation.mean_oos_sharpe;
            const double improvement = cur > 0.0
                ? (best->mean_oos_sharpe - cur) / cur * 100.0
                : 100.0;
            if (improvement < config_.min_improvement_pct) {
                const std::string detail = fmt::format(
                    "Improvement {:.1f}% < minimum {}%",
                    improvement, config_.min_improvement_pct);
                return fail(std::move(result), FailureReason::InsufficientImprovement, detail);
            }
        }
    } else {
        result.parameter_changes = parameter_changes(ParameterSet{}, result.best_parameters);
    }

    // Everything that can throw happens before the version store is touched.
    if (config_.auto_rollback_days <= 0) {
        throw std::invalid_argument(fmt::format(
            "auto_rollback_days must be positive, got {}", config_.auto_rollback_days));
    }
    const std::string run_stamp = dates::format_timestamp(now);
    const std::string deadline  = dates::format_timestamp(
        now + boost::gregorian::days(config_.auto_rollback_days));

    // Promotion
    const auto created = versions_.promote(config_.strategy_id, result.best_parameters, *best, now);
    if (!created) {
        return fail(std::move(result), FailureReason::Exception,
                    "exception: failed to persist new model version");
    }

    if (!tracker_.record_expectation(config_.strategy_id,
                                     best->mean_oos_sharpe,
                                     best->mean_oos_return,
                                     best->mean_oos_max_drawdown,
                                     best->evaluation_date,
                                     created->version_id)) {
        logger()->warn("Expectation for {} not recorded; confirmation will fail closed",
                       created->version_id);
    }

    state_.last_run = run_stamp;
    state_.pending  = PendingConfirmation{
        .version_id       = created->version_id,
        .previous_version = result.previous_version,
        .deadline         = deadline,
    };

    result.status      = OptimizationStatus::Passed;
    result.new_version = created->version_id;
    logger()->info("Optimization {} PASSED: new version {} created (previous {})",
                   result.optimization_id, created->version_id, result.previous_version);
    return result;
}

// ─── Probation ────────────────────────────────────────────────────────────────

ConfirmationOutcome
ReOptimizationScheduler::check_pending_confirmation(const dates::Timestamp& now) {
    std::lock_guard<std::mutex> lock(mutex_);

    ConfirmationOutcome out;
    if (!state_.pending) return out;

    const PendingConfirmation pending = *state_.pending;
    out.version_id = pending.version_id;

    const auto deadline = dates::parse_timestamp(pending.deadline);
    if (!deadline) {
        out.status  = ConfirmationStatus::Error;
        out.message = fmt::format("Unreadable confirmation deadline '{}'", pending.deadline);
        return out;
    }

    if (now < *deadline) {
        out.status         = ConfirmationStatus::Pending;
        out.days_remaining = (*deadline - now).hours() / 24;
        out.message        = fmt::format("{} days remaining", out.days_remaining);
        return out;
    }

    const auto version = versions_.find(pending.version_id);
    if (!version) {
        out.status  = ConfirmationStatus::Error;
        out.message = fmt::format("Version {} not found", pending.version_id);
        logger()->error("{}", out.message);
        return out;
    }

    const auto live = tracker_.live_summary(config_.strategy_id, pending.version_id);
    if (!live) {
        out.status  = ConfirmationStatus::Error;
        out.message = fmt::format("Could not retrieve live metrics for {}", pending.version_id);
        logger()->warn("{}", out.message);
        return out;
    }

    out.expected_sharpe = version->validation.mean_oos_sharpe;
    out.live_sharpe     = live->mean_sharpe;
    const double divergence = out.expected_sharpe - out.live_sharpe;

    if (divergence > config_.max_sharpe_decay) {
        const std::string reason = fmt::format("Live Sharpe divergence: {:.2f}", divergence);
        if (!versions_.rollback(pending.version_id, reason, now)) {
            out.status  = ConfirmationStatus::Error;
            out.message = fmt::format("Rollback of {} failed", pending.version_id);
            logger()->error("{}", out.message);
            return out;
        }

        for (auto& entry : state_.history) {
            if (entry.new_version == pending.version_id) {
                entry.status = OptimizationStatus::RolledBack;
                entry.reason = reason;
            }
        }
        state_.pending.reset();
        persist_state();

        out.status  = ConfirmationStatus::RolledBack;
        out.message = fmt::format("Live performance diverged by {:.2f} Sharpe", divergence);
        return out;
    }

    const std::string note = fmt::format("Confirmed on {} (live Sharpe {:.2f}, expected {:.2f})",
                                         dates::format_timestamp(now),
                                         out.live_sharpe, out.expected_sharpe);
    if (!versions_.append_note(pending.version_id, note)) {
        out.status  = ConfirmationStatus::Error;
        out.message = fmt::format("Could not record confirmation of {}", pending.version_id);
        logger()->error("{}", out.message);
        return out;
    }

    state_.pending.reset();
    persist_state();

    logger()->info("Version {} confirmed after monitoring period", pending.version_id);
    out.status  = ConfirmationStatus::Confirmed;
    out.message = note;
    return out;
}

bool ReOptimizationScheduler::rollback_to(const std::string& version_id,
                                          const std::string& reason,
                                          const dates::Timestamp& now) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto target = versions_.find(version_id);
    if (!target || target->strategy_id != config_.strategy_id) {
        logger()->warn("Version {} does not belong to {}", version_id, config_.strategy_id);
        return false;
    }
    if (!versions_.rollback_to(version_id, reason, now)) {
        return false;
    }
    if (state_.pending) {
        state_.pending.reset();
        persist_state();
    }
    return true;
}

// ─── Queries ──────────────────────────────────────────────────────────────────

ParameterSet ReOptimizationScheduler::active_parameters() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto active = versions_.active(config_.strategy_id);
    return active ? active->parameters : ParameterSet{};
}

std::optional<PendingConfirmation> ReOptimizationScheduler::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.pending;
}

std::optional<dates::Timestamp> ReOptimizationScheduler::last_run() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!state_.last_run) return std::nullopt;
    return dates::parse_timestamp(*state_.last_run);
}

std::vector<OptimizationHistoryEntry> ReOptimizationScheduler::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.history;
}

}  // namespace wfv
