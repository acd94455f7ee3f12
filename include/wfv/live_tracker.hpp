#pragma once

/// @file include/wfv/live_tracker.hpp
/// @brief Live trading performance versus backtest expectations.
///
/// # Module: LiveVsBacktestTracker
///
/// ## Divergence
///   sharpe_divergence   = expected_sharpe − live_sharpe
///   return_divergence   = expected_return − live_return        (points)
///   drawdown_divergence = live_drawdown  − expected_drawdown   (points)
///
/// Drawdown is signed the other way because a live drawdown deeper than
/// expected is the dangerous direction.
///
/// ## Alert Levels
///   CRITICAL  drawdown divergence > 10 points
///   WARNING   Sharpe divergence > 0.5, or return divergence > 20 points
///   OK        otherwise

#include "wfv/constants.hpp"
#include "wfv/json_store.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace wfv {

enum class AlertLevel {
    Ok,
    Warning,
    Critical,
};

[[nodiscard]] const char* to_string(AlertLevel level) noexcept;
[[nodiscard]] AlertLevel alert_level_from_string(const std::string& s) noexcept;

enum class Trend {
    Improving,
    Deteriorating,
    InsufficientData,
};

[[nodiscard]] const char* to_string(Trend trend) noexcept;

/// Performance claimed by a validation run.
struct Expectation {
    std::string date;        ///< Evaluation date, ISO-8601
    std::string version_id;  ///< Model version the claim belongs to; may be empty
    double expected_sharpe       = 0.0;
    double expected_return       = 0.0;  ///< percent
    double expected_max_drawdown = 0.0;  ///< percent
};

/// One period of live performance with its divergence from the expectation
/// it was compared against.
struct LiveRecord {
    std::string period_start;
    std::string period_end;
    std::string expectation_version;  ///< `version_id` of the expectation used
    double live_sharpe       = 0.0;
    double live_return       = 0.0;
    double live_max_drawdown = 0.0;
    double sharpe_divergence   = 0.0;
    double return_divergence   = 0.0;
    double drawdown_divergence = 0.0;
    AlertLevel alert_level = AlertLevel::Ok;
    std::vector<std::string> alerts;
};

struct DivergenceReport {
    std::string strategy_id;
    std::size_t periods_recorded = 0;
    double avg_sharpe_divergence   = 0.0;  ///< over the last 10 records
    double avg_return_divergence   = 0.0;
    double avg_drawdown_divergence = 0.0;
    Trend trend = Trend::InsufficientData;
    std::vector<LiveRecord> recent_alerts;  ///< WARNING/CRITICAL among the last 10
};

/// Mean live performance observed while a version was on probation.
struct LiveSummary {
    std::size_t periods = 0;
    double mean_sharpe = 0.0;
    double mean_return = 0.0;
    double max_drawdown = 0.0;
};

struct TrackerConfig {
    double sharpe_divergence_threshold   = constants::DEFAULT_SHARPE_DIVERGENCE;
    double return_divergence_threshold   = constants::DEFAULT_RETURN_DIVERGENCE_PCT;
    double drawdown_divergence_threshold = constants::DEFAULT_DRAWDOWN_DIVERGENCE_PCT;
};

class LiveVsBacktestTracker {
public:
    explicit LiveVsBacktestTracker(std::string path,
                                   TrackerConfig config = TrackerConfig{});

    /// Append an expectation.  Returns false if persisting failed.
    bool record_expectation(const std::string& strategy_id,
                            double expected_sharpe,
                            double expected_return,
                            double expected_max_drawdown,
                            const std::string& evaluation_date,
                            const std::string& version_id = "");

    /// Compare live performance with the latest expectation and persist it.
    ///
    /// # Returns
    /// The stored record, or `nullopt` if no expectation exists for the
    /// strategy or persisting failed.
    std::optional<LiveRecord>
    record_live(const std::string& strategy_id,
                double live_sharpe,
                double live_return,
                double live_max_drawdown,
                const std::string& period_start,
                const std::string& period_end);

    /// Rolling statistics over the most recent records.
    ///
    /// # Returns
    /// `nullopt` if the strategy has no live records.
    [[nodiscard]] std::optional<DivergenceReport>
    divergence_report(const std::string& strategy_id) const;

    /// Live performance recorded against the expectation of `version_id`.
    ///
    /// # Returns
    /// `nullopt` if no such record exists.
    [[nodiscard]] std::optional<LiveSummary>
    live_summary(const std::string& strategy_id,
                 const std::string& version_id) const;

    [[nodiscard]] std::vector<Expectation>
    expectations(const std::string& strategy_id) const;

    [[nodiscard]] std::vector<LiveRecord>
    live_records(const std::string& strategy_id) const;

    /// Classify divergences into an alert level (pure).
    [[nodiscard]] AlertLevel classify(double sharpe_divergence,
                                      double return_divergence,
                                      double drawdown_divergence) const noexcept;

private:
    struct StrategyState {
        std::vector<Expectation> expectations;
        std::vector<LiveRecord>  live;
    };

    [[nodiscard]] bool persist() const;

    JsonDocumentStore store_;
    TrackerConfig     config_;
    std::map<std::string, StrategyState> state_;
};

}  // namespace wfv
