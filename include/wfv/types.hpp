#pragma once

/// @file include/wfv/types.hpp
/// @brief Shared value types for the walk-forward validation pipeline.
///
/// Every module includes this file. It defines the parameter-set and
/// parameter-schema types, the performance record returned by the backtest
/// collaborator, and the calendar date range used by window generation.

#include <boost/date_time/gregorian/gregorian.hpp>

#include <map>
#include <string>

namespace wfv {

// ─── Parameters ───────────────────────────────────────────────────────────────

/// A strategy parameter set: name → numeric value.
///
/// Ordered so that serialisation and equality are deterministic.
using ParameterSet = std::map<std::string, double>;

/// Numeric type of a strategy parameter.
enum class ParameterKind {
    Integer,  ///< Value must be integral (e.g. a lookback length)
    Real,     ///< Any finite value
};

/// Admissible range and numeric kind for one parameter.
struct ParameterSpec {
    ParameterKind kind      = ParameterKind::Real;
    double        min_value = 0.0;
    double        max_value = 0.0;
};

/// Schema for a strategy's parameter set: name → spec.
///
/// An empty schema admits every parameter set.
class ParameterSchema {
public:
    ParameterSchema() = default;
    explicit ParameterSchema(std::map<std::string, ParameterSpec> specs);

    /// Register or replace the spec for `name`.
    void add(const std::string& name, ParameterSpec spec);

    /// True if every entry of `params` is known, finite, in range and of the
    /// right kind.  Unknown names are rejected unless the schema is empty.
    [[nodiscard]] bool admits(const ParameterSet& params) const noexcept;

    [[nodiscard]] bool empty() const noexcept { return specs_.empty(); }
    [[nodiscard]] const std::map<std::string, ParameterSpec>& specs() const noexcept {
        return specs_;
    }

private:
    std::map<std::string, ParameterSpec> specs_;
};

// ─── Backtest Output ──────────────────────────────────────────────────────────

/// Performance of one simulated run over a date range.
///
/// Percentages are plain numbers: 12.34 means 12.34 %.
struct PerformanceRecord {
    double sharpe_ratio = 0.0;  ///< Annualised Sharpe ratio
    double total_return = 0.0;  ///< Total return, percent
    double max_drawdown = 0.0;  ///< Peak-to-trough loss, percent, ≥ 0
    double win_rate     = 0.0;  ///< Winning periods, percent
    int    trading_days = 0;    ///< Usable periods in the range
};

// ─── Calendar ─────────────────────────────────────────────────────────────────

/// An inclusive calendar date range.
struct DateRange {
    boost::gregorian::date start;
    boost::gregorian::date end;

    /// Length of the range in calendar days (end − start).
    [[nodiscard]] long span_days() const { return (end - start).days(); }
};

}  // namespace wfv
