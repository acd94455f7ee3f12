#pragma once

/// @file include/wfv/parameter_grid.hpp
/// @brief Enumerable parameter grids, change bounds and sensitivity.
///
/// ## Parameter Change
///   change_pct = |new − old| / |old| · 100
///   old missing        → 100
///   old = 0, new ≠ 0   → 100
///   old = 0, new = 0   → 0
///
/// ## Sensitivity
/// For each parameter, candidates are grouped by the parameter's value and
/// the mean OOS Sharpe of each group is computed.  The score is the spread
/// of those means relative to their mean magnitude, clamped to [0, 1]:
///
///   score = clamp((max − min) / (|mean| + ε), 0, 1)
///
/// A parameter is robust when its score is below 0.5.

#include "wfv/types.hpp"

#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace wfv {

/// Candidate values per parameter name.
using ParameterGrid = std::map<std::string, std::vector<double>>;

/// Cartesian product of `grid`.  The first parameter (in name order) varies
/// slowest.  An empty grid, or any parameter with no values, yields nothing.
[[nodiscard]] std::vector<ParameterSet> expand(const ParameterGrid& grid);

/// Keep only the candidates admitted by `schema`, preserving order.
[[nodiscard]] std::vector<ParameterSet>
filter_admitted(const std::vector<ParameterSet>& candidates,
                const ParameterSchema& schema);

struct ParameterChange {
    std::optional<double> old_value;
    double                new_value  = 0.0;
    double                change_pct = 0.0;
};

/// One entry per parameter of `next`.
[[nodiscard]] std::map<std::string, ParameterChange>
parameter_changes(const ParameterSet& current, const ParameterSet& next);

/// Percent change of a single value (see file header).
[[nodiscard]] double change_pct(std::optional<double> old_value,
                                double new_value) noexcept;

/// A candidate and the mean OOS Sharpe it achieved.
struct CandidateScore {
    ParameterSet params;
    double       mean_oos_sharpe = 0.0;
};

struct ParameterSensitivity {
    std::string         name;
    std::vector<double> values;       ///< Distinct values, ascending
    std::vector<double> mean_sharpes; ///< Aligned with `values`
    double optimal_value     = 0.0;   ///< Value with the highest mean Sharpe
    double sensitivity_score = 0.0;   ///< ∈ [0, 1]
    bool   is_robust         = true;
};

/// Sensitivity of each parameter that takes at least two distinct values.
[[nodiscard]] std::vector<ParameterSensitivity>
sensitivity(std::span<const CandidateScore> scores);

}  // namespace wfv
