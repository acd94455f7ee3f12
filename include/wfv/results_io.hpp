#pragma once

/// @file include/wfv/results_io.hpp
/// @brief JSON export / import of walk-forward results.
///
/// The exported document carries every aggregate of BacktestMatrixResults
/// and, per window, its period boundaries, IS/OOS Sharpe, decay, OOS return,
/// drawdown, win rate and regime: enough to rebuild the summary table
/// without re-running the evaluation.

#include "wfv/validator.hpp"

#include <json/json.h>

#include <optional>
#include <string>

namespace wfv {

[[nodiscard]] Json::Value to_json(const BacktestMatrixResults& results);

/// Rebuild results from an exported document.  Missing fields keep their
/// defaults; a non-object document yields `nullopt`.
[[nodiscard]] std::optional<BacktestMatrixResults>
results_from_json(const Json::Value& doc);

[[nodiscard]] Json::Value to_json(const ParameterSet& params);
[[nodiscard]] ParameterSet parameters_from_json(const Json::Value& doc);

/// Write the exported document to `path` (atomic replace).
[[nodiscard]] bool save_results(const BacktestMatrixResults& results,
                                const std::string& path);

/// Load a document written by `save_results`.
[[nodiscard]] std::optional<BacktestMatrixResults>
load_results(const std::string& path);

}  // namespace wfv
