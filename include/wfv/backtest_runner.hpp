#pragma once

/// @file include/wfv/backtest_runner.hpp
/// @brief Interface to the external backtest execution engine.
///
/// The simulation itself lives outside this library.  Implementations must be
/// idempotent: identical inputs produce identical records, with no effect on
/// other calls.  Latency and timeouts are the implementation's concern.

#include "wfv/types.hpp"

#include <optional>
#include <string>

namespace wfv {

class BacktestRunner {
public:
    virtual ~BacktestRunner() = default;

    /// Simulate `strategy_id` with `params` over [start_date, end_date].
    ///
    /// # Arguments
    /// * `start_date`, `end_date` — ISO-8601 dates (`YYYY-MM-DD`)
    /// * `initial_capital`        — starting equity
    ///
    /// # Returns
    /// The performance record, or `nullopt` if the simulation could not run.
    /// Implementations may also throw `std::exception`; callers treat both
    /// the same way.
    [[nodiscard]] virtual std::optional<PerformanceRecord>
    run(const std::string& strategy_id,
        const ParameterSet& params,
        const std::string& start_date,
        const std::string& end_date,
        double initial_capital) = 0;
};

}  // namespace wfv
