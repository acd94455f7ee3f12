/// @file src/validation/report.cpp
/// @brief Human-readable summary of BacktestMatrixResults.

#include "wfv/validator.hpp"
#include "wfv/dates.hpp"

#include <fmt/format.h>

#include <iterator>

namespace wfv {

std::string BacktestMatrixResults::to_string() const {
    fmt::memory_buffer out;
    auto it = std::back_inserter(out);

    fmt::format_to(it,
        "┌──────────────────────────────────────────────────────────┐\n"
        "│ Walk-Forward Matrix: {:<36}│\n"
        "│ Evaluated: {:<46}│\n"
        "├──────────────────────────────┬───────────────────────────┤\n"
        "│ Windows (completed/total)    │ {:>12} / {:<11}│\n"
        "│ Mean OOS Sharpe              │ {:>12.3f}              │\n"
        "│ Std OOS Sharpe               │ {:>12.3f}              │\n"
        "│ Mean OOS Return (%)          │ {:>12.2f}              │\n"
        "│ Mean OOS Max Drawdown (%)    │ {:>12.2f}              │\n"
        "│ Mean OOS Win Rate (%)        │ {:>12.2f}              │\n"
        "│ Sharpe Consistency           │ {:>12.2f}              │\n"
        "│ Return Consistency           │ {:>12.2f}              │\n"
        "│ Avg Sharpe Decay             │ {:>12.3f}              │\n"
        "│ Overfitting Score            │ {:>12.3f}              │\n"
        "├──────────────────────────────┴───────────────────────────┤\n",
        strategy_id, evaluation_date,
        windows.size(), windows_generated,
        mean_oos_sharpe, std_oos_sharpe, mean_oos_return,
        mean_oos_max_drawdown, mean_oos_win_rate,
        sharpe_consistency, return_consistency,
        avg_sharpe_decay, overfitting_score);

    if (!windows.empty()) {
        fmt::format_to(it, "│ {:>3}  {:<23} {:>8} {:>8} {:>8}  {:<18}\n",
                       "#", "Test period", "OOS SR", "Decay", "OOS %", "Regime");
        for (const auto& w : windows) {
            fmt::format_to(it, "│ {:>3}  {} → {} {:>8.3f} {:>8.3f} {:>8.2f}  {:<18}\n",
                           w.window_id,
                           dates::format_date(w.test.start),
                           dates::format_date(w.test.end),
                           w.out_of_sample.sharpe_ratio, w.sharpe_decay,
                           w.out_of_sample.total_return, wfv::to_string(w.regime));
        }
    }

    if (!regime_performance.empty()) {
        fmt::format_to(it, "├── Regimes ────────────────────────────────────────────────┤\n");
        for (const auto& [regime, s] : regime_performance) {
            fmt::format_to(it, "│ {:<18} n={:<3} SR={:>7.3f} ret={:>7.2f}% dd={:>6.2f}%\n",
                           wfv::to_string(regime), s.count, s.mean_sharpe,
                           s.mean_return, s.mean_drawdown);
        }
    }

    fmt::format_to(it, "├── Verdict: {:<46}┤\n", passed ? "PASSED" : "FAILED");
    for (const auto& msg : validation_messages) {
        fmt::format_to(it, "│ {}\n", msg);
    }
    fmt::format_to(it, "└──────────────────────────────────────────────────────────┘\n");

    return fmt::to_string(out);
}

}  // namespace wfv
