#pragma once

/// @file include/wfv/regime.hpp
/// @brief Coarse market-regime classification of a test period.
///
/// # Module: RegimeClassifier
///
/// ## Responsibility
/// Label a date range as bull/bear/sideways × low/high volatility from a
/// benchmark close series:
///
///     period_return = close_last / close_first − 1
///     volatility    = σ(simple returns) · √252
///
///     return >  +r, vol <  v   → bull_low_vol
///     return >  +r, vol ≥  v   → bull_high_vol
///     return <  −r, vol ≥  v   → bear_high_vol
///     return <  −r, vol <  v   → bear_low_vol
///     |return| ≤ r, vol ≥ v_s  → sideways_high_vol
///     otherwise                → sideways
///
/// ## Guarantees
/// - Never throws: missing or unusable data yields `Regime::Unknown`

#include "wfv/constants.hpp"
#include "wfv/types.hpp"

#include <optional>
#include <span>
#include <string>
#include <vector>

namespace wfv {

// ─── Regime ───────────────────────────────────────────────────────────────────

enum class Regime {
    BullLowVol,
    BullHighVol,
    BearHighVol,
    BearLowVol,
    SidewaysHighVol,
    Sideways,
    Unknown,
};

/// Snake-case label, e.g. `bull_low_vol`.
[[nodiscard]] const char* to_string(Regime r) noexcept;

/// Inverse of `to_string`.  Unrecognised labels map to `Regime::Unknown`.
[[nodiscard]] Regime regime_from_string(const std::string& label) noexcept;

/// True for BullLowVol / BullHighVol.
[[nodiscard]] bool is_bull(Regime r) noexcept;

/// True for BearLowVol / BearHighVol.
[[nodiscard]] bool is_bear(Regime r) noexcept;

// ─── BenchmarkProvider ────────────────────────────────────────────────────────

/// Source of benchmark close prices (external collaborator).
class BenchmarkProvider {
public:
    virtual ~BenchmarkProvider() = default;

    /// Ordered close prices of `symbol` within [start, end].
    /// An empty result means "no data"; the classifier treats it as unknown.
    [[nodiscard]] virtual std::vector<double>
    history(const std::string& symbol,
            const boost::gregorian::date& start,
            const boost::gregorian::date& end) = 0;
};

// ─── RegimeClassifier ─────────────────────────────────────────────────────────

struct RegimeThresholds {
    double return_threshold              = constants::DEFAULT_REGIME_RETURN_THRESHOLD;
    double volatility_threshold          = constants::DEFAULT_REGIME_VOL_THRESHOLD;
    double sideways_volatility_threshold = constants::DEFAULT_SIDEWAYS_VOL_THRESHOLD;
    double annualisation                 = constants::ANNUALISATION_FACTOR;
};

class RegimeClassifier {
public:
    /// Construct without a provider: only `classify_prices` is meaningful;
    /// `classify_period` always returns `Unknown`.
    explicit RegimeClassifier(RegimeThresholds thresholds = RegimeThresholds{});

    /// Construct over a benchmark provider.  `provider` must outlive this.
    RegimeClassifier(BenchmarkProvider& provider,
                     std::string symbol = constants::DEFAULT_BENCHMARK_SYMBOL,
                     RegimeThresholds thresholds = RegimeThresholds{});

    /// Classify from period return and annualised volatility (fractions).
    [[nodiscard]] Regime classify(double period_return,
                                  double annualised_volatility) const noexcept;

    /// Classify an ordered close series.
    ///
    /// # Returns
    /// `Unknown` for fewer than 2 closes or any non-finite / non-positive
    /// price.
    [[nodiscard]] Regime
    classify_prices(std::span<const double> closes) const noexcept;

    /// Fetch the benchmark series for `range` and classify it.
    [[nodiscard]] Regime classify_period(const DateRange& range) const noexcept;

    [[nodiscard]] const RegimeThresholds& thresholds() const noexcept {
        return thresholds_;
    }

private:
    BenchmarkProvider* provider_ = nullptr;  ///< Non-owning, optional
    std::string        symbol_;
    RegimeThresholds   thresholds_;
};

}  // namespace wfv
