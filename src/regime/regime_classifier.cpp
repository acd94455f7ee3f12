/// @file src/regime/regime_classifier.cpp
/// @brief Bull/bear/sideways × volatility classification of a benchmark.

#include "wfv/regime.hpp"
#include "wfv/logging.hpp"

#include <cmath>
#include <exception>
#include <string_view>
#include <utility>

namespace wfv {

// ─── Labels ───────────────────────────────────────────────────────────────────

const char* to_string(Regime r) noexcept {
    switch (r) {
        case Regime::BullLowVol:      return "bull_low_vol";
        case Regime::BullHighVol:     return "bull_high_vol";
        case Regime::BearHighVol:     return "bear_high_vol";
        case Regime::BearLowVol:      return "bear_low_vol";
        case Regime::SidewaysHighVol: return "sideways_high_vol";
        case Regime::Sideways:        return "sideways";
        case Regime::Unknown:         return "unknown";
    }
    return "unknown";
}

Regime regime_from_string(const std::string& label) noexcept {
    static constexpr std::pair<std::string_view, Regime> table[] = {
        {"bull_low_vol",      Regime::BullLowVol},
        {"bull_high_vol",     Regime::BullHighVol},
        {"bear_high_vol",     Regime::BearHighVol},
        {"bear_low_vol",      Regime::BearLowVol},
        {"sideways_high_vol", Regime::SidewaysHighVol},
        {"sideways",          Regime::Sideways},
    };
    for (const auto& [name, regime] : table) {
        if (label == name) return regime;
    }
    return Regime::Unknown;
}

bool is_bull(Regime r) noexcept {
    return r == Regime::BullLowVol || r == Regime::BullHighVol;
}

bool is_bear(Regime r) noexcept {
    return r == Regime::BearLowVol || r == Regime::BearHighVol;
}

// ─── RegimeClassifier ─────────────────────────────────────────────────────────

RegimeClassifier::RegimeClassifier(RegimeThresholds thresholds)
    : thresholds_(thresholds)
{}

RegimeClassifier::RegimeClassifier(BenchmarkProvider& provider,
                                   std::string symbol,
                                   RegimeThresholds thresholds)
    : provider_(&provider)
    , symbol_(std::move(symbol))
    , thresholds_(thresholds)
{}

Regime RegimeClassifier::classify(double period_return,
                                  double annualised_volatility) const noexcept {
    if (!std::isfinite(period_return) || !std::isfinite(annualised_volatility)) {
        return Regime::Unknown;
    }

    const double r = thresholds_.return_threshold;
    const double v = thresholds_.volatility_threshold;

    if (period_return > r) {
        return annualised_volatility < v ? Regime::BullLowVol : Regime::BullHighVol;
    }
    if (period_return < -r) {
        return annualised_volatility >= v ? Regime::BearHighVol : Regime::BearLowVol;
    }
    if (annualised_volatility >= thresholds_.sideways_volatility_threshold) {
        return Regime::SidewaysHighVol;
    }
    return Regime::Sideways;
}

Regime
RegimeClassifier::classify_prices(std::span<const double> closes) const noexcept {
    if (closes.size() < 2) return Regime::Unknown;
    for (double c : closes) {
        if (!std::isfinite(c) || c <= 0.0) return Regime::Unknown;
    }

    const double period_return = closes.back() / closes.front() - 1.0;

    // Sample std-dev of simple returns; a single return has zero dispersion.
    const std::size_t n = closes.size() - 1;
    double sum = 0.0;
    for (std::size_t i = 1; i < closes.size(); ++i) {
        sum += closes[i] / closes[i - 1] - 1.0;
    }
    const double mu = sum / static_cast<double>(n);

    double sq_sum = 0.0;
    for (std::size_t i = 1; i < closes.size(); ++i) {
        const double d = (closes[i] / closes[i - 1] - 1.0) - mu;
        sq_sum += d * d;
    }
    const double sd = (n > 1) ? std::sqrt(sq_sum / static_cast<double>(n - 1)) : 0.0;

    return classify(period_return, sd * std::sqrt(thresholds_.annualisation));
}

Regime RegimeClassifier::classify_period(const DateRange& range) const noexcept {
    if (provider_ == nullptr) return Regime::Unknown;

    try {
        const auto closes = provider_->history(symbol_, range.start, range.end);
        if (closes.empty()) {
            logger()->debug("No benchmark data for {} between {} and {}",
                            symbol_,
                            boost::gregorian::to_iso_extended_string(range.start),
                            boost::gregorian::to_iso_extended_string(range.end));
            return Regime::Unknown;
        }
        return classify_prices(closes);
    } catch (const std::exception& ex) {
        logger()->debug("Regime detection failed for {}: {}", symbol_, ex.what());
        return Regime::Unknown;
    }
}

}  // namespace wfv
