/// @file src/tracking/live_tracker.cpp
/// @brief LiveVsBacktestTracker implementation.

#include "wfv/live_tracker.hpp"
#include "wfv/logging.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <span>
#include <utility>

namespace wfv {

// ─── Enumerations ─────────────────────────────────────────────────────────────

const char* to_string(AlertLevel level) noexcept {
    switch (level) {
        case AlertLevel::Ok:       return "OK";
        case AlertLevel::Warning:  return "WARNING";
        case AlertLevel::Critical: return "CRITICAL";
    }
    return "OK";
}

AlertLevel alert_level_from_string(const std::string& s) noexcept {
    if (s == "WARNING")  return AlertLevel::Warning;
    if (s == "CRITICAL") return AlertLevel::Critical;
    return AlertLevel::Ok;
}

const char* to_string(Trend trend) noexcept {
    switch (trend) {
        case Trend::Improving:        return "improving";
        case Trend::Deteriorating:    return "deteriorating";
        case Trend::InsufficientData: return "insufficient_data";
    }
    return "insufficient_data";
}

// ─── Encoding ─────────────────────────────────────────────────────────────────

namespace {

double number_of(const Json::Value& v, const char* key) {
    const Json::Value& x = v[key];
    return x.isNumeric() ? x.asDouble() : 0.0;
}

std::string text_of(const Json::Value& v, const char* key) {
    const Json::Value& x = v[key];
    return x.isString() ? x.asString() : std::string{};
}

Json::Value encode(const Expectation& e) {
    Json::Value v(Json::objectValue);
    v["date"]                  = e.date;
    v["version_id"]            = e.version_id;
    v["expected_sharpe"]       = e.expected_sharpe;
    v["expected_return"]       = e.expected_return;
    v["expected_max_drawdown"] = e.expected_max_drawdown;
    return v;
}

Expectation decode_expectation(const Json::Value& v) {
    Expectation e;
    e.date                  = text_of(v, "date");
    e.version_id            = text_of(v, "version_id");
    e.expected_sharpe       = number_of(v, "expected_sharpe");
    e.expected_return       = number_of(v, "expected_return");
    e.expected_max_drawdown = number_of(v, "expected_max_drawdown");
    return e;
}

Json::Value encode(const LiveRecord& r) {
    Json::Value v(Json::objectValue);
    v["period_start"]        = r.period_start;
    v["period_end"]          = r.period_end;
    v["expectation_version"] = r.expectation_version;
    v["live_sharpe"]         = r.live_sharpe;
    v["live_return"]         = r.live_return;
    v["live_max_drawdown"]   = r.live_max_drawdown;
    v["sharpe_divergence"]   = r.sharpe_divergence;
    v["return_divergence"]   = r.return_divergence;
    v["drawdown_divergence"] = r.drawdown_divergence;
    v["alert_level"]         = to_string(r.alert_level);
    Json::Value alerts(Json::arrayValue);
    for (const auto& a : r.alerts) alerts.append(a);
    v["alerts"] = alerts;
    return v;
}

LiveRecord decode_live(const Json::Value& v) {
    LiveRecord r;
    r.period_start        = text_of(v, "period_start");
    r.period_end          = text_of(v, "period_end");
    r.expectation_version = text_of(v, "expectation_version");
    r.live_sharpe         = number_of(v, "live_sharpe");
    r.live_return         = number_of(v, "live_return");
    r.live_max_drawdown   = number_of(v, "live_max_drawdown");
    r.sharpe_divergence   = number_of(v, "sharpe_divergence");
    r.return_divergence   = number_of(v, "return_divergence");
    r.drawdown_divergence = number_of(v, "drawdown_divergence");
    r.alert_level         = alert_level_from_string(text_of(v, "alert_level"));
    for (const auto& a : v["alerts"]) {
        if (a.isString()) r.alerts.push_back(a.asString());
    }
    return r;
}

double mean_of(std::span<const LiveRecord> records, double LiveRecord::*field) {
    if (records.empty()) return 0.0;
    double sum = 0.0;
    for (const auto& r : records) sum += r.*field;
    return sum / static_cast<double>(records.size());
}

}  // namespace

// ─── Construction ─────────────────────────────────────────────────────────────

LiveVsBacktestTracker::LiveVsBacktestTracker(std::string path, TrackerConfig config)
    : store_(std::move(path))
    , config_(config)
{
    const Json::Value doc = store_.load();
    for (const auto& strategy : doc.getMemberNames()) {
        const Json::Value& s = doc[strategy];
        if (!s.isObject()) continue;

        StrategyState st;
        for (const auto& e : s["expectations"]) {
            if (e.isObject()) st.expectations.push_back(decode_expectation(e));
        }
        for (const auto& r : s["live_performance"]) {
            if (r.isObject()) st.live.push_back(decode_live(r));
        }
        state_.emplace(strategy, std::move(st));
    }
}

bool LiveVsBacktestTracker::persist() const {
    Json::Value doc(Json::objectValue);
    for (const auto& [strategy, st] : state_) {
        Json::Value s(Json::objectValue);
        Json::Value exps(Json::arrayValue);
        for (const auto& e : st.expectations) exps.append(encode(e));
        Json::Value live(Json::arrayValue);
        for (const auto& r : st.live) live.append(encode(r));
        s["expectations"]     = exps;
        s["live_performance"] = live;
        doc[strategy] = s;
    }
    return store_.save(doc);
}

// ─── Recording ────────────────────────────────────────────────────────────────

bool LiveVsBacktestTracker::record_expectation(const std::string& strategy_id,
                                               double expected_sharpe,
                                               double expected_return,
                                               double expected_max_drawdown,
                                               const std::string& evaluation_date,
                                               const std::string& version_id) {
    auto& st = state_[strategy_id];
    st.expectations.push_back(Expectation{
        .date                  = evaluation_date,
        .version_id            = version_id,
        .expected_sharpe       = expected_sharpe,
        .expected_return       = expected_return,
        .expected_max_drawdown = expected_max_drawdown,
    });

    if (!persist()) {
        st.expectations.pop_back();
        logger()->error("Failed to persist expectation for {}", strategy_id);
        return false;
    }
    return true;
}

AlertLevel LiveVsBacktestTracker::classify(double sharpe_divergence,
                                           double return_divergence,
                                           double drawdown_divergence) const noexcept {
    if (drawdown_divergence > config_.drawdown_divergence_threshold) {
        return AlertLevel::Critical;
    }
    if (sharpe_divergence > config_.sharpe_divergence_threshold ||
        return_divergence > config_.return_divergence_threshold) {
        return AlertLevel::Warning;
    }
    return AlertLevel::Ok;
}

std::optional<LiveRecord>
LiveVsBacktestTracker::record_live(const std::string& strategy_id,
                                   double live_sharpe,
                                   double live_return,
                                   double live_max_drawdown,
                                   const std::string& period_start,
                                   const std::string& period_end) {
    const auto it = state_.find(strategy_id);
    if (it == state_.end() || it->second.expectations.empty()) {
        logger()->warn("No backtest expectation recorded for {}", strategy_id);
        return std::nullopt;
    }
    StrategyState& st = it->second;
    const Expectation& exp = st.expectations.back();

    LiveRecord r;
    r.period_start        = period_start;
    r.period_end          = period_end;
    r.expectation_version = exp.version_id;
    r.live_sharpe         = live_sharpe;
    r.live_return         = live_return;
    r.live_max_drawdown   = live_max_drawdown;
    r.sharpe_divergence   = exp.expected_sharpe - live_sharpe;
    r.return_divergence   = exp.expected_return - live_return;
    r.drawdown_divergence = live_max_drawdown - exp.expected_max_drawdown;
    r.alert_level = classify(r.sharpe_divergence, r.return_divergence, r.drawdown_divergence);

    if (r.sharpe_divergence > config_.sharpe_divergence_threshold) {
        r.alerts.push_back(fmt::format("Sharpe divergence: {:.2f}", r.sharpe_divergence));
    }
    if (r.return_divergence > config_.return_divergence_threshold) {
        r.alerts.push_back(fmt::format("Return divergence: {:.1f}%", r.return_divergence));
    }
    if (r.drawdown_divergence > config_.drawdown_divergence_threshold) {
        r.alerts.push_back(fmt::format("Drawdown divergence: {:.1f}%", r.drawdown_divergence));
    }

    st.live.push_back(r);
    if (!persist()) {
        st.live.pop_back();
        logger()->error("Failed to persist live performance for {}", strategy_id);
        return std::nullopt;
    }

    if (r.alert_level != AlertLevel::Ok) {
        logger()->warn("Live vs backtest divergence for {}: {} - {}",
                       strategy_id, to_string(r.alert_level), fmt::join(r.alerts, ", "));
    }
    return r;
}

// ─── Reporting ────────────────────────────────────────────────────────────────

std::optional<DivergenceReport>
LiveVsBacktestTracker::divergence_report(const std::string& strategy_id) const {
    const auto it = state_.find(strategy_id);
    if (it == state_.end() || it->second.live.empty()) {
        return std::nullopt;
    }
    const std::vector<LiveRecord>& live = it->second.live;
    const std::size_t n = live.size();

    const std::size_t window = std::min(n, constants::DIVERGENCE_REPORT_WINDOW);
    const std::span<const LiveRecord> recent(live.data() + (n - window), window);

    DivergenceReport report;
    report.strategy_id             = strategy_id;
    report.periods_recorded        = n;
    report.avg_sharpe_divergence   = mean_of(recent, &LiveRecord::sharpe_divergence);
    report.avg_return_divergence   = mean_of(recent, &LiveRecord::return_divergence);
    report.avg_drawdown_divergence = mean_of(recent, &LiveRecord::drawdown_divergence);

    constexpr std::size_t half = constants::DIVERGENCE_TREND_WINDOW;
    if (n >= half) {
        const std::span<const LiveRecord> last(live.data() + (n - half), half);
        // With fewer than two full halves, the baseline is the first records.
        const std::span<const LiveRecord> older =
            n >= 2 * half ? std::span<const LiveRecord>(live.data() + (n - 2 * half), half)
                          : std::span<const LiveRecord>(live.data(), half);
        const double delta = mean_of(last, &LiveRecord::sharpe_divergence)
                           - mean_of(older, &LiveRecord::sharpe_divergence);
        report.trend = delta < 0.0 ? Trend::Improving : Trend::Deteriorating;
    }

    for (const auto& r : recent) {
        if (r.alert_level != AlertLevel::Ok) report.recent_alerts.push_back(r);
    }
    return report;
}

std::optional<LiveSummary>
LiveVsBacktestTracker::live_summary(const std::string& strategy_id,
                                    const std::string& version_id) const {
    const auto it = state_.find(strategy_id);
    if (it == state_.end()) return std::nullopt;

    LiveSummary summary;
    double sharpe_sum = 0.0;
    double return_sum = 0.0;
    for (const auto& r : it->second.live) {
        if (r.expectation_version != version_id) continue;
        sharpe_sum += r.live_sharpe;
        return_sum += r.live_return;
        summary.max_drawdown = summary.periods == 0
            ? r.live_max_drawdown
            : std::max(summary.max_drawdown, r.live_max_drawdown);
        ++summary.periods;
    }
    if (summary.periods == 0) return std::nullopt;

    summary.mean_sharpe = sharpe_sum / static_cast<double>(summary.periods);
    summary.mean_return = return_sum / static_cast<double>(summary.periods);
    return summary;
}

std::vector<Expectation>
LiveVsBacktestTracker::expectations(const std::string& strategy_id) const {
    const auto it = state_.find(strategy_id);
    return it == state_.end() ? std::vector<Expectation>{} : it->second.expectations;
}

std::vector<LiveRecord>
LiveVsBacktestTracker::live_records(const std::string& strategy_id) const {
    const auto it = state_.find(strategy_id);
    return it == state_.end() ? std::vector<LiveRecord>{} : it->second.live;
}

}  // namespace wfv
