/// @file src/validation/results_io.cpp
/// @brief JSON export / import of walk-forward results (jsoncpp).

#include "wfv/results_io.hpp"
#include "wfv/json_store.hpp"
#include "wfv/logging.hpp"

#include <fstream>
#include <utility>

namespace wfv {

namespace {

[[nodiscard]] double number(const Json::Value& v, const char* key, double fallback = 0.0) {
    const Json::Value& x = v[key];
    return x.isNumeric() ? x.asDouble() : fallback;
}

[[nodiscard]] std::string text(const Json::Value& v, const char* key) {
    const Json::Value& x = v[key];
    return x.isString() ? x.asString() : std::string{};
}

[[nodiscard]] bool flag(const Json::Value& v, const char* key) {
    const Json::Value& x = v[key];
    return x.isBool() && x.asBool();
}

[[nodiscard]] Json::Value range_to_json(const DateRange& r) {
    Json::Value v(Json::objectValue);
    v["start"] = dates::format_date(r.start);
    v["end"]   = dates::format_date(r.end);
    return v;
}

[[nodiscard]] DateRange range_from_json(const Json::Value& v) {
    DateRange r;
    if (auto d = dates::parse_date(text(v, "start"))) r.start = *d;
    if (auto d = dates::parse_date(text(v, "end")))   r.end   = *d;
    return r;
}

}  // namespace

// ─── ParameterSet ─────────────────────────────────────────────────────────────

Json::Value to_json(const ParameterSet& params) {
    Json::Value v(Json::objectValue);
    for (const auto& [name, value] : params) {
        v[name] = value;
    }
    return v;
}

ParameterSet parameters_from_json(const Json::Value& doc) {
    ParameterSet params;
    if (!doc.isObject()) return params;
    for (const auto& name : doc.getMemberNames()) {
        if (doc[name].isNumeric()) {
            params[name] = doc[name].asDouble();
        }
    }
    return params;
}

// ─── BacktestMatrixResults ────────────────────────────────────────────────────

Json::Value to_json(const BacktestMatrixResults& r) {
    Json::Value v(Json::objectValue);
    v["strategy_name"]         = r.strategy_id;
    v["evaluation_date"]       = r.evaluation_date;
    v["total_windows"]         = static_cast<Json::UInt64>(r.windows.size());
    v["windows_generated"]     = static_cast<Json::UInt64>(r.windows_generated);
    v["mean_oos_sharpe"]       = r.mean_oos_sharpe;
    v["std_oos_sharpe"]        = r.std_oos_sharpe;
    v["mean_oos_return"]       = r.mean_oos_return;
    v["mean_oos_max_drawdown"] = r.mean_oos_max_drawdown;
    v["mean_oos_win_rate"]     = r.mean_oos_win_rate;
    v["sharpe_consistency"]    = r.sharpe_consistency;
    v["return_consistency"]    = r.return_consistency;
    v["avg_sharpe_decay"]      = r.avg_sharpe_decay;
    v["overfitting_score"]     = r.overfitting_score;
    v["insufficient_data"]     = r.insufficient_data;
    v["passed_validation"]     = r.passed;

    Json::Value regimes(Json::objectValue);
    for (const auto& [regime, s] : r.regime_performance) {
        Json::Value g(Json::objectValue);
        g["count"]         = static_cast<Json::UInt64>(s.count);
        g["mean_sharpe"]   = s.mean_sharpe;
        g["mean_return"]   = s.mean_return;
        g["mean_drawdown"] = s.mean_drawdown;
        g["mean_win_rate"] = s.mean_win_rate;
        regimes[to_string(regime)] = g;
    }
    v["regime_performance"] = regimes;

    Json::Value messages(Json::arrayValue);
    for (const auto& m : r.validation_messages) messages.append(m);
    v["validation_messages"] = messages;

    Json::Value windows(Json::arrayValue);
    for (const auto& w : r.windows) {
        Json::Value wj(Json::objectValue);
        wj["window_id"]        = w.window_id;
        wj["train_period"]     = range_to_json(w.train);
        wj["test_period"]      = range_to_json(w.test);
        wj["train_days"]       = w.train_periods;
        wj["test_days"]        = w.test_periods;
        wj["is_sharpe"]        = w.in_sample.sharpe_ratio;
        wj["is_return"]        = w.in_sample.total_return;
        wj["oos_sharpe"]       = w.out_of_sample.sharpe_ratio;
        wj["oos_return"]       = w.out_of_sample.total_return;
        wj["oos_max_drawdown"] = w.out_of_sample.max_drawdown;
        wj["oos_win_rate"]     = w.out_of_sample.win_rate;
        wj["sharpe_decay"]     = w.sharpe_decay;
        wj["return_decay"]     = w.return_decay;
        wj["regime"]           = to_string(w.regime);
        wj["params"]           = to_json(w.params);
        windows.append(wj);
    }
    v["windows"] = windows;
    return v;
}

std::optional<BacktestMatrixResults> results_from_json(const Json::Value& v) {
    if (!v.isObject()) return std::nullopt;

    BacktestMatrixResults r;
    r.strategy_id           = text(v, "strategy_name");
    r.evaluation_date       = text(v, "evaluation_date");
    r.mean_oos_sharpe       = number(v, "mean_oos_sharpe");
    r.std_oos_sharpe        = number(v, "std_oos_sharpe");
    r.mean_oos_return       = number(v, "mean_oos_return");
    r.mean_oos_max_drawdown = number(v, "mean_oos_max_drawdown");
    r.mean_oos_win_rate     = number(v, "mean_oos_win_rate");
    r.sharpe_consistency    = number(v, "sharpe_consistency");
    r.return_consistency    = number(v, "return_consistency");
    r.avg_sharpe_decay      = number(v, "avg_sharpe_decay");
    r.overfitting_score     = number(v, "overfitting_score");
    r.insufficient_data     = flag(v, "insufficient_data");
    r.passed                = flag(v, "passed_validation");

    const Json::Value& regimes = v["regime_performance"];
    if (regimes.isObject()) {
        for (const auto& label : regimes.getMemberNames()) {
            const Json::Value& g = regimes[label];
            r.regime_performance[regime_from_string(label)] = RegimeStats{
                .count         = static_cast<std::size_t>(number(g, "count")),
                .mean_sharpe   = number(g, "mean_sharpe"),
                .mean_return   = number(g, "mean_return"),
                .mean_drawdown = number(g, "mean_drawdown"),
                .mean_win_rate = number(g, "mean_win_rate"),
            };
        }
    }

    for (const auto& m : v["validation_messages"]) {
        if (m.isString()) r.validation_messages.push_back(m.asString());
    }

    for (const auto& wj : v["windows"]) {
        if (!wj.isObject()) continue;
        WalkForwardWindow w;
        w.window_id                  = static_cast<int>(number(wj, "window_id"));
        w.train                      = range_from_json(wj["train_period"]);
        w.test                       = range_from_json(wj["test_period"]);
        w.train_periods              = static_cast<int>(number(wj, "train_days"));
        w.test_periods               = static_cast<int>(number(wj, "test_days"));
        w.in_sample.sharpe_ratio     = number(wj, "is_sharpe");
        w.in_sample.total_return     = number(wj, "is_return");
        w.out_of_sample.sharpe_ratio = number(wj, "oos_sharpe");
        w.out_of_sample.total_return = number(wj, "oos_return");
        w.out_of_sample.max_drawdown = number(wj, "oos_max_drawdown");
        w.out_of_sample.win_rate     = number(wj, "oos_win_rate");
        w.sharpe_decay               = number(wj, "sharpe_decay");
        w.return_decay               = number(wj, "return_decay");
        w.regime                     = regime_from_string(text(wj, "regime"));
        w.params                     = parameters_from_json(wj["params"]);
        r.windows.push_back(std::move(w));
    }

    r.windows_generated = static_cast<std::size_t>(
        number(v, "windows_generated", static_cast<double>(r.windows.size())));
    return r;
}

// ─── Files ────────────────────────────────────────────────────────────────────

bool save_results(const BacktestMatrixResults& results, const std::string& path) {
    JsonDocumentStore store(path);
    if (!store.save(to_json(results))) {
        return false;
    }
    logger()->info("Walk-forward matrix results saved to {}", path);
    return true;
}

std::optional<BacktestMatrixResults> load_results(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) return std::nullopt;

    Json::CharReaderBuilder builder;
    Json::Value doc;
    std::string errors;
    if (!Json::parseFromStream(builder, in, &doc, &errors)) {
        logger()->warn("Cannot parse results file {}: {}", path, errors);
        return std::nullopt;
    }
    return results_from_json(doc);
}

}  // namespace wfv
