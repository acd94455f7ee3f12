/// @file src/core/config.cpp
/// @brief PipelineConfig loading from JSON and the environment.

#include "wfv/config.hpp"
#include "wfv/logging.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>

namespace wfv {

namespace {

// Each helper overwrites `out` only when `key` holds a value of the right type.

void read(const Json::Value& obj, const char* key, double& out) {
    const Json::Value& v = obj[key];
    if (v.isNumeric()) out = v.asDouble();
}

void read(const Json::Value& obj, const char* key, int& out) {
    const Json::Value& v = obj[key];
    if (v.isInt()) out = v.asInt();
}

void read(const Json::Value& obj, const char* key, std::size_t& out) {
    const Json::Value& v = obj[key];
    if (v.isUInt64()) out = static_cast<std::size_t>(v.asUInt64());
}

void read(const Json::Value& obj, const char* key, bool& out) {
    const Json::Value& v = obj[key];
    if (v.isBool()) out = v.asBool();
}

void read(const Json::Value& obj, const char* key, std::string& out) {
    const Json::Value& v = obj[key];
    if (v.isString()) out = v.asString();
}

const Json::Value& section(const Json::Value& doc, const char* name) {
    static const Json::Value empty(Json::objectValue);
    const Json::Value& v = doc[name];
    return v.isObject() ? v : empty;
}

void read_windows(const Json::Value& w, WindowSpec& spec) {
    read(w, "train_days", spec.train_days);
    read(w, "test_days", spec.test_days);
    read(w, "step_days", spec.step_days);
    if (w["embargo_pct"].isNumeric()) {
        spec.embargo = Embargo::percent(w["embargo_pct"].asDouble());
    } else if (w["embargo_days"].isInt()) {
        spec.embargo = Embargo::fixed(w["embargo_days"].asInt());
    }
}

void read_schema(const Json::Value& params, ParameterSchema& schema) {
    for (const auto& name : params.getMemberNames()) {
        const Json::Value& p = params[name];
        if (!p.isObject() || !p["min"].isNumeric() || !p["max"].isNumeric()) {
            logger()->warn("Ignoring malformed bounds for parameter {}", name);
            continue;
        }
        const std::string kind = p["type"].isString() ? p["type"].asString() : "float";
        schema.add(name, ParameterSpec{
            .kind      = kind == "int" ? ParameterKind::Integer : ParameterKind::Real,
            .min_value = p["min"].asDouble(),
            .max_value = p["max"].asDouble(),
        });
    }
}

void read_scheduler(const Json::Value& s, SchedulerConfig& cfg) {
    read(s, "strategy_id", cfg.strategy_id);
    if (s["frequency"].isString()) {
        if (auto f = frequency_from_string(s["frequency"].asString())) {
            cfg.frequency = *f;
        } else {
            logger()->warn("Unknown optimization frequency '{}'; keeping {}",
                           s["frequency"].asString(), to_string(cfg.frequency));
        }
    }
    read(s, "min_days_between_runs", cfg.min_days_between_runs);
    read(s, "min_oos_sharpe", cfg.min_oos_sharpe);
    read(s, "max_sharpe_decay", cfg.max_sharpe_decay);
    read(s, "max_parameter_change_pct", cfg.max_parameter_change_pct);
    read(s, "require_improvement", cfg.require_improvement);
    read(s, "min_improvement_pct", cfg.min_improvement_pct);
    int probation_days = cfg.auto_rollback_days;
    read(s, "auto_rollback_days", probation_days);
    if (probation_days >= 1 && probation_days <= constants::MAX_AUTO_ROLLBACK_DAYS) {
        cfg.auto_rollback_days = probation_days;
    } else {
        logger()->warn("Ignoring auto_rollback_days={}: must be within [1, {}]",
                       probation_days, constants::MAX_AUTO_ROLLBACK_DAYS);
    }
    read(s, "initial_capital", cfg.initial_capital);
    read(s, "history_limit", cfg.history_limit);
    read_schema(section(s, "parameters"), cfg.schema);
}

std::optional<double> env_number(const char* name) {
    const char* raw = std::getenv(name);
    if (raw == nullptr || *raw == '\0') return std::nullopt;

    char* end = nullptr;
    errno = 0;
    const double value = std::strtod(raw, &end);
    if (errno != 0 || end == raw || *end != '\0') {
        logger()->warn("Ignoring {}='{}': not a number", name, raw);
        return std::nullopt;
    }
    return value;
}

}  // namespace

PipelineConfig config_from_json(const Json::Value& doc, PipelineConfig base) {
    if (!doc.isObject()) return base;

    read(doc, "log_level", base.log_level);
    read(doc, "state_dir", base.state_dir);
    read(doc, "benchmark_symbol", base.benchmark_symbol);

    read_windows(section(doc, "windows"), base.validator.windows);

    const Json::Value& v = section(doc, "validation");
    read(v, "min_oos_sharpe", base.validator.thresholds.min_oos_sharpe);
    read(v, "max_sharpe_decay", base.validator.thresholds.max_sharpe_decay);
    read(v, "max_oos_drawdown", base.validator.thresholds.max_oos_drawdown);
    read(v, "min_oos_win_rate", base.validator.thresholds.min_oos_win_rate);
    read(v, "min_sharpe_consistency", base.validator.thresholds.min_sharpe_consistency);
    read(v, "min_windows", base.validator.min_windows);

    read_scheduler(section(doc, "scheduler"), base.scheduler);

    const Json::Value& t = section(doc, "tracker");
    read(t, "sharpe_divergence", base.tracker.sharpe_divergence_threshold);
    read(t, "return_divergence", base.tracker.return_divergence_threshold);
    read(t, "drawdown_divergence", base.tracker.drawdown_divergence_threshold);

    const Json::Value& r = section(doc, "regime");
    read(r, "return_threshold", base.regime.return_threshold);
    read(r, "volatility_threshold", base.regime.volatility_threshold);
    read(r, "sideways_volatility_threshold", base.regime.sideways_volatility_threshold);

    return base;
}

std::optional<PipelineConfig> load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        logger()->error("Cannot open config file {}", path);
        return std::nullopt;
    }

    Json::CharReaderBuilder builder;
    Json::Value doc;
    std::string errors;
    if (!Json::parseFromStream(builder, in, &doc, &errors)) {
        logger()->error("Cannot parse config file {}: {}", path, errors);
        return std::nullopt;
    }
    if (!doc.isObject()) {
        logger()->error("Config file {} is not a JSON object", path);
        return std::nullopt;
    }
    return config_from_json(doc);
}

void apply_env_overrides(PipelineConfig& config) {
    auto& th = config.validator.thresholds;
    if (auto v = env_number("WFV_MIN_OOS_SHARPE"))   th.min_oos_sharpe   = *v;
    if (auto v = env_number("WFV_MAX_SHARPE_DECAY")) th.max_sharpe_decay = *v;
    if (auto v = env_number("WFV_MAX_OOS_DRAWDOWN")) th.max_oos_drawdown = *v;
    if (auto v = env_number("WFV_MIN_WIN_RATE"))     th.min_oos_win_rate = *v;

    if (auto v = env_number("WFV_MIN_WINDOWS")) {
        if (std::isfinite(*v) && *v >= 1.0 &&
            *v <= static_cast<double>(constants::MAX_MIN_WINDOWS)) {
            config.validator.min_windows = static_cast<std::size_t>(*v);
        } else {
            logger()->warn("Ignoring WFV_MIN_WINDOWS={}: must be within [1, {}]",
                           *v, constants::MAX_MIN_WINDOWS);
        }
    }

    if (const char* level = std::getenv("WFV_LOG_LEVEL"); level != nullptr && *level != '\0') {
        config.log_level = level;
    }
}

}  // namespace wfv
