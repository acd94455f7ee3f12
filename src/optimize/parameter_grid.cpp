/// @file src/optimize/parameter_grid.cpp
/// @brief Grid expansion, parameter change bounds and sensitivity analysis.

#include "wfv/parameter_grid.hpp"
#include "wfv/constants.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <utility>

namespace wfv {

std::vector<ParameterSet> expand(const ParameterGrid& grid) {
    if (grid.empty()) return {};
    for (const auto& [name, values] : grid) {
        if (values.empty()) return {};
    }

    std::vector<ParameterSet> out{ParameterSet{}};
    // Extending each partial set in turn keeps the first name slowest.
    for (const auto& [name, values] : grid) {
        std::vector<ParameterSet> next;
        next.reserve(out.size() * values.size());
        for (const auto& partial : out) {
            for (double v : values) {
                ParameterSet p = partial;
                p[name] = v;
                next.push_back(std::move(p));
            }
        }
        out = std::move(next);
    }
    return out;
}

std::vector<ParameterSet>
filter_admitted(const std::vector<ParameterSet>& candidates,
                const ParameterSchema& schema) {
    std::vector<ParameterSet> out;
    std::copy_if(candidates.begin(), candidates.end(), std::back_inserter(out),
                 [&](const ParameterSet& p) { return schema.admits(p); });
    return out;
}

double change_pct(std::optional<double> old_value, double new_value) noexcept {
    if (!old_value) return 100.0;
    if (std::abs(*old_value) < constants::FLOAT_EPSILON) {
        return std::abs(new_value) < constants::FLOAT_EPSILON ? 0.0 : 100.0;
    }
    return std::abs(new_value - *old_value) / std::abs(*old_value) * 100.0;
}

std::map<std::string, ParameterChange>
parameter_changes(const ParameterSet& current, const ParameterSet& next) {
    std::map<std::string, ParameterChange> out;
    for (const auto& [name, value] : next) {
        ParameterChange c;
        if (const auto it = current.find(name); it != current.end()) {
            c.old_value = it->second;
        }
        c.new_value  = value;
        c.change_pct = change_pct(c.old_value, value);
        out.emplace(name, c);
    }
    return out;
}

std::vector<ParameterSensitivity>
sensitivity(std::span<const CandidateScore> scores) {
    // name → value → (sum, count)
    std::map<std::string, std::map<double, std::pair<double, std::size_t>>> groups;
    for (const auto& s : scores) {
        if (!std::isfinite(s.mean_oos_sharpe)) continue;
        for (const auto& [name, value] : s.params) {
            auto& g = groups[name][value];
            g.first += s.mean_oos_sharpe;
            ++g.second;
        }
    }

    std::vector<ParameterSensitivity> out;
    for (const auto& [name, by_value] : groups) {
        if (by_value.size() < 2) continue;

        ParameterSensitivity ps;
        ps.name = name;
        double best = -INFINITY;
        for (const auto& [value, acc] : by_value) {
            const double m = acc.first / static_cast<double>(acc.second);
            ps.values.push_back(value);
            ps.mean_sharpes.push_back(m);
            if (m > best) {
                best = m;
                ps.optimal_value = value;
            }
        }

        const auto [lo, hi] = std::minmax_element(ps.mean_sharpes.begin(), ps.mean_sharpes.end());
        double total = 0.0;
        for (double m : ps.mean_sharpes) total += m;
        const double mean = total / static_cast<double>(ps.mean_sharpes.size());

        ps.sensitivity_score = std::clamp((*hi - *lo) / (std::abs(mean) + constants::FLOAT_EPSILON),
                                          0.0, 1.0);
        ps.is_robust = ps.sensitivity_score < 0.5;
        out.push_back(std::move(ps));
    }
    return out;
}

}  // namespace wfv
