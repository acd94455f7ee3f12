/// @file src/validation/statistics.cpp
/// @brief Eigen-backed mean / dispersion helpers for the validator.

#include "statistics.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>

namespace wfv::stats {

namespace {

using ConstVectorMap = Eigen::Map<const Eigen::VectorXd>;

[[nodiscard]] ConstVectorMap as_vector(std::span<const double> v) noexcept {
    return ConstVectorMap(v.data(), static_cast<Eigen::Index>(v.size()));
}

}  // namespace

double mean(std::span<const double> v) noexcept {
    if (v.empty()) return 0.0;
    return as_vector(v).mean();
}

double population_stddev(std::span<const double> v, std::size_t min_count) noexcept {
    if (v.empty() || v.size() < min_count) return 0.0;

    const auto x = as_vector(v);
    const double mu = x.mean();
    // σ = √(Σ(x − μ)² / n)
    const double sq_sum = (x.array() - mu).square().sum();
    return std::sqrt(sq_sum / static_cast<double>(v.size()));
}

double positive_fraction(std::span<const double> v) noexcept {
    if (v.empty()) return 0.0;
    const auto positives = (as_vector(v).array() > 0.0).count();
    return static_cast<double>(positives) / static_cast<double>(v.size());
}

double clamp_finite(double x, double lo, double hi) noexcept {
    if (!std::isfinite(x)) return (x < 0.0) ? lo : hi;
    return std::clamp(x, lo, hi);
}

}  // namespace wfv::stats
