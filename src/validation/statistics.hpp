#pragma once

/// @file src/validation/statistics.hpp
/// @brief Window-level aggregate statistics (internal).
///
/// Thin Eigen maps over contiguous series; no copies.  Every function
/// accepts an empty span and returns 0 for it.

#include <cstddef>
#include <span>

namespace wfv::stats {

/// Arithmetic mean.
[[nodiscard]] double mean(std::span<const double> v) noexcept;

/// Population standard deviation (n denominator).  0 for fewer than
/// `min_count` elements.
[[nodiscard]] double population_stddev(std::span<const double> v,
                                       std::size_t min_count = 2) noexcept;

/// Fraction of strictly positive elements, ∈ [0, 1].
[[nodiscard]] double positive_fraction(std::span<const double> v) noexcept;

/// clamp(x, lo, hi); NaN and +∞ map to `hi`, −∞ to `lo`.
[[nodiscard]] double clamp_finite(double x, double lo, double hi) noexcept;

}  // namespace wfv::stats
