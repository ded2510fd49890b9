#pragma once
#include "engine/WindowAggregator.hpp"

namespace sloguard::engine {

// Finite stand-in for an infinite burn rate (allowed error rate of zero).
inline constexpr double kSaturatedBurnRate = 1e9;

inline constexpr double kWeight5m = 0.40;
inline constexpr double kWeight1h = 0.35;
inline constexpr double kWeight24h = 0.25;

struct BurnRates {
  double br_5m{};
  double br_1h{};
  double br_24h{};
  double composite{};
};

// error_rate / allowed_error_rate, saturating at kSaturatedBurnRate.
[[nodiscard]] double burn_rate(double error_rate, double allowed_error_rate);

// Fixed weights, never renormalised: an empty window contributes 0 at its weight.
[[nodiscard]] double composite_burn_rate(double br_5m, double br_1h, double br_24h);

[[nodiscard]] BurnRates compute_burn_rates(const WindowRates& rates, double allowed_error_rate);

} // namespace sloguard::engine
