#include "engine/BurnRate.hpp"
#include <algorithm>
#include <cmath>

namespace sloguard::engine {

double burn_rate(double error_rate, double allowed_error_rate) {
  if (!(error_rate > 0.0)) return 0.0;
  if (!(allowed_error_rate > 0.0)) return kSaturatedBurnRate;
  double b = error_rate / allowed_error_rate;
  if (!std::isfinite(b)) return kSaturatedBurnRate;
  return std::min(b, kSaturatedBurnRate);
}

double composite_burn_rate(double br_5m, double br_1h, double br_24h) {
  return kWeight5m * br_5m + kWeight1h * br_1h + kWeight24h * br_24h;
}

BurnRates compute_burn_rates(const WindowRates& rates, double allowed_error_rate) {
  BurnRates b{};
  b.br_5m = burn_rate(rates.w5m.error_rate, allowed_error_rate);
  b.br_1h = burn_rate(rates.w1h.error_rate, allowed_error_rate);
  b.br_24h = burn_rate(rates.w24h.error_rate, allowed_error_rate);
  b.composite = composite_burn_rate(b.br_5m, b.br_1h, b.br_24h);
  return b;
}

} // namespace sloguard::engine
