#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include "model/Evaluation.hpp"
#include "model/Forecast.hpp"

namespace sloguard::engine {

// Slopes within +/- this many percent per hour count as stable.
inline constexpr double kTrendSlopeEpsilon = 0.01;
inline constexpr size_t kDefaultForecastPoints = 60;

inline constexpr size_t kHighConfidenceMinPoints = 20;
inline constexpr double kHighConfidenceMinR2 = 0.8;
inline constexpr size_t kMediumConfidenceMinPoints = 5;
inline constexpr double kMediumConfidenceMinR2 = 0.5;

struct BudgetPoint {
  sloguard::model::Timestamp ts{};
  double remaining{}; // percent
};

// Ordinary least squares of remaining budget against hours since the first point.
// `current_burn_rate` only feeds the message text.
[[nodiscard]] sloguard::model::Forecast forecast_exhaustion(std::vector<BudgetPoint> points,
                                                            double current_burn_rate);

// Convenience: the last `max_points` snapshots (oldest first) as a forecast.
[[nodiscard]] sloguard::model::Forecast forecast_from_history(const std::vector<sloguard::model::BurnRateSnapshot>& history,
                                                              size_t max_points = kDefaultForecastPoints);

[[nodiscard]] std::string forecast_message(const std::string& service, const sloguard::model::Forecast& f);

// "45 minutes", "5.5 hours", "2.5 days", "12 days"
[[nodiscard]] std::string format_duration_hours(double hours);

} // namespace sloguard::engine
