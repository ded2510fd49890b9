#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include "model/Types.hpp"

namespace sloguard::model {

struct Forecast {
  std::string service;
  int64_t slo_id{};
  Timestamp as_of{};
  double current_burn_rate{};
  double budget_remaining{100.0};
  double trend_slope{};   // percent per hour
  double intercept{};
  double r_squared{};
  size_t points{};
  TrendDirection trend{TrendDirection::Stable};
  std::optional<double> time_to_exhaustion_hours;
  std::optional<Timestamp> projected_exhaustion;
  Confidence confidence{Confidence::Low};
  std::string message;
};

} // namespace sloguard::model
