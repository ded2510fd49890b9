#pragma once
#include <cstdint>
#include <string>
#include "model/Types.hpp"

namespace sloguard::model {

struct Service {
  std::string name;        // unique identity
  std::string description;
  std::string team;        // owning team
  int tier{2};             // 1 critical, 2 standard, 3 low
  bool active{true};
  Timestamp created_at{};
  Timestamp updated_at{};
};

struct SloTarget {
  int64_t id{};            // assigned by the store
  std::string service;
  std::string name{"availability"};
  double target_value{99.9};       // percent, 0 < v < 100
  int window_days{30};             // compliance window
  double burn_rate_threshold{1.0}; // OBSERVE boundary
  double danger_burn_rate{1.5};    // DANGER boundary
  double critical_burn_rate{2.0};  // FREEZE boundary
  bool active{true};
  Timestamp created_at{};          // anchors the compliance window

  [[nodiscard]] double allowed_error_rate() const { return 1.0 - target_value / 100.0; }
  [[nodiscard]] std::chrono::hours window() const { return std::chrono::hours(24LL * window_days); }
};

} // namespace sloguard::model
