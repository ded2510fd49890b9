#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include "model/Types.hpp"

namespace sloguard::model {

struct Alert {
  int64_t id{};
  std::string service;
  AlertKind kind{AlertKind::Risk};
  AlertSeverity severity{AlertSeverity::Warning};
  RiskLevel risk{RiskLevel::Safe}; // meaningful for risk alerts
  std::string title;
  std::string message;
  Timestamp ts{};
  bool acknowledged{false};
  std::string acknowledged_by;
  std::optional<Timestamp> acknowledged_at;
};

} // namespace sloguard::model
