#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "model/Types.hpp"

namespace sloguard::model {

struct ReleaseRequest {
  std::string service;
  std::string deployment_id;
  std::string version;
  std::string requested_by;
  bool override_requested{false};
  std::string override_reason;
};

// Immutable audit record of one gate check.
struct ReleaseDecision {
  int64_t id{};
  std::string service;
  std::string deployment_id;
  std::string version;
  std::string requested_by;
  GateState state{GateState::Evaluating};
  bool allowed{false};
  bool overridden{false};
  std::string override_reason;
  std::string reason;
  RiskLevel risk{RiskLevel::Safe};
  double composite_burn_rate{};
  double budget_remaining{100.0};
  std::optional<double> time_to_exhaustion_hours;
  std::optional<Timestamp> snapshot_at; // empty when no evaluation has completed
  Timestamp checked_at{};
  std::vector<std::string> recommendations;
};

} // namespace sloguard::model
