#pragma once

#include <chrono>
#include <optional>
#include <ratio>
#include <string_view>
#include "util/Strings.hpp"

namespace sloguard::model {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

// Fractional hours from `from` to `to` (negative if `to` precedes `from`).
[[nodiscard]] inline double hours_between(Timestamp from, Timestamp to) {
  return std::chrono::duration<double, std::ratio<3600>>(to - from).count();
}

[[nodiscard]] inline Timestamp add_hours(Timestamp t, double hours) {
  return t + std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double, std::ratio<3600>>(hours));
}

// Ordered: comparisons on the underlying value follow severity.
enum class RiskLevel { Safe = 0, Observe = 1, Danger = 2, Freeze = 3 };

enum class AlertSeverity { Info, Warning, Critical, Emergency };

// Direction of the budget burn: Increasing means the budget is draining faster.
enum class TrendDirection { Increasing, Decreasing, Stable };

enum class Confidence { High, Medium, Low };

enum class GateState { Evaluating, Allowed, Blocked };

enum class AlertKind { Risk, Operational };

[[nodiscard]] constexpr int rank(RiskLevel r) { return static_cast<int>(r); }

[[nodiscard]] constexpr std::string_view to_string(RiskLevel r) {
  switch (r) {
    case RiskLevel::Safe: return "SAFE";
    case RiskLevel::Observe: return "OBSERVE";
    case RiskLevel::Danger: return "DANGER";
    case RiskLevel::Freeze: return "FREEZE";
  }
  return "SAFE";
}

[[nodiscard]] constexpr std::string_view to_string(AlertSeverity s) {
  switch (s) {
    case AlertSeverity::Info: return "info";
    case AlertSeverity::Warning: return "warning";
    case AlertSeverity::Critical: return "critical";
    case AlertSeverity::Emergency: return "emergency";
  }
  return "info";
}

[[nodiscard]] constexpr std::string_view to_string(TrendDirection t) {
  switch (t) {
    case TrendDirection::Increasing: return "increasing";
    case TrendDirection::Decreasing: return "decreasing";
    case TrendDirection::Stable: return "stable";
  }
  return "stable";
}

[[nodiscard]] constexpr std::string_view to_string(Confidence c) {
  switch (c) {
    case Confidence::High: return "high";
    case Confidence::Medium: return "medium";
    case Confidence::Low: return "low";
  }
  return "low";
}

[[nodiscard]] constexpr std::string_view to_string(GateState g) {
  switch (g) {
    case GateState::Evaluating: return "evaluating";
    case GateState::Allowed: return "allowed";
    case GateState::Blocked: return "blocked";
  }
  return "evaluating";
}

[[nodiscard]] constexpr std::string_view to_string(AlertKind k) {
  switch (k) {
    case AlertKind::Risk: return "risk";
    case AlertKind::Operational: return "operational";
  }
  return "risk";
}

[[nodiscard]] inline std::optional<RiskLevel> parse_risk_level(std::string_view s) {
  using sloguard::util::iequals;
  if (iequals(s, "safe")) return RiskLevel::Safe;
  if (iequals(s, "observe")) return RiskLevel::Observe;
  if (iequals(s, "danger")) return RiskLevel::Danger;
  if (iequals(s, "freeze")) return RiskLevel::Freeze;
  return std::nullopt;
}

[[nodiscard]] inline std::optional<AlertSeverity> parse_alert_severity(std::string_view s) {
  using sloguard::util::iequals;
  if (iequals(s, "info")) return AlertSeverity::Info;
  if (iequals(s, "warning")) return AlertSeverity::Warning;
  if (iequals(s, "critical")) return AlertSeverity::Critical;
  if (iequals(s, "emergency")) return AlertSeverity::Emergency;
  return std::nullopt;
}

} // namespace sloguard::model
