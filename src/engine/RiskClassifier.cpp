#include "engine/RiskClassifier.hpp"

namespace sloguard::engine {

using sloguard::model::AlertSeverity;
using sloguard::model::RiskLevel;

RiskThresholds thresholds_for(const sloguard::model::SloTarget& target) {
  return RiskThresholds{target.burn_rate_threshold, target.danger_burn_rate, target.critical_burn_rate};
}

RiskLevel classify(double composite_burn_rate, const RiskThresholds& t) {
  if (composite_burn_rate >= t.freeze) return RiskLevel::Freeze;
  if (composite_burn_rate >= t.danger) return RiskLevel::Danger;
  if (composite_burn_rate >= t.observe) return RiskLevel::Observe;
  return RiskLevel::Safe;
}

AlertSeverity severity_for(RiskLevel level) {
  switch (level) {
    case RiskLevel::Safe: return AlertSeverity::Info;
    case RiskLevel::Observe: return AlertSeverity::Warning;
    case RiskLevel::Danger: return AlertSeverity::Critical;
    case RiskLevel::Freeze: return AlertSeverity::Emergency;
  }
  return AlertSeverity::Info;
}

} // namespace sloguard::engine
