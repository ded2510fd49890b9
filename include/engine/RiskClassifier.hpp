#pragma once
#include "model/Service.hpp"
#include "model/Types.hpp"

namespace sloguard::engine {

struct RiskThresholds {
  double observe{1.0};
  double danger{1.5};
  double freeze{2.0};
};

[[nodiscard]] RiskThresholds thresholds_for(const sloguard::model::SloTarget& target);

// Lower edge of each band is inclusive: 1.0 is OBSERVE, 1.5 DANGER, 2.0 FREEZE.
[[nodiscard]] sloguard::model::RiskLevel classify(double composite_burn_rate,
                                                  const RiskThresholds& t = {});

[[nodiscard]] sloguard::model::AlertSeverity severity_for(sloguard::model::RiskLevel level);

} // namespace sloguard::engine
