#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "engine/Forecaster.hpp"
#include "model/Evaluation.hpp"
#include "model/Forecast.hpp"
#include "model/Release.hpp"
#include "store/IStore.hpp"

namespace sloguard::engine {

// Time-to-exhaustion below which a warning recommendation is added.
inline constexpr double kExhaustionWarningHours = 4.0;

// EVALUATING -> ALLOWED | BLOCKED for one request. Pure; does not validate.
// `snapshot` empty means no evaluation has completed for the service.
[[nodiscard]] sloguard::model::ReleaseDecision decide(const sloguard::model::ReleaseRequest& req,
                                                      const std::optional<sloguard::model::BurnRateSnapshot>& snapshot,
                                                      const std::optional<sloguard::model::Forecast>& forecast,
                                                      sloguard::model::Timestamp now);

// Latest snapshot with the highest composite burn rate across the service's active targets.
[[nodiscard]] std::optional<sloguard::model::BurnRateSnapshot> worst_latest_snapshot(const sloguard::store::IStore& store,
                                                                                     const std::string& service);

class ReleaseGate {
public:
  explicit ReleaseGate(sloguard::store::IStore& store, size_t forecast_points = kDefaultForecastPoints);

  // Validates, decides from the latest completed snapshot and appends the
  // decision to the audit trail. Never triggers an evaluation.
  sloguard::model::ReleaseDecision check(const sloguard::model::ReleaseRequest& req,
                                         sloguard::model::Timestamp now);

  // Current gate state for a service without recording a decision.
  [[nodiscard]] sloguard::model::ReleaseDecision status(const std::string& service,
                                                        sloguard::model::Timestamp now) const;

  [[nodiscard]] std::vector<sloguard::model::ReleaseDecision> history(const std::string& service, size_t limit) const;

private:
  [[nodiscard]] sloguard::model::ReleaseDecision evaluate(const sloguard::model::ReleaseRequest& req,
                                                          sloguard::model::Timestamp now) const;

  sloguard::store::IStore& store_;
  size_t forecast_points_;
};

} // namespace sloguard::engine
