#pragma once
#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "engine/ReleaseGate.hpp"
#include "model/Alert.hpp"
#include "model/Evaluation.hpp"
#include "model/Forecast.hpp"
#include "model/Service.hpp"
#include "store/IStore.hpp"

namespace sloguard::engine {

// Exhaustion further out than this is not reported as "nearest".
inline constexpr double kNearestExhaustionHorizonHours = 720.0;

struct ServiceStatus {
  sloguard::model::Service service;
  std::optional<sloguard::model::BurnRateSnapshot> worst; // latest, worst across targets
  std::optional<sloguard::model::Forecast> forecast;
};

struct Overview {
  sloguard::model::Timestamp generated_at{};
  int total_services{};
  int active_services{};
  std::array<int, 4> risk_distribution{}; // indexed by RiskLevel
  std::vector<std::string> services_at_risk; // DANGER or FREEZE
  double average_budget_remaining{100.0};
  std::optional<std::string> lowest_budget_service;
  double lowest_budget_remaining{100.0};
  std::optional<std::string> nearest_exhaustion_service;
  std::optional<double> nearest_exhaustion_hours;
  int unacknowledged_alerts{};
  int critical_alerts{}; // critical or emergency, unacknowledged
  std::string health{"healthy"};
  double health_score{100.0};
  std::string executive_summary;
  std::vector<std::string> action_items;
};

struct ServiceSummary {
  sloguard::model::Service service;
  std::vector<sloguard::model::BurnRateSnapshot> latest; // one per active target
  std::optional<sloguard::model::Forecast> forecast;
  sloguard::model::ReleaseDecision gate;
  std::vector<sloguard::model::Alert> recent_alerts;
  std::string narrative;
};

// Release decisions checked within the last `period_days`.
struct GateStatistics {
  int period_days{7};
  int total{};
  int blocked{};
  int allowed{};
  int overridden{};                       // allowed only through an override
  double block_rate{};                    // percent of total, two decimals
  std::array<int, 4> risk_distribution{}; // risk at check time, indexed by RiskLevel
};

// Alerts raised within the last `period_days`.
struct AlertStatistics {
  int period_days{7};
  std::array<int, 4> by_severity{}; // indexed by AlertSeverity
  int total{};
  int unacknowledged{};
  int operational{};
};

struct ServiceCompliance {
  std::string service;
  double compliance{100.0}; // mean over active targets, capped at 100 each
  bool meeting_slo{true};
};

struct GlobalCompliance {
  int total_services{};
  int services_meeting_slo{};
  double global_compliance{100.0};
  std::vector<std::string> services_at_risk; // not meeting every target
  std::vector<ServiceCompliance> services;
};

struct Heatmap {
  std::vector<std::string> services;
  std::vector<sloguard::model::Timestamp> buckets;
  std::vector<std::vector<sloguard::model::RiskLevel>> cells; // [service][bucket]
};

[[nodiscard]] std::vector<ServiceStatus> collect_status(const sloguard::store::IStore& store,
                                                        size_t forecast_points = kDefaultForecastPoints);

// Forecasts of every active service with a snapshot, soonest exhaustion first.
[[nodiscard]] std::vector<sloguard::model::Forecast> all_forecasts(const sloguard::store::IStore& store,
                                                                   size_t forecast_points = kDefaultForecastPoints);

// Forecast for the service's worst current target. Throws NotFoundError for unknown services.
[[nodiscard]] sloguard::model::Forecast service_forecast(const sloguard::store::IStore& store,
                                                         const std::string& service,
                                                         sloguard::model::Timestamp now,
                                                         size_t forecast_points = kDefaultForecastPoints);

[[nodiscard]] Overview build_overview(const sloguard::store::IStore& store, sloguard::model::Timestamp now,
                                      size_t forecast_points = kDefaultForecastPoints);

[[nodiscard]] ServiceSummary build_service_summary(const sloguard::store::IStore& store, const ReleaseGate& gate,
                                                   const std::string& service, sloguard::model::Timestamp now,
                                                   size_t forecast_points = kDefaultForecastPoints);

// Cells hold the worst risk among snapshots within half an interval of each
// bucket; SAFE where nothing was recorded.
[[nodiscard]] Heatmap build_heatmap(const sloguard::store::IStore& store, sloguard::model::Timestamp now,
                                    int hours = 24, int interval_hours = 1);

[[nodiscard]] std::string narrative_for(const ServiceStatus& status);

// `days` must be in [1, 366]. An empty service covers the whole fleet.
[[nodiscard]] GateStatistics gate_statistics(const sloguard::store::IStore& store, sloguard::model::Timestamp now,
                                             int days = 7, const std::string& service = {});
[[nodiscard]] AlertStatistics alert_statistics(const sloguard::store::IStore& store, sloguard::model::Timestamp now,
                                               int days = 7);

// Attained availability over the elapsed part of the compliance window as a
// percentage of the target, capped at 100. 100 without a ledger.
[[nodiscard]] double target_compliance(const sloguard::model::SloTarget& target,
                                       const std::optional<sloguard::model::LedgerEntry>& ledger);
[[nodiscard]] GlobalCompliance global_compliance(const sloguard::store::IStore& store);

} // namespace sloguard::engine
