#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include "model/Types.hpp"

namespace sloguard::model {

struct WindowRate {
  std::chrono::seconds window{};
  uint64_t errors{};
  uint64_t total{};
  double error_rate{}; // 0 when total == 0
};

// Result of one evaluation of a (service, SLO) pair. Append-only history.
struct BurnRateSnapshot {
  std::string service;
  int64_t slo_id{};
  std::string slo_name;
  Timestamp ts{};
  double error_rate_5m{};
  double error_rate_1h{};
  double error_rate_24h{};
  double burn_rate_5m{};
  double burn_rate_1h{};
  double burn_rate_24h{};
  double composite_burn_rate{};
  double budget_consumed{};        // percent, 0..100
  double budget_remaining{100.0};  // percent, 0..100
  RiskLevel risk{RiskLevel::Safe};
};

// Persisted ledger state. `consumed` is in error-rate-hours.
struct LedgerEntry {
  std::string service;
  int64_t slo_id{};
  Timestamp window_start{};
  Timestamp last_update{};
  double consumed{};
};

} // namespace sloguard::model
