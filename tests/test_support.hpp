#pragma once
#include <chrono>
#include <string>
#include <vector>
#include "model/Evaluation.hpp"
#include "model/Sample.hpp"
#include "model/Service.hpp"

// Shared fixtures for the engine and store tests.
namespace testsupport {

using sloguard::model::Timestamp;

// 2024-05-01T00:00:00Z
inline Timestamp t0() { return sloguard::model::Clock::from_time_t(1714521600); }

inline Timestamp at_min(int minutes) { return t0() + std::chrono::minutes(minutes); }

inline sloguard::model::Sample sample(Timestamp ts, uint64_t success, uint64_t errors) {
  sloguard::model::Sample s{};
  s.ts = ts;
  s.success = success;
  s.errors = errors;
  return s;
}

// One sample per minute over [from, from + minutes), each with `total`
// requests of which `errors` failed.
inline std::vector<sloguard::model::Sample> steady(Timestamp from, int minutes, uint64_t total, uint64_t errors) {
  std::vector<sloguard::model::Sample> out;
  out.reserve(static_cast<size_t>(minutes));
  for (int i = 0; i < minutes; ++i) out.push_back(sample(from + std::chrono::minutes(i), total - errors, errors));
  return out;
}

inline sloguard::model::Service service(const std::string& name, Timestamp created = t0()) {
  sloguard::model::Service s{};
  s.name = name;
  s.team = "sre";
  s.created_at = created;
  return s;
}

// 99.9% availability over 30 days, default thresholds 1.0 / 1.5 / 2.0.
inline sloguard::model::SloTarget target(const std::string& svc, int64_t id = 1, Timestamp created = t0()) {
  sloguard::model::SloTarget t{};
  t.id = id;
  t.service = svc;
  t.created_at = created;
  return t;
}

inline sloguard::model::BurnRateSnapshot snapshot(const std::string& svc, sloguard::model::RiskLevel risk,
                                                  double composite, double remaining, Timestamp ts,
                                                  int64_t slo_id = 1) {
  sloguard::model::BurnRateSnapshot s{};
  s.service = svc;
  s.slo_id = slo_id;
  s.slo_name = "availability";
  s.ts = ts;
  s.composite_burn_rate = composite;
  s.budget_remaining = remaining;
  s.budget_consumed = 100.0 - remaining;
  s.risk = risk;
  return s;
}

} // namespace testsupport
