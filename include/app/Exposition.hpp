#pragma once

#include <string>
#include <vector>
#include "model/Evaluation.hpp"
#include "store/IStore.hpp"

namespace sloguard::app {

// Point-in-time copy of what the exposition reports, read from the store
// once so one scrape is internally consistent per series.
struct ExpositionSnapshot {
  int services_total{};
  int services_active{};
  int alerts_unacknowledged{};
  std::vector<sloguard::model::BurnRateSnapshot> latest; // one per active (service, SLO) with data
};

[[nodiscard]] ExpositionSnapshot collect_exposition(const sloguard::store::IStore& store);

// Prometheus text exposition format (version 0.0.4).
[[nodiscard]] std::string exposition_to_prometheus(const ExpositionSnapshot& snap);

} // namespace sloguard::app
