#pragma once
#include <string>
#include <vector>
#include "engine/AlertManager.hpp"
#include "model/Evaluation.hpp"
#include "model/Sample.hpp"
#include "model/Service.hpp"
#include "store/IStore.hpp"

namespace sloguard::engine {

struct TargetResult {
  sloguard::model::LedgerEntry ledger;
  sloguard::model::BurnRateSnapshot snapshot;
};

// Pure evaluation of one SLO target at `now`: aggregates windows, computes
// burn rates, advances the ledger from `prior` and classifies risk.
[[nodiscard]] TargetResult evaluate_target(const sloguard::model::SloTarget& target,
                                           const std::vector<sloguard::model::Sample>& samples,
                                           const sloguard::model::LedgerEntry& prior,
                                           sloguard::model::Timestamp now);

// Inputs of one tick gathered from the store.
struct TickInput {
  std::string service;
  sloguard::model::Timestamp now{};
  std::vector<sloguard::model::SloTarget> targets;
  std::vector<sloguard::model::Sample> samples;
};

// Highest composite burn rate; ties go to the higher risk level.
[[nodiscard]] const sloguard::model::BurnRateSnapshot* worst_of(const std::vector<sloguard::model::BurnRateSnapshot>& snaps);

class Evaluator {
public:
  Evaluator(sloguard::store::IStore& store, AlertManager& alerts);

  // Read phase. Safe to abandon; writes nothing.
  [[nodiscard]] TickInput prepare(const std::string& service, sloguard::model::Timestamp now) const;

  // True when a stored ledger of the service was already advanced past
  // input.now, i.e. a later tick committed first.
  [[nodiscard]] bool superseded(const TickInput& input) const;

  // Commit phase. Callers serialise this per service. Loads each ledger,
  // advances it, commits ledger + snapshot together and feeds the alert manager.
  // A superseded input commits nothing and returns no snapshots.
  std::vector<sloguard::model::BurnRateSnapshot> commit(const TickInput& input);

  std::vector<sloguard::model::BurnRateSnapshot> run(const std::string& service, sloguard::model::Timestamp now) {
    return commit(prepare(service, now));
  }

private:
  sloguard::store::IStore& store_;
  AlertManager& alerts_;
};

} // namespace sloguard::engine
