#include "engine/Evaluator.hpp"
#include "engine/BurnRate.hpp"
#include "engine/ErrorBudgetLedger.hpp"
#include "engine/RiskClassifier.hpp"
#include "engine/WindowAggregator.hpp"
#include "util/Log.hpp"
#include <algorithm>

namespace sloguard::engine {

using sloguard::model::BurnRateSnapshot;
using sloguard::model::LedgerEntry;
using sloguard::model::Sample;
using sloguard::model::SloTarget;
using sloguard::model::Timestamp;

TargetResult evaluate_target(const SloTarget& target, const std::vector<Sample>& samples,
                             const LedgerEntry& prior, Timestamp now) {
  TargetResult r{};
  auto windows = aggregate_windows(samples, now);
  auto burn = compute_burn_rates(windows, target.allowed_error_rate());
  r.ledger = advance(prior, target, samples, now);
  auto budget = budget_status(r.ledger, target);

  auto& s = r.snapshot;
  s.service = target.service;
  s.slo_id = target.id;
  s.slo_name = target.name;
  s.ts = now;
  s.error_rate_5m = windows.w5m.error_rate;
  s.error_rate_1h = windows.w1h.error_rate;
  s.error_rate_24h = windows.w24h.error_rate;
  s.burn_rate_5m = burn.br_5m;
  s.burn_rate_1h = burn.br_1h;
  s.burn_rate_24h = burn.br_24h;
  s.composite_burn_rate = burn.composite;
  s.budget_consumed = budget.consumed_pct;
  s.budget_remaining = budget.remaining_pct;
  s.risk = classify(burn.composite, thresholds_for(target));
  return r;
}

const BurnRateSnapshot* worst_of(const std::vector<BurnRateSnapshot>& snaps) {
  const BurnRateSnapshot* worst = nullptr;
  for (const auto& s : snaps) {
    if (!worst || s.composite_burn_rate > worst->composite_burn_rate ||
        (s.composite_burn_rate == worst->composite_burn_rate &&
         sloguard::model::rank(s.risk) > sloguard::model::rank(worst->risk))) {
      worst = &s;
    }
  }
  return worst;
}

Evaluator::Evaluator(sloguard::store::IStore& store, AlertManager& alerts)
    : store_(store), alerts_(alerts) {}

TickInput Evaluator::prepare(const std::string& service, Timestamp now) const {
  TickInput in{};
  in.service = service;
  in.now = now;
  auto svc = store_.find_service(service);
  if (!svc || !svc->active) return in;
  in.targets = store_.list_targets(service, true);
  if (in.targets.empty()) return in;

  // Enough history for the 24h window and for accrual since the oldest ledger update.
  Timestamp from = now - kWindow24h;
  for (const auto& t : in.targets) {
    auto entry = store_.load_ledger(service, t.id);
    Timestamp since = entry ? entry->last_update : window_start_for(t, now);
    from = std::min(from, since);
  }
  in.samples = store_.samples_between(service, from, now);
  return in;
}

bool Evaluator::superseded(const TickInput& input) const {
  for (const auto& t : input.targets) {
    auto entry = store_.load_ledger(input.service, t.id);
    if (entry && entry->last_update > input.now) return true;
  }
  return false;
}

std::vector<BurnRateSnapshot> Evaluator::commit(const TickInput& input) {
  std::vector<BurnRateSnapshot> out;
  if (superseded(input)) {
    sloguard::util::debugf("evaluator: %s already evaluated past this tick, skipping commit", input.service.c_str());
    return out;
  }
  out.reserve(input.targets.size());
  for (const auto& t : input.targets) {
    auto prior = store_.load_ledger(input.service, t.id);
    LedgerEntry base = prior ? *prior : open_entry(t, input.now);
    auto r = evaluate_target(t, input.samples, base, input.now);
    store_.commit_evaluation(r.ledger, r.snapshot);
    sloguard::util::debugf("evaluated %s/%s: composite %.3f remaining %.2f%% %s",
                           input.service.c_str(), t.name.c_str(), r.snapshot.composite_burn_rate,
                           r.snapshot.budget_remaining,
                           std::string(sloguard::model::to_string(r.snapshot.risk)).c_str());
    out.push_back(std::move(r.snapshot));
  }
  if (const auto* worst = worst_of(out)) alerts_.on_evaluation(*worst, input.now);
  return out;
}

} // namespace sloguard::engine
