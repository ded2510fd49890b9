#include "engine/ErrorBudgetLedger.hpp"
#include "engine/WindowAggregator.hpp"
#include <algorithm>

namespace sloguard::engine {

using sloguard::model::LedgerEntry;
using sloguard::model::Sample;
using sloguard::model::SloTarget;
using sloguard::model::Timestamp;

double total_budget(const SloTarget& target) {
  double allowed = std::max(0.0, target.allowed_error_rate());
  return allowed * static_cast<double>(target.window_days) * 24.0;
}

Timestamp window_start_for(const SloTarget& target, Timestamp now) {
  if (now <= target.created_at) return target.created_at;
  auto window = std::chrono::duration_cast<Timestamp::duration>(target.window());
  if (window.count() <= 0) return target.created_at;
  auto k = (now - target.created_at) / window;
  return target.created_at + k * window;
}

LedgerEntry open_entry(const SloTarget& target, Timestamp now) {
  LedgerEntry e{};
  e.service = target.service;
  e.slo_id = target.id;
  e.window_start = window_start_for(target, now);
  e.last_update = e.window_start;
  e.consumed = 0.0;
  return e;
}

LedgerEntry advance(const LedgerEntry& prior, const SloTarget& target,
                    const std::vector<Sample>& samples, Timestamp now) {
  LedgerEntry next = prior;
  next.service = target.service;
  next.slo_id = target.id;

  Timestamp current_start = window_start_for(target, now);
  if (current_start > prior.window_start) {
    next.window_start = current_start;
    next.last_update = current_start;
    next.consumed = 0.0;
  }

  if (now <= next.last_update) return next;

  // Accrue from the first retained observation when the entry is older than the data.
  Timestamp from = next.last_update;
  if (!samples.empty() && samples.front().ts > from && samples.front().ts <= now) from = samples.front().ts;

  auto rate = aggregate_range(samples, next.last_update, now);
  double hours = std::max(0.0, sloguard::model::hours_between(from, now));
  next.consumed += rate.error_rate * hours;
  next.last_update = now;
  return next;
}

BudgetStatus budget_status(const LedgerEntry& entry, const SloTarget& target) {
  BudgetStatus st{};
  double budget = total_budget(target);
  if (budget > 0.0) {
    st.consumed_pct = std::min(100.0, entry.consumed / budget * 100.0);
  } else {
    st.consumed_pct = entry.consumed > 0.0 ? 100.0 : 0.0;
  }
  st.consumed_pct = std::max(0.0, st.consumed_pct);
  st.remaining_pct = std::max(0.0, 100.0 - st.consumed_pct);
  return st;
}

} // namespace sloguard::engine
