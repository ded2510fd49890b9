#pragma once
#include <vector>
#include "model/Evaluation.hpp"
#include "model/Sample.hpp"
#include "model/Service.hpp"

namespace sloguard::engine {

struct BudgetStatus {
  double consumed_pct{};        // 0..100
  double remaining_pct{100.0};  // 0..100
};

// Total error budget of the compliance window, in error-rate-hours.
[[nodiscard]] double total_budget(const sloguard::model::SloTarget& target);

// Start of the compliance window containing `now`. Windows are anchored at
// target.created_at and repeat every window_days.
[[nodiscard]] sloguard::model::Timestamp window_start_for(const sloguard::model::SloTarget& target,
                                                          sloguard::model::Timestamp now);

// Fresh entry for the window containing `now`, with nothing consumed yet.
[[nodiscard]] sloguard::model::LedgerEntry open_entry(const sloguard::model::SloTarget& target,
                                                      sloguard::model::Timestamp now);

// Returns the entry after accruing (prior.last_update, now]. Rolls the window over
// when `now` has crossed the window end. `prior` is never modified.
[[nodiscard]] sloguard::model::LedgerEntry advance(const sloguard::model::LedgerEntry& prior,
                                                   const sloguard::model::SloTarget& target,
                                                   const std::vector<sloguard::model::Sample>& samples,
                                                   sloguard::model::Timestamp now);

[[nodiscard]] BudgetStatus budget_status(const sloguard::model::LedgerEntry& entry,
                                         const sloguard::model::SloTarget& target);

} // namespace sloguard::engine
