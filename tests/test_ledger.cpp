#include "minitest.hpp"
#include "test_support.hpp"
#include "engine/ErrorBudgetLedger.hpp"

using namespace sloguard::engine;
using namespace testsupport;

TEST(ledger_total_budget_error_rate_hours) {
  auto t = target("checkout");
  ASSERT_NEAR(total_budget(t), 0.001 * 30 * 24, 1e-9);
}

TEST(ledger_window_anchored_at_creation) {
  auto t = target("checkout");
  ASSERT_TRUE(window_start_for(t, t0() + std::chrono::hours(24 * 10)) == t0());
  ASSERT_TRUE(window_start_for(t, t0() + std::chrono::hours(24 * 45)) == t0() + std::chrono::hours(24 * 30));
  ASSERT_TRUE(window_start_for(t, t0() - std::chrono::hours(1)) == t0());
  auto e = open_entry(t, t0() + std::chrono::hours(24 * 31));
  ASSERT_TRUE(e.window_start == t0() + std::chrono::hours(24 * 30));
  ASSERT_TRUE(e.last_update == e.window_start);
  ASSERT_EQ(e.consumed, 0.0);
}

TEST(ledger_accrues_error_rate_times_hours) {
  auto t = target("checkout");
  auto samples = steady(t0(), 61, 1000, 10); // 1% for an hour
  auto e = advance(open_entry(t, t0()), t, samples, at_min(60));
  ASSERT_NEAR(e.consumed, 0.01, 1e-9);
  ASSERT_TRUE(e.last_update == at_min(60));
  auto st = budget_status(e, t);
  ASSERT_NEAR(st.consumed_pct, 0.01 / 0.72 * 100.0, 1e-6);
  ASSERT_NEAR(st.remaining_pct, 100.0 - 0.01 / 0.72 * 100.0, 1e-6);
}

TEST(ledger_accrual_starts_at_first_sample) {
  auto t = target("checkout");
  // Data only starts 10 hours into the window
  auto samples = steady(t0() + std::chrono::hours(10), 61, 1000, 10);
  auto e = advance(open_entry(t, t0()), t, samples, t0() + std::chrono::hours(11));
  ASSERT_NEAR(e.consumed, 0.01, 1e-9);
}

TEST(ledger_advance_is_pure_and_repeatable) {
  auto t = target("checkout");
  auto samples = steady(t0(), 120, 1000, 5);
  const auto prior = open_entry(t, t0());
  auto a = advance(prior, t, samples, at_min(90));
  auto b = advance(prior, t, samples, at_min(90));
  ASSERT_EQ(prior.consumed, 0.0);
  ASSERT_TRUE(prior.last_update == t0());
  ASSERT_EQ(a.consumed, b.consumed);
  // Re-advancing to the same instant accrues nothing
  auto c = advance(a, t, samples, at_min(90));
  ASSERT_EQ(c.consumed, a.consumed);
  // Going backwards is a no-op
  auto d = advance(a, t, samples, at_min(30));
  ASSERT_EQ(d.consumed, a.consumed);
  ASSERT_TRUE(d.last_update == a.last_update);
}

TEST(ledger_remaining_non_increasing_within_window) {
  auto t = target("checkout");
  auto samples = steady(t0(), 6 * 60, 1000, 3);
  auto e = open_entry(t, t0());
  double last = 100.0;
  for (int m = 15; m < 6 * 60; m += 15) {
    e = advance(e, t, samples, at_min(m));
    double r = budget_status(e, t).remaining_pct;
    ASSERT_TRUE(r <= last);
    ASSERT_TRUE(r >= 0.0 && r <= 100.0);
    last = r;
  }
  ASSERT_TRUE(last < 100.0);
}

TEST(ledger_rollover_resets_consumption) {
  auto t = target("checkout");
  auto e = open_entry(t, t0());
  e.consumed = 0.5;
  e.last_update = t0() + std::chrono::hours(24 * 30 - 1);
  auto next_start = t0() + std::chrono::hours(24 * 30);
  auto clean = steady(next_start, 61, 1000, 0);
  auto r = advance(e, t, clean, next_start + std::chrono::hours(1));
  ASSERT_TRUE(r.window_start == next_start);
  ASSERT_EQ(r.consumed, 0.0);
  ASSERT_NEAR(budget_status(r, t).remaining_pct, 100.0, 1e-12);
}

TEST(ledger_remaining_clamped_at_zero) {
  auto t = target("checkout");
  auto e = open_entry(t, t0());
  e.consumed = 5.0; // far beyond 0.72
  auto st = budget_status(e, t);
  ASSERT_EQ(st.consumed_pct, 100.0);
  ASSERT_EQ(st.remaining_pct, 0.0);
}

TEST(ledger_zero_budget_target) {
  auto t = target("checkout");
  t.target_value = 100.0;
  auto e = open_entry(t, t0());
  ASSERT_EQ(budget_status(e, t).remaining_pct, 100.0);
  e.consumed = 1e-9;
  ASSERT_EQ(budget_status(e, t).remaining_pct, 0.0);
}
