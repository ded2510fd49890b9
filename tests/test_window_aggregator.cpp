#include "minitest.hpp"
#include "test_support.hpp"
#include "engine/WindowAggregator.hpp"

using namespace sloguard::engine;
using namespace testsupport;

TEST(window_empty_samples_zero_rate) {
  std::vector<sloguard::model::Sample> none;
  auto r = aggregate_window(none, t0(), kWindow5m);
  ASSERT_EQ(r.total, 0u);
  ASSERT_EQ(r.errors, 0u);
  ASSERT_EQ(r.error_rate, 0.0);
}

TEST(window_inclusive_edges) {
  // samples at -5m (edge, included), -6m (excluded), now (included), +1m (future, excluded)
  std::vector<sloguard::model::Sample> s = {
    sample(at_min(54), 100, 100),
    sample(at_min(55), 90, 10),
    sample(at_min(60), 95, 5),
    sample(at_min(61), 0, 100),
  };
  auto r = aggregate_window(s, at_min(60), kWindow5m);
  ASSERT_EQ(r.total, 200u);
  ASSERT_EQ(r.errors, 15u);
  ASSERT_NEAR(r.error_rate, 0.075, 1e-12);
}

TEST(window_three_windows) {
  // 24h of 1% errors, then the last 5 minutes at 10%
  auto s = steady(t0(), 24 * 60 - 5, 1000, 10);
  auto tail = steady(at_min(24 * 60 - 5), 5, 1000, 100);
  s.insert(s.end(), tail.begin(), tail.end());
  auto now = at_min(24 * 60 - 1);
  auto w = aggregate_windows(s, now);
  // [now - 5m, now] holds one 1% sample and the five 10% samples
  ASSERT_NEAR(w.w5m.error_rate, 0.085, 1e-12);
  ASSERT_TRUE(w.w1h.error_rate > 0.01 && w.w1h.error_rate < 0.1);
  ASSERT_TRUE(w.w24h.error_rate > 0.01 && w.w24h.error_rate < w.w1h.error_rate);
  ASSERT_EQ(w.w24h.total, 1000u * 24 * 60);
}

TEST(window_aggregation_idempotent) {
  auto s = steady(t0(), 120, 500, 3);
  auto a = aggregate_windows(s, at_min(119));
  auto b = aggregate_windows(s, at_min(119));
  ASSERT_EQ(a.w5m.total, b.w5m.total);
  ASSERT_EQ(a.w1h.errors, b.w1h.errors);
  ASSERT_EQ(a.w24h.error_rate, b.w24h.error_rate);
}

TEST(range_is_half_open_at_start) {
  std::vector<sloguard::model::Sample> s = {
    sample(at_min(0), 10, 10),
    sample(at_min(1), 10, 0),
    sample(at_min(2), 5, 5),
  };
  auto r = aggregate_range(s, at_min(0), at_min(2));
  ASSERT_EQ(r.total, 20u);
  ASSERT_EQ(r.errors, 5u);
  auto empty = aggregate_range(s, at_min(2), at_min(2));
  ASSERT_EQ(empty.total, 0u);
}
