#include "minitest.hpp"
#include "test_support.hpp"
#include "engine/Forecaster.hpp"

using namespace sloguard::engine;
using sloguard::model::Confidence;
using sloguard::model::TrendDirection;
using testsupport::at_min;
using testsupport::t0;

namespace {

// Remaining budget falling linearly by `per_hour` percent, one point every 3 minutes.
std::vector<BudgetPoint> line(int n, double start, double per_hour) {
  std::vector<BudgetPoint> pts;
  for (int i = 0; i < n; ++i)
    pts.push_back(BudgetPoint{at_min(i * 3), start - per_hour * (i * 3) / 60.0});
  return pts;
}

} // namespace

TEST(forecast_linear_drain) {
  auto f = forecast_exhaustion(line(21, 100.0, 10.0), 2.5); // 100 -> 90 over one hour
  ASSERT_EQ(f.points, static_cast<size_t>(21));
  ASSERT_NEAR(f.trend_slope, -10.0, 1e-6);
  ASSERT_NEAR(f.intercept, 100.0, 1e-6);
  ASSERT_NEAR(f.r_squared, 1.0, 1e-9);
  ASSERT_TRUE(f.trend == TrendDirection::Increasing);
  ASSERT_TRUE(f.confidence == Confidence::High);
  ASSERT_TRUE(f.time_to_exhaustion_hours.has_value());
  ASSERT_NEAR(*f.time_to_exhaustion_hours, 9.0, 1e-6);
  ASSERT_TRUE(f.projected_exhaustion.has_value());
  ASSERT_NEAR(sloguard::model::hours_between(t0(), *f.projected_exhaustion), 10.0, 1e-6);
  ASSERT_NEAR(f.budget_remaining, 90.0, 1e-9);
}

TEST(forecast_two_points_one_hour_apart) {
  std::vector<BudgetPoint> pts{BudgetPoint{t0(), 100.0}, BudgetPoint{at_min(60), 90.0}};
  auto f = forecast_exhaustion(pts, 2.5);
  ASSERT_EQ(f.points, static_cast<size_t>(2));
  ASSERT_NEAR(f.trend_slope, -10.0, 1e-9);
  ASSERT_NEAR(f.intercept, 100.0, 1e-9);
  ASSERT_TRUE(f.trend == TrendDirection::Increasing);
  ASSERT_TRUE(f.confidence == Confidence::Low);
  ASSERT_TRUE(f.time_to_exhaustion_hours.has_value());
  ASSERT_NEAR(*f.time_to_exhaustion_hours, 9.0, 1e-9);
  ASSERT_TRUE(f.as_of == at_min(60));
  ASSERT_NEAR(f.budget_remaining, 90.0, 1e-12);
}

TEST(forecast_unsorted_input_is_ordered) {
  auto pts = line(6, 50.0, 4.0);
  std::swap(pts[0], pts[5]);
  std::swap(pts[1], pts[3]);
  auto f = forecast_exhaustion(pts, 1.0);
  ASSERT_NEAR(f.trend_slope, -4.0, 1e-6);
  ASSERT_TRUE(f.as_of == at_min(15));
  ASSERT_TRUE(f.confidence == Confidence::Medium);
}

TEST(forecast_flat_is_stable) {
  std::vector<BudgetPoint> pts;
  for (int i = 0; i < 10; ++i) pts.push_back(BudgetPoint{at_min(i), 80.0});
  auto f = forecast_exhaustion(pts, 0.0);
  ASSERT_TRUE(f.trend == TrendDirection::Stable);
  ASSERT_TRUE(!f.time_to_exhaustion_hours.has_value());
  ASSERT_TRUE(!f.projected_exhaustion.has_value());
}

TEST(forecast_recovering_budget_is_decreasing_burn) {
  auto f = forecast_exhaustion(line(10, 20.0, -5.0), 0.2);
  ASSERT_TRUE(f.trend == TrendDirection::Decreasing);
  ASSERT_TRUE(!f.time_to_exhaustion_hours.has_value());
}

TEST(forecast_slope_within_epsilon_is_stable) {
  auto f = forecast_exhaustion(line(10, 70.0, 0.005), 0.0);
  ASSERT_TRUE(f.trend == TrendDirection::Stable);
}

TEST(forecast_too_few_points) {
  auto empty = forecast_exhaustion({}, 0.0);
  ASSERT_EQ(empty.points, static_cast<size_t>(0));
  ASSERT_TRUE(empty.confidence == Confidence::Low);
  ASSERT_TRUE(!empty.time_to_exhaustion_hours.has_value());

  auto one = forecast_exhaustion({BudgetPoint{t0(), 42.0}}, 1.0);
  ASSERT_EQ(one.points, static_cast<size_t>(1));
  ASSERT_TRUE(one.confidence == Confidence::Low);
  ASSERT_TRUE(one.trend == TrendDirection::Stable);
  ASSERT_EQ(one.budget_remaining, 42.0);
}

TEST(forecast_confidence_tiers) {
  ASSERT_TRUE(forecast_exhaustion(line(4, 100.0, 10.0), 1.0).confidence == Confidence::Low);
  ASSERT_TRUE(forecast_exhaustion(line(5, 100.0, 10.0), 1.0).confidence == Confidence::Medium);
  ASSERT_TRUE(forecast_exhaustion(line(20, 100.0, 10.0), 1.0).confidence == Confidence::High);

  // Noisy series: enough points but a poor fit
  std::vector<BudgetPoint> noisy;
  for (int i = 0; i < 30; ++i) noisy.push_back(BudgetPoint{at_min(i), (i % 2 == 0) ? 90.0 : 60.0});
  auto f = forecast_exhaustion(noisy, 1.0);
  ASSERT_TRUE(f.r_squared < 0.5);
  ASSERT_TRUE(f.confidence == Confidence::Low);
}

TEST(forecast_from_history_uses_latest_points) {
  std::vector<sloguard::model::BurnRateSnapshot> hist;
  for (int i = 0; i < 100; ++i)
    hist.push_back(testsupport::snapshot("checkout", sloguard::model::RiskLevel::Danger, 1.7,
                                         100.0 - i * 0.1, at_min(i)));
  auto f = forecast_from_history(hist, 60);
  ASSERT_EQ(f.points, static_cast<size_t>(60));
  ASSERT_EQ(f.service, std::string("checkout"));
  ASSERT_EQ(f.slo_id, 1);
  ASSERT_NEAR(f.current_burn_rate, 1.7, 1e-12);
  ASSERT_NEAR(f.trend_slope, -6.0, 1e-6);
  ASSERT_TRUE(f.message.find("checkout") != std::string::npos);
  ASSERT_TRUE(f.message.find("projected") != std::string::npos);
}

TEST(forecast_messages) {
  sloguard::model::Forecast f{};
  f.budget_remaining = 0.0;
  ASSERT_TRUE(forecast_message("api", f).find("exhausted") != std::string::npos);
  f.budget_remaining = 73.0;
  ASSERT_EQ(forecast_message("api", f), std::string("api error budget status is healthy with 73.0% remaining."));
  f.time_to_exhaustion_hours = 5.5;
  f.current_burn_rate = 3.2;
  auto m = forecast_message("api", f);
  ASSERT_TRUE(m.find("critically fast") != std::string::npos);
  ASSERT_TRUE(m.find("5.5 hours") != std::string::npos);
}

TEST(forecast_duration_formatting) {
  ASSERT_EQ(format_duration_hours(0.75), std::string("45 minutes"));
  ASSERT_EQ(format_duration_hours(5.5), std::string("5.5 hours"));
  ASSERT_EQ(format_duration_hours(60.0), std::string("2.5 days"));
  ASSERT_EQ(format_duration_hours(288.0), std::string("12 days"));
}
