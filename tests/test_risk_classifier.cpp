#include "minitest.hpp"
#include "test_support.hpp"
#include "engine/RiskClassifier.hpp"

using namespace sloguard::engine;
using sloguard::model::AlertSeverity;
using sloguard::model::RiskLevel;

TEST(risk_default_band_edges) {
  ASSERT_TRUE(classify(0.0) == RiskLevel::Safe);
  ASSERT_TRUE(classify(0.999) == RiskLevel::Safe);
  ASSERT_TRUE(classify(1.0) == RiskLevel::Observe);
  ASSERT_TRUE(classify(1.499) == RiskLevel::Observe);
  ASSERT_TRUE(classify(1.5) == RiskLevel::Danger);
  ASSERT_TRUE(classify(1.999) == RiskLevel::Danger);
  ASSERT_TRUE(classify(2.0) == RiskLevel::Freeze);
  ASSERT_TRUE(classify(1e9) == RiskLevel::Freeze);
}

TEST(risk_custom_thresholds_from_target) {
  auto t = testsupport::target("search");
  t.burn_rate_threshold = 2.0;
  t.danger_burn_rate = 4.0;
  t.critical_burn_rate = 10.0;
  auto th = thresholds_for(t);
  ASSERT_EQ(th.observe, 2.0);
  ASSERT_EQ(th.freeze, 10.0);
  ASSERT_TRUE(classify(1.9, th) == RiskLevel::Safe);
  ASSERT_TRUE(classify(2.0, th) == RiskLevel::Observe);
  ASSERT_TRUE(classify(5.0, th) == RiskLevel::Danger);
  ASSERT_TRUE(classify(10.0, th) == RiskLevel::Freeze);
}

TEST(risk_levels_are_ordered) {
  ASSERT_TRUE(sloguard::model::rank(RiskLevel::Safe) < sloguard::model::rank(RiskLevel::Observe));
  ASSERT_TRUE(sloguard::model::rank(RiskLevel::Observe) < sloguard::model::rank(RiskLevel::Danger));
  ASSERT_TRUE(sloguard::model::rank(RiskLevel::Danger) < sloguard::model::rank(RiskLevel::Freeze));
  ASSERT_TRUE(sloguard::model::parse_risk_level("freeze") == RiskLevel::Freeze);
  ASSERT_TRUE(!sloguard::model::parse_risk_level("panic").has_value());
}

TEST(risk_severity_mapping) {
  ASSERT_TRUE(severity_for(RiskLevel::Safe) == AlertSeverity::Info);
  ASSERT_TRUE(severity_for(RiskLevel::Observe) == AlertSeverity::Warning);
  ASSERT_TRUE(severity_for(RiskLevel::Danger) == AlertSeverity::Critical);
  ASSERT_TRUE(severity_for(RiskLevel::Freeze) == AlertSeverity::Emergency);
}
