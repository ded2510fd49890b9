#include "minitest.hpp"
#include "test_support.hpp"
#include "engine/AlertManager.hpp"
#include "engine/Errors.hpp"
#include "store/MemoryStore.hpp"

using namespace sloguard;
using namespace testsupport;
using model::RiskLevel;

namespace {

struct RecordingSink : engine::IAlertSink {
  std::vector<model::Alert> seen;
  void deliver(const model::Alert& a) override { seen.push_back(a); }
  const char* name() const override { return "recording"; }
};

struct ThrowingSink : engine::IAlertSink {
  void deliver(const model::Alert&) override { throw std::runtime_error("pager offline"); }
  const char* name() const override { return "throwing"; }
};

// Store whose alert writes can be made to fail.
class FlakyAlertStore : public store::MemoryStore {
public:
  bool fail{false};
  model::Alert append_alert(model::Alert a) override {
    if (fail) throw engine::StorageError("alert table unavailable");
    return store::MemoryStore::append_alert(std::move(a));
  }
};

model::BurnRateSnapshot at(RiskLevel r, double composite = 2.5) {
  return snapshot("checkout", r, composite, 40.0, t0());
}

} // namespace

TEST(alerts_default_cooldowns) {
  store::MemoryStore st;
  engine::AlertManager am(st);
  ASSERT_TRUE(am.cooldown(RiskLevel::Observe) == std::chrono::minutes(60));
  ASSERT_TRUE(am.cooldown(RiskLevel::Danger) == std::chrono::minutes(30));
  ASSERT_TRUE(am.cooldown(RiskLevel::Freeze) == std::chrono::minutes(15));
  ASSERT_TRUE(am.cooldown(RiskLevel::Safe) == std::chrono::minutes(0));
}

TEST(alerts_safe_never_alerts) {
  store::MemoryStore st;
  engine::AlertManager am(st);
  ASSERT_TRUE(!am.on_evaluation(at(RiskLevel::Safe, 0.1), at_min(0)).has_value());
  ASSERT_TRUE(st.list_alerts({}).empty());
}

TEST(alerts_repeat_suppressed_within_cooldown) {
  store::MemoryStore st;
  engine::AlertManager am(st);
  auto sink = std::make_shared<RecordingSink>();
  am.add_sink(sink);

  auto first = am.on_evaluation(at(RiskLevel::Freeze), at_min(0));
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(first->severity == model::AlertSeverity::Emergency);
  ASSERT_TRUE(first->title.find("[EMERGENCY]") != std::string::npos);
  ASSERT_TRUE(!am.on_evaluation(at(RiskLevel::Freeze), at_min(1)).has_value());
  ASSERT_TRUE(!am.on_evaluation(at(RiskLevel::Freeze), at_min(14)).has_value());
  ASSERT_EQ(st.list_alerts({}).size(), static_cast<size_t>(1));
  ASSERT_EQ(sink->seen.size(), static_cast<size_t>(1));

  // Cooldown elapsed
  auto repeat = am.on_evaluation(at(RiskLevel::Freeze), at_min(15));
  ASSERT_TRUE(repeat.has_value());
  ASSERT_TRUE(repeat->message.find("remains FREEZE") != std::string::npos);
  ASSERT_EQ(sink->seen.size(), static_cast<size_t>(2));
}

TEST(alerts_escalation_fires_immediately) {
  store::MemoryStore st;
  engine::AlertManager am(st);
  ASSERT_TRUE(am.on_evaluation(at(RiskLevel::Observe, 1.1), at_min(0)).has_value());
  auto up = am.on_evaluation(at(RiskLevel::Danger, 1.6), at_min(1));
  ASSERT_TRUE(up.has_value());
  ASSERT_TRUE(up->message.find("from OBSERVE to DANGER") != std::string::npos);
  ASSERT_TRUE(am.on_evaluation(at(RiskLevel::Freeze, 2.2), at_min(2)).has_value());
  ASSERT_TRUE(am.previous_level("checkout") == RiskLevel::Freeze);
}

TEST(alerts_deescalation_covered_by_higher_alert) {
  store::MemoryStore st;
  engine::AlertManager am(st);
  ASSERT_TRUE(am.on_evaluation(at(RiskLevel::Freeze), at_min(0)).has_value());
  ASSERT_TRUE(!am.on_evaluation(at(RiskLevel::Danger, 1.7), at_min(5)).has_value());
  ASSERT_TRUE(am.previous_level("checkout") == RiskLevel::Danger);
}

TEST(alerts_flapping_does_not_repeat) {
  store::MemoryStore st;
  engine::AlertManager am(st);
  ASSERT_TRUE(am.on_evaluation(at(RiskLevel::Observe, 1.1), at_min(0)).has_value());
  ASSERT_TRUE(!am.on_evaluation(at(RiskLevel::Safe, 0.5), at_min(1)).has_value());
  ASSERT_TRUE(!am.on_evaluation(at(RiskLevel::Observe, 1.1), at_min(2)).has_value());
  ASSERT_EQ(st.list_alerts({}).size(), static_cast<size_t>(1));
}

TEST(alerts_acknowledge_lifts_suppression) {
  store::MemoryStore st;
  engine::AlertManager am(st);
  auto freeze = am.on_evaluation(at(RiskLevel::Freeze), at_min(0));
  ASSERT_TRUE(freeze.has_value());
  auto acked = am.acknowledge(freeze->id, "oncall", at_min(1));
  ASSERT_TRUE(acked.acknowledged);
  ASSERT_TRUE(am.on_evaluation(at(RiskLevel::Danger, 1.7), at_min(2)).has_value());
  ASSERT_THROWS(am.acknowledge(999, "oncall", at_min(3)), engine::NotFoundError);
}

TEST(alerts_acknowledge_many) {
  store::MemoryStore st;
  engine::AlertManager am(st);
  auto freeze = am.on_evaluation(at(RiskLevel::Freeze), at_min(0));
  ASSERT_TRUE(freeze.has_value());
  auto op = am.raise_operational("checkout", "3 consecutive evaluation failures", at_min(0));

  auto r = am.acknowledge_many({freeze->id, 999, op.id}, "oncall", at_min(1));
  ASSERT_EQ(r.acknowledged.size(), static_cast<size_t>(2));
  ASSERT_EQ(r.acknowledged[0], freeze->id);
  ASSERT_EQ(r.not_found.size(), static_cast<size_t>(1));
  ASSERT_EQ(r.not_found[0], 999);
  auto stored = st.find_alert(freeze->id);
  ASSERT_TRUE(stored.has_value() && stored->acknowledged);
  ASSERT_EQ(stored->acknowledged_by, std::string("oncall"));

  // The freeze no longer suppresses a lower tier
  ASSERT_TRUE(am.on_evaluation(at(RiskLevel::Danger, 1.7), at_min(2)).has_value());

  // Already acknowledged ids are neither counted again nor reported missing
  auto again = am.acknowledge_many({freeze->id}, "someone-else", at_min(3));
  ASSERT_TRUE(again.acknowledged.empty());
  ASSERT_TRUE(again.not_found.empty());
  ASSERT_EQ(st.find_alert(freeze->id)->acknowledged_by, std::string("oncall"));
}

TEST(alerts_store_failure_leaves_state) {
  FlakyAlertStore st;
  engine::AlertManager am(st);
  st.fail = true;
  ASSERT_THROWS(am.on_evaluation(at(RiskLevel::Danger, 1.7), at_min(0)), engine::StorageError);
  ASSERT_TRUE(am.previous_level("checkout") == RiskLevel::Safe);
  st.fail = false;
  // Nothing was recorded, so the retry is not suppressed
  auto retry = am.on_evaluation(at(RiskLevel::Danger, 1.7), at_min(1));
  ASSERT_TRUE(retry.has_value());
  ASSERT_EQ(retry->id, 1);
}

TEST(alerts_operational_and_failing_sink) {
  store::MemoryStore st;
  engine::AlertManager am(st);
  am.add_sink(std::make_shared<ThrowingSink>());
  auto sink = std::make_shared<RecordingSink>();
  am.add_sink(sink);
  auto a = am.raise_operational("checkout", "3 consecutive evaluation failures", at_min(0));
  ASSERT_TRUE(a.kind == model::AlertKind::Operational);
  ASSERT_TRUE(a.severity == model::AlertSeverity::Critical);
  ASSERT_EQ(a.message, std::string("3 consecutive evaluation failures"));
  ASSERT_EQ(sink->seen.size(), static_cast<size_t>(1));
  // Operational alerts do not touch risk state
  ASSERT_TRUE(am.previous_level("checkout") == RiskLevel::Safe);
}

TEST(alerts_custom_policy) {
  store::MemoryStore st;
  engine::AlertPolicy p{};
  p.freeze_cooldown = std::chrono::minutes(0);
  engine::AlertManager am(st, p);
  ASSERT_TRUE(am.on_evaluation(at(RiskLevel::Freeze), at_min(0)).has_value());
  ASSERT_TRUE(am.on_evaluation(at(RiskLevel::Freeze), at_min(0)).has_value());
}
