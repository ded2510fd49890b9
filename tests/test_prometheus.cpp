#include "minitest.hpp"
#include "test_support.hpp"
#include "app/Exposition.hpp"
#include "store/MemoryStore.hpp"
#include <string>

using namespace testsupport;
using sloguard::model::RiskLevel;

static int count_of(const std::string& hay, const std::string& needle) {
  int count = 0;
  size_t pos = 0;
  while ((pos = hay.find(needle, pos)) != std::string::npos) {
    ++count; ++pos;
  }
  return count;
}

TEST(prometheus_fleet_gauges) {
  sloguard::app::ExpositionSnapshot snap{};
  snap.services_total = 5;
  snap.services_active = 3;
  snap.alerts_unacknowledged = 7;
  std::string out = sloguard::app::exposition_to_prometheus(snap);
  ASSERT_TRUE(out.find("# TYPE sloguard_services_total gauge") != std::string::npos);
  ASSERT_TRUE(out.find("sloguard_services_total{state=\"active\"} 3") != std::string::npos);
  ASSERT_TRUE(out.find("sloguard_services_total{state=\"inactive\"} 2") != std::string::npos);
  ASSERT_TRUE(out.find("sloguard_alerts_unacknowledged 7") != std::string::npos);
  // No per-SLO families without data
  ASSERT_TRUE(out.find("sloguard_burn_rate") == std::string::npos);
}

TEST(prometheus_per_slo_series) {
  sloguard::app::ExpositionSnapshot snap{};
  snap.services_total = 1;
  snap.services_active = 1;
  auto s = snapshot("checkout", RiskLevel::Danger, 1.75, 42.5, t0());
  s.burn_rate_5m = 3.5;
  s.burn_rate_1h = 1.5;
  s.burn_rate_24h = 0.5;
  snap.latest.push_back(s);
  std::string out = sloguard::app::exposition_to_prometheus(snap);
  ASSERT_TRUE(out.find("sloguard_burn_rate{service=\"checkout\",slo=\"availability\",window=\"5m\"} 3.5") != std::string::npos);
  ASSERT_TRUE(out.find("sloguard_burn_rate{service=\"checkout\",slo=\"availability\",window=\"24h\"} 0.5") != std::string::npos);
  ASSERT_TRUE(out.find("sloguard_composite_burn_rate{service=\"checkout\",slo=\"availability\"} 1.75") != std::string::npos);
  ASSERT_TRUE(out.find("sloguard_error_budget_remaining_percent{service=\"checkout\",slo=\"availability\"} 42.5") != std::string::npos);
  ASSERT_TRUE(out.find("sloguard_risk_level{service=\"checkout\",slo=\"availability\"} 2") != std::string::npos);
  ASSERT_EQ(count_of(out, "# TYPE sloguard_burn_rate gauge"), 1);
}

TEST(prometheus_label_escaping) {
  sloguard::app::ExpositionSnapshot snap{};
  auto s = snapshot("svc", RiskLevel::Safe, 0.0, 100.0, t0());
  s.slo_name = "say \"hi\"\\now";
  snap.latest.push_back(s);
  std::string out = sloguard::app::exposition_to_prometheus(snap);
  ASSERT_TRUE(out.find("slo=\"say \\\"hi\\\"\\\\now\"") != std::string::npos);
}

TEST(prometheus_collect_from_store) {
  sloguard::store::MemoryStore st;
  st.create_service(service("b-svc"));
  st.create_service(service("a-svc"));
  st.create_service(service("old"));
  st.deactivate_service("old");
  auto tb = st.create_target(target("b-svc"));
  auto ta = st.create_target(target("a-svc"));
  st.create_target(target("a-svc")); // no snapshot yet
  sloguard::model::LedgerEntry e{};
  st.commit_evaluation(e, snapshot("b-svc", RiskLevel::Observe, 1.2, 80.0, t0(), tb.id));
  st.commit_evaluation(e, snapshot("a-svc", RiskLevel::Safe, 0.1, 99.0, t0(), ta.id));
  sloguard::model::Alert a{};
  a.service = "b-svc";
  st.append_alert(a);
  st.append_alert(a);
  st.acknowledge_alert(1, "me", t0());

  auto snap = sloguard::app::collect_exposition(st);
  ASSERT_EQ(snap.services_total, 3);
  ASSERT_EQ(snap.services_active, 2);
  ASSERT_EQ(snap.alerts_unacknowledged, 1);
  ASSERT_EQ(snap.latest.size(), static_cast<size_t>(2));
  ASSERT_EQ(snap.latest[0].service, std::string("a-svc"));
  ASSERT_EQ(snap.latest[1].service, std::string("b-svc"));

  std::string out = sloguard::app::exposition_to_prometheus(snap);
  ASSERT_EQ(count_of(out, "sloguard_composite_burn_rate{"), 2);
  ASSERT_TRUE(out.find("a-svc") < out.find("b-svc"));
}
