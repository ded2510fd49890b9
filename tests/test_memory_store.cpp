#include "minitest.hpp"
#include "test_support.hpp"
#include "engine/Errors.hpp"
#include "store/MemoryStore.hpp"

using namespace sloguard;
using namespace testsupport;

TEST(store_service_lifecycle) {
  store::MemoryStore st;
  auto created = st.create_service(service("checkout"));
  ASSERT_TRUE(created.created_at == t0());
  ASSERT_TRUE(created.updated_at == t0());
  ASSERT_THROWS(st.create_service(service("checkout")), engine::ConflictError);

  auto upd = created;
  upd.team = "payments";
  upd.created_at = t0() + std::chrono::hours(5);
  auto after = st.update_service(upd);
  ASSERT_EQ(after.team, std::string("payments"));
  ASSERT_TRUE(after.created_at == t0()); // creation time is fixed

  ASSERT_THROWS(st.update_service(service("ghost")), engine::NotFoundError);
  ASSERT_THROWS(st.deactivate_service("ghost"), engine::NotFoundError);
}

TEST(store_deactivate_keeps_records) {
  store::MemoryStore st;
  st.create_service(service("a"));
  st.create_service(service("b"));
  st.append_samples("a", steady(t0(), 5, 100, 1));
  st.deactivate_service("a");
  ASSERT_EQ(st.list_services(false).size(), static_cast<size_t>(2));
  auto active = st.list_services(true);
  ASSERT_EQ(active.size(), static_cast<size_t>(1));
  ASSERT_EQ(active[0].name, std::string("b"));
  ASSERT_TRUE(!st.find_service("a")->active);
  ASSERT_EQ(st.samples_between("a", t0(), at_min(10)).size(), static_cast<size_t>(5));
}

TEST(store_targets_get_ids_and_keep_anchor) {
  store::MemoryStore st;
  ASSERT_THROWS(st.create_target(target("nobody")), engine::NotFoundError);
  st.create_service(service("search"));
  auto a = st.create_target(target("search", 0));
  auto b = st.create_target(target("search", 0));
  ASSERT_EQ(a.id, 1);
  ASSERT_EQ(b.id, 2);

  auto changed = a;
  changed.target_value = 99.5;
  changed.service = "elsewhere";
  changed.created_at = t0() + std::chrono::hours(100);
  auto u = st.update_target(changed);
  ASSERT_EQ(u.service, std::string("search"));
  ASSERT_TRUE(u.created_at == t0());
  ASSERT_EQ(st.find_target(1)->target_value, 99.5);

  auto off = b;
  off.active = false;
  st.update_target(off);
  ASSERT_EQ(st.list_targets("search", false).size(), static_cast<size_t>(2));
  ASSERT_EQ(st.list_targets("search", true).size(), static_cast<size_t>(1));

  auto missing = a;
  missing.id = 99;
  ASSERT_THROWS(st.update_target(missing), engine::NotFoundError);
}

TEST(store_samples_ordered_and_bounded) {
  store::MemoryStore st;
  ASSERT_THROWS(st.append_samples("none", steady(t0(), 1, 10, 0)), engine::NotFoundError);
  st.create_service(service("api"));
  st.append_samples("api", {sample(at_min(5), 1, 0), sample(at_min(1), 2, 0), sample(at_min(3), 3, 0)});
  auto all = st.samples_between("api", t0(), at_min(10));
  ASSERT_EQ(all.size(), static_cast<size_t>(3));
  ASSERT_TRUE(all[0].ts == at_min(1));
  ASSERT_TRUE(all[2].ts == at_min(5));

  // Both ends inclusive
  ASSERT_EQ(st.samples_between("api", at_min(1), at_min(3)).size(), static_cast<size_t>(2));
  ASSERT_TRUE(st.samples_between("api", at_min(9), at_min(1)).empty());

  ASSERT_EQ(st.prune_samples(at_min(3)), static_cast<size_t>(1));
  ASSERT_TRUE(st.samples_between("api", t0(), at_min(10)).front().ts == at_min(3));
}

TEST(store_history_capped_per_series) {
  store::MemoryStore st(10);
  for (int i = 0; i < 25; ++i) {
    model::LedgerEntry e{};
    e.service = "api";
    e.slo_id = 1;
    e.last_update = at_min(i);
    e.consumed = i * 0.01;
    st.commit_evaluation(e, snapshot("api", model::RiskLevel::Safe, 0.1, 99.0, at_min(i)));
  }
  auto hist = st.snapshot_history("api", 1, model::Timestamp{}, 0);
  ASSERT_EQ(hist.size(), static_cast<size_t>(10));
  ASSERT_TRUE(hist.front().ts == at_min(15));
  ASSERT_TRUE(hist.back().ts == at_min(24));
  ASSERT_TRUE(st.latest_snapshot("api", 1)->ts == at_min(24));
  ASSERT_NEAR(st.load_ledger("api", 1)->consumed, 0.24, 1e-12);

  auto since = st.snapshot_history("api", 1, at_min(20), 0);
  ASSERT_EQ(since.size(), static_cast<size_t>(5));
  auto limited = st.snapshot_history("api", 1, model::Timestamp{}, 3);
  ASSERT_EQ(limited.size(), static_cast<size_t>(3));
  ASSERT_TRUE(limited.front().ts == at_min(22));

  ASSERT_TRUE(!st.latest_snapshot("api", 2).has_value());
  ASSERT_TRUE(!st.load_ledger("api", 2).has_value());
}

TEST(store_decisions_newest_first) {
  store::MemoryStore st;
  for (int i = 0; i < 4; ++i) {
    model::ReleaseDecision d{};
    d.service = (i % 2 == 0) ? "a" : "b";
    d.deployment_id = "d" + std::to_string(i);
    auto saved = st.append_decision(d);
    ASSERT_EQ(saved.id, i + 1);
  }
  auto all = st.list_decisions("", 0);
  ASSERT_EQ(all.size(), static_cast<size_t>(4));
  ASSERT_EQ(all.front().deployment_id, std::string("d3"));
  auto a = st.list_decisions("a", 1);
  ASSERT_EQ(a.size(), static_cast<size_t>(1));
  ASSERT_EQ(a.front().deployment_id, std::string("d2"));
}

TEST(store_alerts_query_and_acknowledge) {
  store::MemoryStore st;
  for (int i = 0; i < 3; ++i) {
    model::Alert a{};
    a.service = i == 2 ? "b" : "a";
    a.title = "t" + std::to_string(i);
    st.append_alert(a);
  }
  auto acked = st.acknowledge_alert(1, "oncall", at_min(5));
  ASSERT_TRUE(acked.acknowledged);
  ASSERT_EQ(acked.acknowledged_by, std::string("oncall"));
  // Second acknowledgement keeps the first record
  auto again = st.acknowledge_alert(1, "someone-else", at_min(9));
  ASSERT_EQ(again.acknowledged_by, std::string("oncall"));
  ASSERT_TRUE(*again.acknowledged_at == at_min(5));
  ASSERT_THROWS(st.acknowledge_alert(42, "x", at_min(1)), engine::NotFoundError);

  store::AlertQuery q{};
  auto all = st.list_alerts(q);
  ASSERT_EQ(all.size(), static_cast<size_t>(3));
  ASSERT_EQ(all.front().title, std::string("t2"));

  q.acknowledged = false;
  ASSERT_EQ(st.list_alerts(q).size(), static_cast<size_t>(2));
  q.service = "a";
  auto open_a = st.list_alerts(q);
  ASSERT_EQ(open_a.size(), static_cast<size_t>(1));
  ASSERT_EQ(open_a[0].id, 2);
}
