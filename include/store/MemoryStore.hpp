#pragma once
#include <deque>
#include <map>
#include <mutex>
#include <utility>
#include "store/IStore.hpp"

namespace sloguard::store {

// In-process store. Snapshot history is capped per (service, SLO) at
// `history_limit`; raw samples are bounded by prune_samples().
class MemoryStore : public IStore {
public:
  explicit MemoryStore(size_t history_limit = 10080);

  std::vector<sloguard::model::Service> list_services(bool active_only = false) const override;
  std::optional<sloguard::model::Service> find_service(const std::string& name) const override;
  sloguard::model::Service create_service(sloguard::model::Service s) override;
  sloguard::model::Service update_service(const sloguard::model::Service& s) override;
  void deactivate_service(const std::string& name) override;

  std::vector<sloguard::model::SloTarget> list_targets(const std::string& service, bool active_only = false) const override;
  std::optional<sloguard::model::SloTarget> find_target(int64_t id) const override;
  sloguard::model::SloTarget create_target(sloguard::model::SloTarget t) override;
  sloguard::model::SloTarget update_target(const sloguard::model::SloTarget& t) override;

  void append_samples(const std::string& service, const std::vector<sloguard::model::Sample>& samples) override;
  std::vector<sloguard::model::Sample> samples_between(const std::string& service,
                                                       sloguard::model::Timestamp from,
                                                       sloguard::model::Timestamp to) const override;
  size_t prune_samples(sloguard::model::Timestamp older_than) override;

  std::optional<sloguard::model::LedgerEntry> load_ledger(const std::string& service, int64_t slo_id) const override;
  void commit_evaluation(const sloguard::model::LedgerEntry& entry,
                         const sloguard::model::BurnRateSnapshot& snapshot) override;
  std::optional<sloguard::model::BurnRateSnapshot> latest_snapshot(const std::string& service, int64_t slo_id) const override;
  std::vector<sloguard::model::BurnRateSnapshot> snapshot_history(const std::string& service, int64_t slo_id,
                                                                  sloguard::model::Timestamp since,
                                                                  size_t limit) const override;

  sloguard::model::ReleaseDecision append_decision(sloguard::model::ReleaseDecision d) override;
  std::vector<sloguard::model::ReleaseDecision> list_decisions(const std::string& service, size_t limit) const override;

  sloguard::model::Alert append_alert(sloguard::model::Alert a) override;
  std::optional<sloguard::model::Alert> find_alert(int64_t id) const override;
  sloguard::model::Alert acknowledge_alert(int64_t id, const std::string& by, sloguard::model::Timestamp at) override;
  std::vector<sloguard::model::Alert> list_alerts(const AlertQuery& q) const override;

private:
  using SeriesKey = std::pair<std::string, int64_t>;

  mutable std::mutex mu_;
  size_t history_limit_;
  int64_t next_target_id_{1};
  int64_t next_decision_id_{1};
  int64_t next_alert_id_{1};
  std::map<std::string, sloguard::model::Service> services_;
  std::map<int64_t, sloguard::model::SloTarget> targets_;
  std::map<std::string, std::vector<sloguard::model::Sample>> samples_;
  std::map<SeriesKey, sloguard::model::LedgerEntry> ledgers_;
  std::map<SeriesKey, std::deque<sloguard::model::BurnRateSnapshot>> history_;
  std::vector<sloguard::model::ReleaseDecision> decisions_;
  std::vector<sloguard::model::Alert> alerts_;
};

} // namespace sloguard::store
