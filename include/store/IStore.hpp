#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "model/Alert.hpp"
#include "model/Evaluation.hpp"
#include "model/Release.hpp"
#include "model/Sample.hpp"
#include "model/Service.hpp"

namespace sloguard::store {

struct AlertQuery {
  std::string service;               // empty: all services
  std::optional<bool> acknowledged;  // empty: both
  size_t limit{100};
};

// Persistence seam for the engine. Implementations are thread-safe.
// Failures surface as engine::StorageError; lookups of unknown entities in
// mutating calls throw engine::NotFoundError, duplicate creates engine::ConflictError.
class IStore {
public:
  virtual ~IStore() = default;

  // Services
  [[nodiscard]] virtual std::vector<sloguard::model::Service> list_services(bool active_only = false) const = 0;
  [[nodiscard]] virtual std::optional<sloguard::model::Service> find_service(const std::string& name) const = 0;
  virtual sloguard::model::Service create_service(sloguard::model::Service s) = 0;
  virtual sloguard::model::Service update_service(const sloguard::model::Service& s) = 0;
  // Deactivates; history and audit records stay.
  virtual void deactivate_service(const std::string& name) = 0;

  // SLO targets
  [[nodiscard]] virtual std::vector<sloguard::model::SloTarget> list_targets(const std::string& service,
                                                                             bool active_only = false) const = 0;
  [[nodiscard]] virtual std::optional<sloguard::model::SloTarget> find_target(int64_t id) const = 0;
  virtual sloguard::model::SloTarget create_target(sloguard::model::SloTarget t) = 0;
  virtual sloguard::model::SloTarget update_target(const sloguard::model::SloTarget& t) = 0;

  // Raw samples, kept in timestamp order per service
  virtual void append_samples(const std::string& service, const std::vector<sloguard::model::Sample>& samples) = 0;
  // Samples with ts in [from, to]
  [[nodiscard]] virtual std::vector<sloguard::model::Sample> samples_between(const std::string& service,
                                                                             sloguard::model::Timestamp from,
                                                                             sloguard::model::Timestamp to) const = 0;
  virtual size_t prune_samples(sloguard::model::Timestamp older_than) = 0;

  // Ledger and snapshots
  [[nodiscard]] virtual std::optional<sloguard::model::LedgerEntry> load_ledger(const std::string& service,
                                                                                int64_t slo_id) const = 0;
  // Writes the ledger entry and appends the snapshot as one unit: either both land or neither.
  virtual void commit_evaluation(const sloguard::model::LedgerEntry& entry,
                                 const sloguard::model::BurnRateSnapshot& snapshot) = 0;
  [[nodiscard]] virtual std::optional<sloguard::model::BurnRateSnapshot> latest_snapshot(const std::string& service,
                                                                                         int64_t slo_id) const = 0;
  // Oldest first, ts >= since; at most `limit` most recent entries.
  [[nodiscard]] virtual std::vector<sloguard::model::BurnRateSnapshot> snapshot_history(const std::string& service,
                                                                                        int64_t slo_id,
                                                                                        sloguard::model::Timestamp since,
                                                                                        size_t limit) const = 0;

  // Release decisions, append-only
  virtual sloguard::model::ReleaseDecision append_decision(sloguard::model::ReleaseDecision d) = 0;
  // Newest first; empty service lists all.
  [[nodiscard]] virtual std::vector<sloguard::model::ReleaseDecision> list_decisions(const std::string& service,
                                                                                     size_t limit) const = 0;

  // Alerts
  virtual sloguard::model::Alert append_alert(sloguard::model::Alert a) = 0;
  [[nodiscard]] virtual std::optional<sloguard::model::Alert> find_alert(int64_t id) const = 0;
  virtual sloguard::model::Alert acknowledge_alert(int64_t id, const std::string& by,
                                                   sloguard::model::Timestamp at) = 0;
  // Newest first
  [[nodiscard]] virtual std::vector<sloguard::model::Alert> list_alerts(const AlertQuery& q) const = 0;
};

} // namespace sloguard::store
