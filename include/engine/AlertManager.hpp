#pragma once
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "model/Alert.hpp"
#include "model/Evaluation.hpp"
#include "store/IStore.hpp"

namespace sloguard::engine {

struct AlertPolicy {
  std::chrono::minutes observe_cooldown{60};
  std::chrono::minutes danger_cooldown{30};
  std::chrono::minutes freeze_cooldown{15};
};

// Delivery channel for created alerts.
class IAlertSink {
public:
  virtual ~IAlertSink() = default;
  virtual void deliver(const sloguard::model::Alert& alert) = 0;
  [[nodiscard]] virtual const char* name() const = 0;
};

// Writes one line per alert to stderr.
class LogAlertSink : public IAlertSink {
public:
  void deliver(const sloguard::model::Alert& alert) override;
  [[nodiscard]] const char* name() const override { return "log"; }
};

class AlertManager {
public:
  explicit AlertManager(sloguard::store::IStore& store, AlertPolicy policy = {});

  void add_sink(std::shared_ptr<IAlertSink> sink);

  // Feed the service's worst snapshot of a completed tick. Returns the alert
  // created, if any. The check and the create happen under one lock.
  std::optional<sloguard::model::Alert> on_evaluation(const sloguard::model::BurnRateSnapshot& worst,
                                                      sloguard::model::Timestamp now);

  // Non-risk alert (repeated evaluation failures). Always created.
  sloguard::model::Alert raise_operational(const std::string& service, const std::string& detail,
                                           sloguard::model::Timestamp now);

  sloguard::model::Alert acknowledge(int64_t alert_id, const std::string& by, sloguard::model::Timestamp now);

  struct BulkAcknowledgement {
    std::vector<int64_t> acknowledged; // newly acknowledged by this call
    std::vector<int64_t> not_found;
  };
  // Unknown ids are reported, not thrown; already acknowledged alerts are left as they were.
  BulkAcknowledgement acknowledge_many(const std::vector<int64_t>& alert_ids, const std::string& by,
                                       sloguard::model::Timestamp now);

  [[nodiscard]] std::chrono::minutes cooldown(sloguard::model::RiskLevel level) const;
  [[nodiscard]] sloguard::model::RiskLevel previous_level(const std::string& service) const;
  [[nodiscard]] const AlertPolicy& policy() const { return policy_; }

private:
  struct CooldownEntry {
    sloguard::model::Timestamp last_alert_at{};
    int64_t alert_id{};
    bool acknowledged{false};
  };
  using Key = std::pair<std::string, sloguard::model::RiskLevel>;

  [[nodiscard]] bool suppressed_locked(const std::string& service, sloguard::model::RiskLevel level,
                                       sloguard::model::Timestamp now) const;
  void dispatch(const sloguard::model::Alert& alert);

  sloguard::store::IStore& store_;
  AlertPolicy policy_;
  mutable std::mutex mu_;
  std::map<Key, CooldownEntry> cooldowns_;
  std::map<std::string, sloguard::model::RiskLevel> previous_;
  std::vector<std::shared_ptr<IAlertSink>> sinks_;
};

} // namespace sloguard::engine
