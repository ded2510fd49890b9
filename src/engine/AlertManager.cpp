#include "engine/AlertManager.hpp"
#include "engine/RiskClassifier.hpp"
#include <cstdio>

namespace sloguard::engine {

using sloguard::model::Alert;
using sloguard::model::AlertKind;
using sloguard::model::AlertSeverity;
using sloguard::model::BurnRateSnapshot;
using sloguard::model::RiskLevel;
using sloguard::model::Timestamp;

void LogAlertSink::deliver(const Alert& a) {
  std::fprintf(stderr, "sloguard: alert [%s] %s: %s\n",
               std::string(sloguard::model::to_string(a.severity)).c_str(),
               a.title.c_str(), a.message.c_str());
}

AlertManager::AlertManager(sloguard::store::IStore& store, AlertPolicy policy)
    : store_(store), policy_(policy) {}

void AlertManager::add_sink(std::shared_ptr<IAlertSink> sink) {
  if (!sink) return;
  std::lock_guard<std::mutex> lk(mu_);
  sinks_.push_back(std::move(sink));
}

std::chrono::minutes AlertManager::cooldown(RiskLevel level) const {
  switch (level) {
    case RiskLevel::Safe: return std::chrono::minutes(0);
    case RiskLevel::Observe: return policy_.observe_cooldown;
    case RiskLevel::Danger: return policy_.danger_cooldown;
    case RiskLevel::Freeze: return policy_.freeze_cooldown;
  }
  return std::chrono::minutes(0);
}

RiskLevel AlertManager::previous_level(const std::string& service) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = previous_.find(service);
  return it == previous_.end() ? RiskLevel::Safe : it->second;
}

bool AlertManager::suppressed_locked(const std::string& service, RiskLevel level, Timestamp now) const {
  const auto window = cooldown(level);
  for (int tier = sloguard::model::rank(level); tier <= sloguard::model::rank(RiskLevel::Freeze); ++tier) {
    auto it = cooldowns_.find({service, static_cast<RiskLevel>(tier)});
    if (it == cooldowns_.end()) continue;
    const auto& e = it->second;
    if (!e.acknowledged && now - e.last_alert_at < window) return true;
  }
  return false;
}

namespace {

std::string headline(RiskLevel level, const BurnRateSnapshot& s) {
  switch (level) {
    case RiskLevel::Safe: return "Service Recovered";
    case RiskLevel::Observe: return "High Burn Rate";
    case RiskLevel::Danger: return "Error Budget At Risk";
    case RiskLevel::Freeze:
      return s.budget_remaining <= 0.0 ? "Error Budget Exhausted" : "Deployment Freeze";
  }
  return "Risk Level Changed";
}

std::string tag(AlertSeverity sev) {
  switch (sev) {
    case AlertSeverity::Info: return "[INFO]";
    case AlertSeverity::Warning: return "[WARNING]";
    case AlertSeverity::Critical: return "[CRITICAL]";
    case AlertSeverity::Emergency: return "[EMERGENCY]";
  }
  return "[INFO]";
}

} // namespace

std::optional<Alert> AlertManager::on_evaluation(const BurnRateSnapshot& worst, Timestamp now) {
  const RiskLevel level = worst.risk;
  std::optional<Alert> created;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto pit = previous_.find(worst.service);
    const RiskLevel prev = pit == previous_.end() ? RiskLevel::Safe : pit->second;

    if (level != RiskLevel::Safe) {
      bool eligible = level != prev;
      if (!eligible) {
        auto it = cooldowns_.find({worst.service, level});
        eligible = it == cooldowns_.end() || now - it->second.last_alert_at >= cooldown(level);
      }

      if (eligible && !suppressed_locked(worst.service, level, now)) {
        Alert a{};
        a.service = worst.service;
        a.kind = AlertKind::Risk;
        a.severity = severity_for(level);
        a.risk = level;
        a.ts = now;
        a.title = tag(a.severity) + " " + headline(level, worst) + ": " + worst.service;
        char buf[256];
        std::snprintf(buf, sizeof(buf),
                      "%s is burning error budget at %.2fx the allowed rate (%.1f%% budget remaining).",
                      worst.service.c_str(), worst.composite_burn_rate, worst.budget_remaining);
        a.message = buf;
        if (level != prev) {
          a.message += " Risk level changed from " + std::string(sloguard::model::to_string(prev)) +
                       " to " + std::string(sloguard::model::to_string(level)) + ".";
        } else {
          a.message += " Risk level remains " + std::string(sloguard::model::to_string(level)) + ".";
        }

        // Store first: a failed write leaves the cooldown map and previous level untouched.
        a = store_.append_alert(a);
        cooldowns_[{worst.service, level}] = CooldownEntry{now, a.id, false};
        created = a;
      }
    }
    previous_[worst.service] = level;
  }
  if (created) dispatch(*created);
  return created;
}

Alert AlertManager::raise_operational(const std::string& service, const std::string& detail, Timestamp now) {
  Alert a{};
  a.service = service;
  a.kind = AlertKind::Operational;
  a.severity = AlertSeverity::Critical;
  a.risk = RiskLevel::Safe;
  a.ts = now;
  a.title = tag(a.severity) + " Evaluation Failing: " + service;
  a.message = detail;
  a = store_.append_alert(a);
  dispatch(a);
  return a;
}

Alert AlertManager::acknowledge(int64_t alert_id, const std::string& by, Timestamp now) {
  std::lock_guard<std::mutex> lk(mu_);
  Alert a = store_.acknowledge_alert(alert_id, by, now);
  for (auto& [key, entry] : cooldowns_) {
    if (entry.alert_id == alert_id) entry.acknowledged = true;
  }
  return a;
}

AlertManager::BulkAcknowledgement AlertManager::acknowledge_many(const std::vector<int64_t>& alert_ids,
                                                                 const std::string& by, Timestamp now) {
  BulkAcknowledgement out{};
  std::lock_guard<std::mutex> lk(mu_);
  for (int64_t id : alert_ids) {
    auto existing = store_.find_alert(id);
    if (!existing) {
      out.not_found.push_back(id);
      continue;
    }
    if (existing->acknowledged) continue;
    (void)store_.acknowledge_alert(id, by, now);
    out.acknowledged.push_back(id);
    for (auto& [key, entry] : cooldowns_) {
      if (entry.alert_id == id) entry.acknowledged = true;
    }
  }
  return out;
}

void AlertManager::dispatch(const Alert& alert) {
  std::vector<std::shared_ptr<IAlertSink>> sinks;
  {
    std::lock_guard<std::mutex> lk(mu_);
    sinks = sinks_;
  }
  for (auto& s : sinks) {
    try {
      s->deliver(alert);
    } catch (const std::exception& e) {
      std::fprintf(stderr, "sloguard: alert sink %s failed: %s\n", s->name(), e.what());
    }
  }
}

} // namespace sloguard::engine
