#include "store/MemoryStore.hpp"
#include "engine/Errors.hpp"
#include <algorithm>

namespace sloguard::store {

using namespace sloguard::model;
using sloguard::engine::ConflictError;
using sloguard::engine::NotFoundError;

MemoryStore::MemoryStore(size_t history_limit) : history_limit_(history_limit > 0 ? history_limit : 1) {}

std::vector<Service> MemoryStore::list_services(bool active_only) const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<Service> out;
  out.reserve(services_.size());
  for (const auto& [name, s] : services_) {
    if (active_only && !s.active) continue;
    out.push_back(s);
  }
  return out;
}

std::optional<Service> MemoryStore::find_service(const std::string& name) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = services_.find(name);
  if (it == services_.end()) return std::nullopt;
  return it->second;
}

Service MemoryStore::create_service(Service s) {
  std::lock_guard<std::mutex> lk(mu_);
  if (services_.contains(s.name)) throw ConflictError("service '" + s.name + "' already exists");
  if (s.created_at == Timestamp{}) s.created_at = Clock::now();
  s.updated_at = s.created_at;
  services_.emplace(s.name, s);
  return s;
}

Service MemoryStore::update_service(const Service& s) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = services_.find(s.name);
  if (it == services_.end()) throw NotFoundError("service '" + s.name + "' not found");
  Service updated = s;
  updated.created_at = it->second.created_at;
  updated.updated_at = Clock::now();
  it->second = updated;
  return updated;
}

void MemoryStore::deactivate_service(const std::string& name) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = services_.find(name);
  if (it == services_.end()) throw NotFoundError("service '" + name + "' not found");
  it->second.active = false;
  it->second.updated_at = Clock::now();
}

std::vector<SloTarget> MemoryStore::list_targets(const std::string& service, bool active_only) const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<SloTarget> out;
  for (const auto& [id, t] : targets_) {
    if (t.service != service) continue;
    if (active_only && !t.active) continue;
    out.push_back(t);
  }
  return out;
}

std::optional<SloTarget> MemoryStore::find_target(int64_t id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = targets_.find(id);
  if (it == targets_.end()) return std::nullopt;
  return it->second;
}

SloTarget MemoryStore::create_target(SloTarget t) {
  std::lock_guard<std::mutex> lk(mu_);
  if (!services_.contains(t.service)) throw NotFoundError("service '" + t.service + "' not found");
  t.id = next_target_id_++;
  if (t.created_at == Timestamp{}) t.created_at = Clock::now();
  targets_.emplace(t.id, t);
  return t;
}

SloTarget MemoryStore::update_target(const SloTarget& t) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = targets_.find(t.id);
  if (it == targets_.end()) throw NotFoundError("SLO target " + std::to_string(t.id) + " not found");
  SloTarget updated = t;
  // Identity and window anchor are fixed at creation
  updated.service = it->second.service;
  updated.created_at = it->second.created_at;
  it->second = updated;
  return updated;
}

void MemoryStore::append_samples(const std::string& service, const std::vector<Sample>& samples) {
  std::lock_guard<std::mutex> lk(mu_);
  if (!services_.contains(service)) throw NotFoundError("service '" + service + "' not found");
  auto& series = samples_[service];
  for (const auto& s : samples) {
    if (series.empty() || series.back().ts <= s.ts) {
      series.push_back(s);
    } else {
      auto pos = std::upper_bound(series.begin(), series.end(), s.ts,
                                  [](Timestamp t, const Sample& x){ return t < x.ts; });
      series.insert(pos, s);
    }
  }
}

std::vector<Sample> MemoryStore::samples_between(const std::string& service, Timestamp from, Timestamp to) const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<Sample> out;
  auto it = samples_.find(service);
  if (it == samples_.end() || to < from) return out;
  const auto& series = it->second;
  auto first = std::lower_bound(series.begin(), series.end(), from,
                                [](const Sample& x, Timestamp t){ return x.ts < t; });
  auto last = std::upper_bound(first, series.end(), to,
                               [](Timestamp t, const Sample& x){ return t < x.ts; });
  out.assign(first, last);
  return out;
}

size_t MemoryStore::prune_samples(Timestamp older_than) {
  std::lock_guard<std::mutex> lk(mu_);
  size_t removed = 0;
  for (auto& [name, series] : samples_) {
    auto keep = std::lower_bound(series.begin(), series.end(), older_than,
                                 [](const Sample& x, Timestamp t){ return x.ts < t; });
    removed += static_cast<size_t>(keep - series.begin());
    series.erase(series.begin(), keep);
  }
  return removed;
}

std::optional<LedgerEntry> MemoryStore::load_ledger(const std::string& service, int64_t slo_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = ledgers_.find({service, slo_id});
  if (it == ledgers_.end()) return std::nullopt;
  return it->second;
}

void MemoryStore::commit_evaluation(const LedgerEntry& entry, const BurnRateSnapshot& snapshot) {
  std::lock_guard<std::mutex> lk(mu_);
  SeriesKey key{snapshot.service, snapshot.slo_id};
  auto& hist = history_[key];
  hist.push_back(snapshot);
  while (hist.size() > history_limit_) hist.pop_front();
  ledgers_[{entry.service, entry.slo_id}] = entry;
}

std::optional<BurnRateSnapshot> MemoryStore::latest_snapshot(const std::string& service, int64_t slo_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = history_.find({service, slo_id});
  if (it == history_.end() || it->second.empty()) return std::nullopt;
  return it->second.back();
}

std::vector<BurnRateSnapshot> MemoryStore::snapshot_history(const std::string& service, int64_t slo_id,
                                                            Timestamp since, size_t limit) const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<BurnRateSnapshot> out;
  auto it = history_.find({service, slo_id});
  if (it == history_.end()) return out;
  for (const auto& s : it->second)
    if (s.ts >= since) out.push_back(s);
  if (limit > 0 && out.size() > limit) out.erase(out.begin(), out.end() - static_cast<std::ptrdiff_t>(limit));
  return out;
}

ReleaseDecision MemoryStore::append_decision(ReleaseDecision d) {
  std::lock_guard<std::mutex> lk(mu_);
  d.id = next_decision_id_++;
  decisions_.push_back(d);
  return d;
}

std::vector<ReleaseDecision> MemoryStore::list_decisions(const std::string& service, size_t limit) const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<ReleaseDecision> out;
  for (auto it = decisions_.rbegin(); it != decisions_.rend(); ++it) {
    if (!service.empty() && it->service != service) continue;
    out.push_back(*it);
    if (limit > 0 && out.size() >= limit) break;
  }
  return out;
}

Alert MemoryStore::append_alert(Alert a) {
  std::lock_guard<std::mutex> lk(mu_);
  a.id = next_alert_id_++;
  alerts_.push_back(a);
  return a;
}

std::optional<Alert> MemoryStore::find_alert(int64_t id) const {
  std::lock_guard<std::mutex> lk(mu_);
  for (const auto& a : alerts_)
    if (a.id == id) return a;
  return std::nullopt;
}

Alert MemoryStore::acknowledge_alert(int64_t id, const std::string& by, Timestamp at) {
  std::lock_guard<std::mutex> lk(mu_);
  for (auto& a : alerts_) {
    if (a.id != id) continue;
    if (!a.acknowledged) {
      a.acknowledged = true;
      a.acknowledged_by = by;
      a.acknowledged_at = at;
    }
    return a;
  }
  throw NotFoundError("alert " + std::to_string(id) + " not found");
}

std::vector<Alert> MemoryStore::list_alerts(const AlertQuery& q) const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<Alert> out;
  for (auto it = alerts_.rbegin(); it != alerts_.rend(); ++it) {
    if (!q.service.empty() && it->service != q.service) continue;
    if (q.acknowledged && it->acknowledged != *q.acknowledged) continue;
    out.push_back(*it);
    if (q.limit > 0 && out.size() >= q.limit) break;
  }
  return out;
}

} // namespace sloguard::store
