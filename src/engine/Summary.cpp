#include "engine/Summary.hpp"
#include "engine/Errors.hpp"
#include "engine/Evaluator.hpp"
#include "util/TimeFormat.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace sloguard::engine {

using sloguard::model::AlertSeverity;
using sloguard::model::BurnRateSnapshot;
using sloguard::model::Forecast;
using sloguard::model::RiskLevel;
using sloguard::model::Timestamp;

namespace {

std::optional<Forecast> forecast_for(const sloguard::store::IStore& store, const BurnRateSnapshot& worst,
                                     size_t points) {
  auto hist = store.snapshot_history(worst.service, worst.slo_id, Timestamp{}, points);
  if (hist.empty()) return std::nullopt;
  return forecast_from_history(hist, points);
}

double risk_factor(RiskLevel r) {
  switch (r) {
    case RiskLevel::Safe: return 1.0;
    case RiskLevel::Observe: return 0.9;
    case RiskLevel::Danger: return 0.7;
    case RiskLevel::Freeze: return 0.4;
  }
  return 1.0;
}

double round2(double v) { return std::round(v * 100.0) / 100.0; }

Timestamp period_start(Timestamp now, int days) {
  if (days < 1 || days > 366) throw ValidationError("days must be between 1 and 366");
  return now - std::chrono::hours(24 * days);
}

std::string join(const std::vector<std::string>& v, size_t max_items) {
  std::string out;
  for (size_t i = 0; i < v.size() && i < max_items; ++i) {
    if (i) out += ", ";
    out += v[i];
  }
  return out;
}

} // namespace

std::vector<ServiceStatus> collect_status(const sloguard::store::IStore& store, size_t forecast_points) {
  std::vector<ServiceStatus> out;
  for (auto& svc : store.list_services(true)) {
    ServiceStatus st{};
    st.worst = worst_latest_snapshot(store, svc.name);
    if (st.worst) st.forecast = forecast_for(store, *st.worst, forecast_points);
    st.service = std::move(svc);
    out.push_back(std::move(st));
  }
  return out;
}

std::vector<Forecast> all_forecasts(const sloguard::store::IStore& store, size_t forecast_points) {
  std::vector<Forecast> out;
  for (auto& st : collect_status(store, forecast_points)) {
    if (st.forecast) out.push_back(std::move(*st.forecast));
  }
  std::stable_sort(out.begin(), out.end(), [](const Forecast& a, const Forecast& b){
    if (a.time_to_exhaustion_hours && b.time_to_exhaustion_hours)
      return *a.time_to_exhaustion_hours < *b.time_to_exhaustion_hours;
    if (a.time_to_exhaustion_hours != b.time_to_exhaustion_hours) return a.time_to_exhaustion_hours.has_value();
    return a.budget_remaining < b.budget_remaining;
  });
  return out;
}

Forecast service_forecast(const sloguard::store::IStore& store, const std::string& service, Timestamp now,
                          size_t forecast_points) {
  if (!store.find_service(service)) throw NotFoundError("service '" + service + "' not found");
  auto worst = worst_latest_snapshot(store, service);
  if (worst) {
    if (auto f = forecast_for(store, *worst, forecast_points)) return *f;
  }
  Forecast f{};
  f.service = service;
  f.as_of = now;
  f.message = forecast_message(service, f);
  return f;
}

Overview build_overview(const sloguard::store::IStore& store, Timestamp now, size_t forecast_points) {
  Overview o{};
  o.generated_at = now;
  o.total_services = static_cast<int>(store.list_services(false).size());
  auto statuses = collect_status(store, forecast_points);
  o.active_services = static_cast<int>(statuses.size());

  double budget_sum = 0.0;
  double score_sum = 0.0;
  int with_data = 0;
  int freeze_count = 0;
  for (const auto& st : statuses) {
    RiskLevel r = st.worst ? st.worst->risk : RiskLevel::Safe;
    ++o.risk_distribution[static_cast<size_t>(sloguard::model::rank(r))];
    if (r == RiskLevel::Danger || r == RiskLevel::Freeze) o.services_at_risk.push_back(st.service.name);
    if (r == RiskLevel::Freeze) ++freeze_count;
    double remaining = st.worst ? st.worst->budget_remaining : 100.0;
    score_sum += remaining * risk_factor(r);
    if (st.worst) {
      budget_sum += remaining;
      ++with_data;
      if (!o.lowest_budget_service || remaining < o.lowest_budget_remaining) {
        o.lowest_budget_service = st.service.name;
        o.lowest_budget_remaining = remaining;
      }
    }
    if (st.forecast && st.forecast->time_to_exhaustion_hours &&
        *st.forecast->time_to_exhaustion_hours < kNearestExhaustionHorizonHours &&
        (!o.nearest_exhaustion_hours || *st.forecast->time_to_exhaustion_hours < *o.nearest_exhaustion_hours)) {
      o.nearest_exhaustion_hours = st.forecast->time_to_exhaustion_hours;
      o.nearest_exhaustion_service = st.service.name;
    }
  }
  if (with_data > 0) o.average_budget_remaining = budget_sum / with_data;
  o.health_score = statuses.empty() ? 100.0 : score_sum / static_cast<double>(statuses.size());
  if (o.health_score >= 90.0) o.health = "healthy";
  else if (o.health_score >= 70.0) o.health = "degraded";
  else o.health = "critical";

  sloguard::store::AlertQuery q{};
  q.acknowledged = false;
  q.limit = 0;
  for (const auto& a : store.list_alerts(q)) {
    ++o.unacknowledged_alerts;
    if (a.severity == AlertSeverity::Critical || a.severity == AlertSeverity::Emergency) ++o.critical_alerts;
  }

  char buf[256];
  const int n = o.active_services;
  const int at_risk = static_cast<int>(o.services_at_risk.size());
  if (o.health_score >= 95.0) {
    std::snprintf(buf, sizeof(buf), "Platform reliability is excellent with %d services operating normally.", n);
  } else if (o.health_score >= 85.0) {
    std::snprintf(buf, sizeof(buf), "Platform reliability is good. %d of %d services are healthy.", n - at_risk, n);
  } else if (o.health_score >= 70.0) {
    std::snprintf(buf, sizeof(buf), "Platform reliability requires attention. %d services showing elevated error rates.", at_risk);
  } else {
    std::snprintf(buf, sizeof(buf), "Platform reliability is degraded. %d services at risk, %d in deployment freeze.",
                  at_risk, freeze_count);
  }
  o.executive_summary = buf;
  if (!o.services_at_risk.empty()) {
    if (o.services_at_risk.size() <= 3) {
      o.executive_summary += " Services requiring attention: " + join(o.services_at_risk, 3) + ".";
    } else {
      o.executive_summary += " " + std::to_string(o.services_at_risk.size()) +
                             " services require attention including " + join(o.services_at_risk, 3) + ".";
    }
  }
  if (o.nearest_exhaustion_service) {
    o.executive_summary += " Nearest budget exhaustion: " + *o.nearest_exhaustion_service + " in ~" +
                           format_duration_hours(*o.nearest_exhaustion_hours) + ".";
  }

  if (freeze_count > 0) {
    std::vector<std::string> frozen;
    for (const auto& st : statuses)
      if (st.worst && st.worst->risk == RiskLevel::Freeze) frozen.push_back(st.service.name);
    o.action_items.push_back("URGENT: Investigate critical issues in " + join(frozen, frozen.size()));
  }
  if (o.nearest_exhaustion_service)
    o.action_items.emplace_back("Review error budget status and consider deployment freeze for affected services");
  if (!o.services_at_risk.empty())
    o.action_items.emplace_back("Review recent deployments to at-risk services for potential rollback");
  if (o.action_items.empty())
    o.action_items.emplace_back("Continue monitoring - all systems operating normally");
  return o;
}

std::string narrative_for(const ServiceStatus& st) {
  const auto& name = st.service.name;
  if (!st.worst) return name + " has no completed evaluation yet.";
  const auto& w = *st.worst;
  char buf[320];
  std::snprintf(buf, sizeof(buf),
                "%s (%s) is at %s risk with a composite burn rate of %.2fx and %.1f%% of its error budget remaining.",
                name.c_str(), w.slo_name.c_str(), std::string(sloguard::model::to_string(w.risk)).c_str(),
                w.composite_burn_rate, w.budget_remaining);
  std::string out = buf;
  std::snprintf(buf, sizeof(buf), " Windows: 5m %.2fx, 1h %.2fx, 24h %.2fx.",
                w.burn_rate_5m, w.burn_rate_1h, w.burn_rate_24h);
  out += buf;
  if (st.forecast) out += " " + st.forecast->message;
  switch (w.risk) {
    case RiskLevel::Safe: out += " Deployments may proceed."; break;
    case RiskLevel::Observe: out += " Deployments may proceed with increased monitoring."; break;
    case RiskLevel::Danger: out += " Deployments are blocked unless overridden."; break;
    case RiskLevel::Freeze: out += " Deployments are frozen."; break;
  }
  return out;
}

ServiceSummary build_service_summary(const sloguard::store::IStore& store, const ReleaseGate& gate,
                                     const std::string& service, Timestamp now, size_t forecast_points) {
  auto svc = store.find_service(service);
  if (!svc) throw NotFoundError("service '" + service + "' not found");
  ServiceSummary sum{};
  sum.service = *svc;
  for (const auto& t : store.list_targets(service, true)) {
    if (auto s = store.latest_snapshot(service, t.id)) sum.latest.push_back(std::move(*s));
  }
  ServiceStatus st{};
  st.service = *svc;
  if (const auto* w = worst_of(sum.latest)) {
    st.worst = *w;
    st.forecast = forecast_for(store, *w, forecast_points);
  }
  sum.forecast = st.forecast;
  sum.gate = gate.status(service, now);
  sloguard::store::AlertQuery q{};
  q.service = service;
  q.limit = 10;
  sum.recent_alerts = store.list_alerts(q);
  sum.narrative = narrative_for(st);
  return sum;
}

Heatmap build_heatmap(const sloguard::store::IStore& store, Timestamp now, int hours, int interval_hours) {
  if (hours < 1) throw ValidationError("hours must be >= 1");
  if (interval_hours < 1) throw ValidationError("interval_hours must be >= 1");
  if (hours > 24 * 31) throw ValidationError("hours must be <= 744");

  Heatmap h{};
  const auto step = std::chrono::hours(interval_hours);
  const auto half = std::chrono::duration_cast<Timestamp::duration>(step) / 2;
  Timestamp end = sloguard::util::floor_to_hour(now);
  Timestamp start = end - std::chrono::hours(hours);
  for (Timestamp t = start; t <= end; t += step) h.buckets.push_back(t);

  auto services = store.list_services(true);
  std::sort(services.begin(), services.end(),
            [](const auto& a, const auto& b){ return a.name < b.name; });
  for (const auto& svc : services) {
    h.services.push_back(svc.name);
    std::vector<RiskLevel> row(h.buckets.size(), RiskLevel::Safe);
    for (const auto& t : store.list_targets(svc.name, true)) {
      for (const auto& s : store.snapshot_history(svc.name, t.id, start - half, 0)) {
        for (size_t i = 0; i < h.buckets.size(); ++i) {
          auto lo = h.buckets[i] - half;
          auto hi = h.buckets[i] + half;
          if (s.ts >= lo && s.ts < hi && sloguard::model::rank(s.risk) > sloguard::model::rank(row[i]))
            row[i] = s.risk;
        }
      }
    }
    h.cells.push_back(std::move(row));
  }
  return h;
}

GateStatistics gate_statistics(const sloguard::store::IStore& store, Timestamp now, int days,
                               const std::string& service) {
  GateStatistics g{};
  g.period_days = days;
  Timestamp since = period_start(now, days);
  for (const auto& d : store.list_decisions(service, 0)) {
    if (d.checked_at < since) continue;
    ++g.total;
    if (d.allowed) ++g.allowed;
    else ++g.blocked;
    if (d.allowed && d.overridden) ++g.overridden;
    ++g.risk_distribution[static_cast<size_t>(sloguard::model::rank(d.risk))];
  }
  if (g.total > 0) g.block_rate = round2(100.0 * g.blocked / g.total);
  return g;
}

AlertStatistics alert_statistics(const sloguard::store::IStore& store, Timestamp now, int days) {
  AlertStatistics a{};
  a.period_days = days;
  Timestamp since = period_start(now, days);
  sloguard::store::AlertQuery q{};
  q.limit = 0;
  for (const auto& al : store.list_alerts(q)) {
    if (al.ts < since) continue;
    ++a.total;
    ++a.by_severity[static_cast<size_t>(al.severity)];
    if (!al.acknowledged) ++a.unacknowledged;
    if (al.kind == sloguard::model::AlertKind::Operational) ++a.operational;
  }
  return a;
}

double target_compliance(const sloguard::model::SloTarget& target,
                         const std::optional<sloguard::model::LedgerEntry>& ledger) {
  if (!ledger) return 100.0;
  double elapsed = sloguard::model::hours_between(ledger->window_start, ledger->last_update);
  if (elapsed <= 0.0) return 100.0;
  double attained = std::clamp(100.0 * (1.0 - ledger->consumed / elapsed), 0.0, 100.0);
  return std::min(attained / target.target_value * 100.0, 100.0);
}

GlobalCompliance global_compliance(const sloguard::store::IStore& store) {
  GlobalCompliance g{};
  auto services = store.list_services(true);
  std::sort(services.begin(), services.end(),
            [](const auto& a, const auto& b){ return a.name < b.name; });
  double sum = 0.0;
  for (const auto& svc : services) {
    ServiceCompliance c{};
    c.service = svc.name;
    auto targets = store.list_targets(svc.name, true);
    if (!targets.empty()) {
      double total = 0.0;
      for (const auto& t : targets) total += target_compliance(t, store.load_ledger(svc.name, t.id));
      c.compliance = total / static_cast<double>(targets.size());
    }
    c.meeting_slo = c.compliance >= 100.0;
    sum += c.compliance;
    if (c.meeting_slo) ++g.services_meeting_slo;
    else g.services_at_risk.push_back(svc.name);
    c.compliance = round2(c.compliance);
    g.services.push_back(std::move(c));
  }
  g.total_services = static_cast<int>(services.size());
  if (g.total_services > 0) g.global_compliance = round2(sum / g.total_services);
  return g;
}

} // namespace sloguard::engine
