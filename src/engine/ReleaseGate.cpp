#include "engine/ReleaseGate.hpp"
#include "engine/Errors.hpp"
#include "engine/Evaluator.hpp"
#include "engine/Validation.hpp"
#include "util/Strings.hpp"
#include <cstdio>

namespace sloguard::engine {

using sloguard::model::BurnRateSnapshot;
using sloguard::model::Forecast;
using sloguard::model::GateState;
using sloguard::model::ReleaseDecision;
using sloguard::model::ReleaseRequest;
using sloguard::model::RiskLevel;
using sloguard::model::Timestamp;

namespace {

std::string fmt2(double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.2f", v);
  return buf;
}

void add_risk_recommendations(RiskLevel risk, std::vector<std::string>& recs) {
  switch (risk) {
    case RiskLevel::Safe:
      recs.emplace_back("System is operating normally");
      break;
    case RiskLevel::Observe:
      recs.emplace_back("Increased monitoring recommended");
      recs.emplace_back("Consider smaller deployment batches");
      break;
    case RiskLevel::Danger:
      recs.emplace_back("Require incident-commander sign-off");
      recs.emplace_back("Wait for the service to stabilise or provide an override with justification");
      break;
    case RiskLevel::Freeze:
      recs.emplace_back("Halt non-critical deploys");
      recs.emplace_back("Investigate and resolve active incidents before deploying");
      recs.emplace_back("Consider rolling back recent changes");
      break;
  }
}

} // namespace

ReleaseDecision decide(const ReleaseRequest& req, const std::optional<BurnRateSnapshot>& snapshot,
                       const std::optional<Forecast>& forecast, Timestamp now) {
  ReleaseDecision d{};
  d.service = req.service;
  d.deployment_id = req.deployment_id;
  d.version = req.version;
  d.requested_by = req.requested_by.empty() ? std::string("system") : req.requested_by;
  d.checked_at = now;
  d.state = GateState::Evaluating;

  if (snapshot) {
    d.risk = snapshot->risk;
    d.composite_burn_rate = snapshot->composite_burn_rate;
    d.budget_remaining = snapshot->budget_remaining;
    d.snapshot_at = snapshot->ts;
  } else {
    d.risk = RiskLevel::Safe;
    d.composite_burn_rate = 0.0;
    d.budget_remaining = 100.0;
  }
  if (forecast) d.time_to_exhaustion_hours = forecast->time_to_exhaustion_hours;

  const bool override_ok = req.override_requested && !util::is_blank(req.override_reason);
  const std::string level(sloguard::model::to_string(d.risk));

  switch (d.risk) {
    case RiskLevel::Safe:
      d.state = GateState::Allowed;
      d.reason = snapshot ? "Deployment allowed: system is operating normally"
                          : "Deployment allowed: no completed evaluation for " + req.service + " yet";
      break;
    case RiskLevel::Observe:
      d.state = GateState::Allowed;
      d.reason = "Deployment allowed with caution: OBSERVE state (composite burn rate " +
                 fmt2(d.composite_burn_rate) + "x), increased monitoring recommended";
      break;
    case RiskLevel::Danger:
    case RiskLevel::Freeze:
      if (override_ok) {
        d.state = GateState::Allowed;
        d.overridden = true;
        d.override_reason = req.override_reason;
        d.reason = "OVERRIDE: Deployment allowed despite " + level + " state. Reason: " + req.override_reason;
      } else {
        d.state = GateState::Blocked;
        d.reason = d.risk == RiskLevel::Freeze
                       ? "Deployment blocked: FREEZE state. Error budget is burning at " +
                             fmt2(d.composite_burn_rate) + "x the allowed rate"
                       : "Deployment blocked: DANGER state. System is in DANGER state, consider waiting";
      }
      break;
  }
  d.allowed = d.state == GateState::Allowed;

  if (!snapshot) d.recommendations.emplace_back("No evaluation has completed yet; decision assumes zero observed burn");
  add_risk_recommendations(d.risk, d.recommendations);
  if (d.overridden) d.recommendations.emplace_back("Override in effect: monitor closely and be ready to roll back");
  if (d.time_to_exhaustion_hours && *d.time_to_exhaustion_hours < kExhaustionWarningHours) {
    char buf[96];
    std::snprintf(buf, sizeof(buf), "Error budget will be exhausted in ~%.1f hours", *d.time_to_exhaustion_hours);
    d.recommendations.emplace_back(buf);
  }
  return d;
}

std::optional<BurnRateSnapshot> worst_latest_snapshot(const sloguard::store::IStore& store, const std::string& service) {
  std::vector<BurnRateSnapshot> latest;
  for (const auto& t : store.list_targets(service, true)) {
    if (auto snap = store.latest_snapshot(service, t.id)) latest.push_back(std::move(*snap));
  }
  const auto* worst = worst_of(latest);
  if (!worst) return std::nullopt;
  return *worst;
}

ReleaseGate::ReleaseGate(sloguard::store::IStore& store, size_t forecast_points)
    : store_(store), forecast_points_(forecast_points) {}

ReleaseDecision ReleaseGate::evaluate(const ReleaseRequest& req, Timestamp now) const {
  if (!store_.find_service(req.service)) throw NotFoundError("service '" + req.service + "' not found");
  auto snap = worst_latest_snapshot(store_, req.service);
  std::optional<Forecast> fc;
  if (snap) {
    auto hist = store_.snapshot_history(req.service, snap->slo_id, Timestamp{}, forecast_points_);
    fc = forecast_from_history(hist, forecast_points_);
  }
  return decide(req, snap, fc, now);
}

ReleaseDecision ReleaseGate::check(const ReleaseRequest& req, Timestamp now) {
  validate_release_request(req);
  ReleaseDecision d = evaluate(req, now);
  d = store_.append_decision(d);
  std::fprintf(stderr, "sloguard: release gate: %s %s deployment %s (risk %s)%s\n",
               d.service.c_str(), d.allowed ? "allowed" : "blocked", d.deployment_id.c_str(),
               std::string(sloguard::model::to_string(d.risk)).c_str(), d.overridden ? " [override]" : "");
  return d;
}

ReleaseDecision ReleaseGate::status(const std::string& service, Timestamp now) const {
  ReleaseRequest req{};
  req.service = service;
  return evaluate(req, now);
}

std::vector<ReleaseDecision> ReleaseGate::history(const std::string& service, size_t limit) const {
  return store_.list_decisions(service, limit);
}

} // namespace sloguard::engine
