#include "app/JsonCodec.hpp"
#include "engine/Errors.hpp"
#include "util/Strings.hpp"
#include "util/TimeFormat.hpp"
#include <limits>

using nlohmann::json;
using sloguard::engine::ValidationError;
using sloguard::util::format_iso8601;

namespace {

json opt_double(const std::optional<double>& v) {
  return v ? json(*v) : json(nullptr);
}

json opt_time(const std::optional<sloguard::model::Timestamp>& t) {
  return t ? json(format_iso8601(*t)) : json(nullptr);
}

const json* field(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) return nullptr;
  return &*it;
}

std::string get_string(const json& j, const char* key, const std::string& def = "") {
  const json* v = field(j, key);
  if (!v) return def;
  if (!v->is_string()) throw ValidationError(std::string("field '") + key + "' must be a string");
  return v->get<std::string>();
}

double get_double(const json& j, const char* key, double def) {
  const json* v = field(j, key);
  if (!v) return def;
  if (!v->is_number()) throw ValidationError(std::string("field '") + key + "' must be a number");
  return v->get<double>();
}

int get_int(const json& j, const char* key, int def) {
  const json* v = field(j, key);
  if (!v) return def;
  if (!v->is_number_integer()) throw ValidationError(std::string("field '") + key + "' must be an integer");
  if (v->is_number_unsigned() ? v->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int>::max())
                              : (v->get<int64_t>() < std::numeric_limits<int>::min() ||
                                 v->get<int64_t>() > std::numeric_limits<int>::max()))
    throw ValidationError(std::string("field '") + key + "' is out of range");
  return v->get<int>();
}

bool get_bool(const json& j, const char* key, bool def) {
  const json* v = field(j, key);
  if (!v) return def;
  if (!v->is_boolean()) throw ValidationError(std::string("field '") + key + "' must be a boolean");
  return v->get<bool>();
}

uint64_t get_count(const json& j, const char* key) {
  const json* v = field(j, key);
  if (!v) return 0;
  if (v->is_number_unsigned()) return v->get<uint64_t>();
  if (v->is_number_integer()) {
    auto n = v->get<int64_t>();
    if (n < 0) throw ValidationError(std::string("field '") + key + "' must not be negative");
    return static_cast<uint64_t>(n);
  }
  throw ValidationError(std::string("field '") + key + "' must be a non-negative integer");
}

void require_object(const json& j) {
  if (!j.is_object()) throw ValidationError("request body must be a JSON object");
}

} // namespace

namespace sloguard::model {

void to_json(json& j, const Service& s) {
  j = json{
    {"name", s.name},
    {"description", s.description},
    {"team", s.team},
    {"tier", s.tier},
    {"is_active", s.active},
    {"created_at", format_iso8601(s.created_at)},
    {"updated_at", format_iso8601(s.updated_at)},
  };
}

void to_json(json& j, const SloTarget& t) {
  j = json{
    {"id", t.id},
    {"service_name", t.service},
    {"name", t.name},
    {"target_value", t.target_value},
    {"window_days", t.window_days},
    {"burn_rate_threshold", t.burn_rate_threshold},
    {"danger_burn_rate", t.danger_burn_rate},
    {"critical_burn_rate", t.critical_burn_rate},
    {"allowed_error_rate", t.allowed_error_rate()},
    {"is_active", t.active},
    {"created_at", format_iso8601(t.created_at)},
  };
}

void to_json(json& j, const BurnRateSnapshot& s) {
  j = json{
    {"service_name", s.service},
    {"slo_id", s.slo_id},
    {"slo_name", s.slo_name},
    {"timestamp", format_iso8601(s.ts)},
    {"error_rate_5m", s.error_rate_5m},
    {"error_rate_1h", s.error_rate_1h},
    {"error_rate_24h", s.error_rate_24h},
    {"burn_rate_5m", s.burn_rate_5m},
    {"burn_rate_1h", s.burn_rate_1h},
    {"burn_rate_24h", s.burn_rate_24h},
    {"composite_burn_rate", s.composite_burn_rate},
    {"budget_consumed_percent", s.budget_consumed},
    {"budget_remaining_percent", s.budget_remaining},
    {"risk_level", std::string(to_string(s.risk))},
  };
}

void to_json(json& j, const Forecast& f) {
  j = json{
    {"service_name", f.service},
    {"slo_id", f.slo_id},
    {"as_of", format_iso8601(f.as_of)},
    {"current_burn_rate", f.current_burn_rate},
    {"budget_remaining_percent", f.budget_remaining},
    {"trend_slope", f.trend_slope},
    {"intercept", f.intercept},
    {"r_squared", f.r_squared},
    {"data_points", f.points},
    {"trend_direction", std::string(to_string(f.trend))},
    {"time_to_exhaustion_hours", opt_double(f.time_to_exhaustion_hours)},
    {"projected_exhaustion_time", opt_time(f.projected_exhaustion)},
    {"confidence", std::string(to_string(f.confidence))},
    {"message", f.message},
  };
}

void to_json(json& j, const ReleaseDecision& d) {
  j = json{
    {"id", d.id},
    {"service_name", d.service},
    {"deployment_id", d.deployment_id},
    {"version", d.version},
    {"requested_by", d.requested_by},
    {"state", std::string(to_string(d.state))},
    {"allowed", d.allowed},
    {"overridden", d.overridden},
    {"override_reason", d.override_reason.empty() ? json(nullptr) : json(d.override_reason)},
    {"reason", d.reason},
    {"risk_level", std::string(to_string(d.risk))},
    {"composite_burn_rate", d.composite_burn_rate},
    {"budget_remaining_percent", d.budget_remaining},
    {"time_to_exhaustion_hours", opt_double(d.time_to_exhaustion_hours)},
    {"snapshot_at", opt_time(d.snapshot_at)},
    {"checked_at", format_iso8601(d.checked_at)},
    {"recommendations", d.recommendations},
  };
}

void to_json(json& j, const Alert& a) {
  j = json{
    {"id", a.id},
    {"service_name", a.service},
    {"kind", std::string(to_string(a.kind))},
    {"severity", std::string(to_string(a.severity))},
    {"risk_level", std::string(to_string(a.risk))},
    {"title", a.title},
    {"message", a.message},
    {"timestamp", format_iso8601(a.ts)},
    {"acknowledged", a.acknowledged},
    {"acknowledged_by", a.acknowledged_by.empty() ? json(nullptr) : json(a.acknowledged_by)},
    {"acknowledged_at", opt_time(a.acknowledged_at)},
  };
}

} // namespace sloguard::model

namespace sloguard::engine {

namespace {

json risk_counts(const std::array<int, 4>& counts) {
  json dist = json::object();
  for (auto r : {model::RiskLevel::Safe, model::RiskLevel::Observe, model::RiskLevel::Danger, model::RiskLevel::Freeze})
    dist[std::string(model::to_string(r))] = counts[static_cast<size_t>(model::rank(r))];
  return dist;
}

} // namespace

void to_json(json& j, const Overview& o) {
  json dist = risk_counts(o.risk_distribution);
  j = json{
    {"generated_at", format_iso8601(o.generated_at)},
    {"total_services", o.total_services},
    {"active_services", o.active_services},
    {"risk_distribution", dist},
    {"services_at_risk", o.services_at_risk},
    {"average_budget_remaining", o.average_budget_remaining},
    {"lowest_budget_service", o.lowest_budget_service ? json(*o.lowest_budget_service) : json(nullptr)},
    {"lowest_budget_remaining", o.lowest_budget_service ? json(o.lowest_budget_remaining) : json(nullptr)},
    {"nearest_exhaustion_service", o.nearest_exhaustion_service ? json(*o.nearest_exhaustion_service) : json(nullptr)},
    {"nearest_exhaustion_hours", opt_double(o.nearest_exhaustion_hours)},
    {"unacknowledged_alerts", o.unacknowledged_alerts},
    {"critical_alerts", o.critical_alerts},
    {"overall_health", o.health},
    {"health_score", o.health_score},
    {"executive_summary", o.executive_summary},
    {"action_items", o.action_items},
  };
}

void to_json(json& j, const ServiceSummary& s) {
  j = json{
    {"service", s.service},
    {"latest", s.latest},
    {"forecast", s.forecast ? json(*s.forecast) : json(nullptr)},
    {"release_status", s.gate},
    {"recent_alerts", s.recent_alerts},
    {"narrative", s.narrative},
  };
}

void to_json(json& j, const Heatmap& h) {
  json buckets = json::array();
  for (auto t : h.buckets) buckets.push_back(format_iso8601(t));
  json rows = json::array();
  for (size_t i = 0; i < h.services.size(); ++i) {
    json cells = json::array();
    for (auto r : h.cells[i]) cells.push_back(std::string(model::to_string(r)));
    rows.push_back(json{{"service_name", h.services[i]}, {"cells", cells}});
  }
  j = json{{"services", h.services}, {"timestamps", buckets}, {"rows", rows}};
}

void to_json(json& j, const GateStatistics& g) {
  j = json{
    {"period_days", g.period_days},
    {"total_deployments", g.total},
    {"blocked_deployments", g.blocked},
    {"allowed_deployments", g.allowed},
    {"overridden_deployments", g.overridden},
    {"block_rate", g.block_rate},
    {"risk_distribution", risk_counts(g.risk_distribution)},
  };
}

void to_json(json& j, const AlertStatistics& a) {
  json by = json::object();
  for (auto s : {model::AlertSeverity::Info, model::AlertSeverity::Warning, model::AlertSeverity::Critical,
                 model::AlertSeverity::Emergency})
    by[std::string(model::to_string(s))] = a.by_severity[static_cast<size_t>(s)];
  j = json{
    {"period_days", a.period_days},
    {"by_severity", by},
    {"total", a.total},
    {"unacknowledged", a.unacknowledged},
    {"operational", a.operational},
  };
}

void to_json(json& j, const GlobalCompliance& g) {
  json services = json::array();
  for (const auto& c : g.services)
    services.push_back(json{{"service_name", c.service}, {"compliance", c.compliance}, {"meeting_slo", c.meeting_slo}});
  j = json{
    {"total_services", g.total_services},
    {"services_meeting_slo", g.services_meeting_slo},
    {"global_compliance", g.global_compliance},
    {"services_at_risk", g.services_at_risk},
    {"services", services},
  };
}

} // namespace sloguard::engine

namespace sloguard::app {

json parse_body(const std::string& body) {
  if (sloguard::util::is_blank(body)) return json::object();
  try {
    return json::parse(body);
  } catch (const json::parse_error& e) {
    throw ValidationError(std::string("malformed JSON body: ") + e.what());
  }
}

sloguard::model::Service service_from_json(const json& j) {
  require_object(j);
  sloguard::model::Service s{};
  s.name = get_string(j, "name");
  s.description = get_string(j, "description");
  s.team = get_string(j, "team");
  s.tier = get_int(j, "tier", s.tier);
  s.active = get_bool(j, "is_active", s.active);
  return s;
}

void apply_service_update(sloguard::model::Service& s, const json& j) {
  require_object(j);
  if (field(j, "name") && get_string(j, "name") != s.name)
    throw ValidationError("service name cannot be changed");
  s.description = get_string(j, "description", s.description);
  s.team = get_string(j, "team", s.team);
  s.tier = get_int(j, "tier", s.tier);
  s.active = get_bool(j, "is_active", s.active);
}

sloguard::model::SloTarget target_from_json(const json& j, const std::string& service) {
  require_object(j);
  sloguard::model::SloTarget t{};
  t.service = service;
  apply_target_update(t, j);
  return t;
}

void apply_target_update(sloguard::model::SloTarget& t, const json& j) {
  require_object(j);
  t.name = get_string(j, "name", t.name);
  t.target_value = get_double(j, "target_value", t.target_value);
  t.window_days = get_int(j, "window_days", t.window_days);
  t.burn_rate_threshold = get_double(j, "burn_rate_threshold", t.burn_rate_threshold);
  t.danger_burn_rate = get_double(j, "danger_burn_rate", t.danger_burn_rate);
  t.critical_burn_rate = get_double(j, "critical_burn_rate", t.critical_burn_rate);
  t.active = get_bool(j, "is_active", t.active);
}

sloguard::model::ReleaseRequest release_request_from_json(const json& j, const std::string& service) {
  require_object(j);
  sloguard::model::ReleaseRequest r{};
  r.service = service.empty() ? get_string(j, "service_name") : service;
  r.deployment_id = get_string(j, "deployment_id");
  r.version = get_string(j, "version");
  r.requested_by = get_string(j, "requested_by");
  r.override_requested = get_bool(j, "override", false);
  r.override_reason = get_string(j, "override_reason");
  return r;
}

std::vector<std::pair<std::string, sloguard::model::Sample>> samples_from_json(const json& j) {
  require_object(j);
  const json* arr = field(j, "samples");
  if (!arr || !arr->is_array()) throw ValidationError("field 'samples' must be an array");
  std::vector<std::pair<std::string, sloguard::model::Sample>> out;
  out.reserve(arr->size());
  for (const auto& item : *arr) {
    require_object(item);
    std::string service = get_string(item, "service");
    if (sloguard::util::is_blank(service)) throw ValidationError("sample is missing 'service'");

    sloguard::model::Sample s{};
    const json* ts = field(item, "timestamp");
    if (!ts) throw ValidationError("sample is missing 'timestamp'");
    if (ts->is_string()) {
      auto parsed = sloguard::util::parse_iso8601(ts->get<std::string>());
      if (!parsed) throw ValidationError("invalid timestamp '" + ts->get<std::string>() + "'");
      s.ts = *parsed;
    } else if (ts->is_number()) {
      auto parsed = sloguard::util::from_epoch_seconds(ts->get<double>());
      if (!parsed) throw ValidationError("timestamp " + ts->dump() + " is outside 1970-2099");
      s.ts = *parsed;
    } else {
      throw ValidationError("field 'timestamp' must be an ISO-8601 string or epoch seconds");
    }

    s.errors = get_count(item, "error_count");
    if (field(item, "success_count")) {
      s.success = get_count(item, "success_count");
    } else {
      uint64_t total = get_count(item, "total_requests");
      if (total < s.errors) throw ValidationError("error_count exceeds total_requests");
      s.success = total - s.errors;
    }
    out.emplace_back(std::move(service), s);
  }
  return out;
}

json error_json(const std::string& kind, const std::string& detail) {
  return json{{"error", kind}, {"detail", detail}};
}

} // namespace sloguard::app
