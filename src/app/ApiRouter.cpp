#include "app/ApiRouter.hpp"
#include "app/Exposition.hpp"
#include "app/JsonCodec.hpp"
#include "engine/Errors.hpp"
#include "engine/Summary.hpp"
#include "engine/Validation.hpp"
#include "util/Log.hpp"
#include "util/Strings.hpp"
#include "util/TimeFormat.hpp"
#include <algorithm>
#include <charconv>
#include <cstdio>
#include <map>

using nlohmann::json;

namespace sloguard::app {

using sloguard::engine::NotFoundError;
using sloguard::engine::ValidationError;
using sloguard::model::Timestamp;

namespace {

HttpResponse json_response(int status, const json& body) {
  HttpResponse r{};
  r.status = status;
  r.body = body.dump();
  return r;
}

HttpResponse error_response(int status, const std::string& kind, const std::string& detail) {
  return json_response(status, error_json(kind, detail));
}

HttpResponse method_not_allowed(const HttpRequest& req) {
  return error_response(405, "method_not_allowed", req.method + " is not supported on " + req.path);
}

HttpResponse route_not_found(const HttpRequest& req) {
  return error_response(404, "not_found", "no route for " + req.path);
}

std::vector<std::string_view> split_path(std::string_view path) {
  std::vector<std::string_view> out;
  while (!path.empty()) {
    auto slash = path.find('/');
    auto part = path.substr(0, slash);
    if (!part.empty()) out.push_back(part);
    if (slash == std::string_view::npos) break;
    path.remove_prefix(slash + 1);
  }
  return out;
}

std::optional<int64_t> parse_id(std::string_view s) {
  int64_t v = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
  return v;
}

int query_int(const HttpRequest& req, const char* key, int def, int lo, int hi) {
  auto it = req.query.find(key);
  if (it == req.query.end() || it->second.empty()) return def;
  int v = 0;
  const auto& s = it->second;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc{} || ptr != s.data() + s.size())
    throw ValidationError(std::string("query parameter '") + key + "' must be an integer");
  if (v < lo || v > hi)
    throw ValidationError(std::string("query parameter '") + key + "' must be between " +
                          std::to_string(lo) + " and " + std::to_string(hi));
  return v;
}

std::optional<bool> query_bool(const HttpRequest& req, const char* key) {
  auto it = req.query.find(key);
  if (it == req.query.end() || it->second.empty()) return std::nullopt;
  const auto& v = it->second;
  if (sloguard::util::iequals(v, "true") || v == "1") return true;
  if (sloguard::util::iequals(v, "false") || v == "0") return false;
  throw ValidationError(std::string("query parameter '") + key + "' must be true or false");
}

std::string query_string(const HttpRequest& req, const char* key) {
  auto it = req.query.find(key);
  return it == req.query.end() ? std::string{} : it->second;
}

bool is_write(const HttpRequest& req) {
  return req.method == "PUT" || req.method == "PATCH";
}

} // namespace

ApiRouter::ApiRouter(sloguard::store::IStore& store, Scheduler& scheduler, sloguard::engine::ReleaseGate& gate,
                     sloguard::engine::AlertManager& alerts, const Config& config, ClockFn clock)
    : store_(store), scheduler_(scheduler), gate_(gate), alerts_(alerts), config_(config),
      clock_(std::move(clock)) {}

Timestamp ApiRouter::now() const {
  return clock_ ? clock_() : sloguard::model::Clock::now();
}

size_t ApiRouter::forecast_points() const {
  return static_cast<size_t>(std::max(2, config_.engine.forecast_points));
}

void ApiRouter::require_service(const std::string& name) const {
  if (!store_.find_service(name)) throw NotFoundError("service '" + name + "' not found");
}

HttpResponse ApiRouter::handle(const HttpRequest& req) {
  std::string_view path = req.path;
  const auto& prefix = config_.server.api_prefix;
  if (!prefix.empty() && path.starts_with(prefix) &&
      (path.size() == prefix.size() || path[prefix.size()] == '/'))
    path.remove_prefix(prefix.size());

  try {
    return route(req, split_path(path));
  } catch (const ValidationError& e) {
    return error_response(400, "validation_error", e.what());
  } catch (const NotFoundError& e) {
    return error_response(404, "not_found", e.what());
  } catch (const sloguard::engine::ConflictError& e) {
    return error_response(409, "conflict", e.what());
  } catch (const sloguard::engine::StorageError& e) {
    std::fprintf(stderr, "sloguard: api: %s %s: storage error: %s\n", req.method.c_str(), req.path.c_str(), e.what());
    return error_response(500, "storage_error", e.what());
  } catch (const json::exception& e) {
    return error_response(400, "validation_error", e.what());
  } catch (const std::exception& e) {
    std::fprintf(stderr, "sloguard: api: %s %s: %s\n", req.method.c_str(), req.path.c_str(), e.what());
    return error_response(500, "internal_error", e.what());
  }
}

HttpResponse ApiRouter::route(const HttpRequest& req, const Segments& seg) {
  if (seg.empty()) {
    if (req.method != "GET") return method_not_allowed(req);
    return json_response(200, json{{"name", "sloguard"}, {"status", "running"}, {"api_prefix", config_.server.api_prefix}});
  }
  const auto head = seg[0];
  if (head == "health") {
    if (seg.size() != 1) return route_not_found(req);
    if (req.method != "GET") return method_not_allowed(req);
    return health();
  }
  if (head == "services") return services(req, seg);
  if (head == "slo") return slo(req, seg);
  if (head == "burn") return burn(req, seg);
  if (head == "forecast") return forecast(req, seg);
  if (head == "release") return release(req, seg);
  if (head == "summary") return summary(req, seg);
  if (head == "alerts") return alerts(req, seg);
  if (head == "metrics") return metrics(req, seg);
  return route_not_found(req);
}

HttpResponse ApiRouter::health() {
  return json_response(200, json{
    {"status", "healthy"},
    {"timestamp", sloguard::util::format_iso8601(now())},
    {"active_services", store_.list_services(true).size()},
    {"completed_ticks", scheduler_.completed_ticks()},
    {"failed_ticks", scheduler_.failed_ticks()},
    {"storage", config_.storage.database_url},
  });
}

// ---- Services ----

HttpResponse ApiRouter::services(const HttpRequest& req, const Segments& seg) {
  if (seg.size() == 1) {
    if (req.method == "GET") {
      auto list = store_.list_services(query_bool(req, "active_only").value_or(false));
      return json_response(200, json{{"services", list}, {"total", list.size()}});
    }
    if (req.method == "POST") {
      auto svc = service_from_json(parse_body(req.body));
      sloguard::engine::validate_service(svc);
      svc.created_at = now();
      svc = store_.create_service(svc);
      std::fprintf(stderr, "sloguard: api: registered service %s\n", svc.name.c_str());
      return json_response(201, svc);
    }
    return method_not_allowed(req);
  }
  if (seg.size() != 2) return route_not_found(req);

  std::string name(seg[1]);
  if (req.method == "GET") {
    auto svc = store_.find_service(name);
    if (!svc) throw NotFoundError("service '" + name + "' not found");
    return json_response(200, *svc);
  }
  if (is_write(req)) {
    auto svc = store_.find_service(name);
    if (!svc) throw NotFoundError("service '" + name + "' not found");
    apply_service_update(*svc, parse_body(req.body));
    sloguard::engine::validate_service(*svc);
    return json_response(200, store_.update_service(*svc));
  }
  if (req.method == "DELETE") {
    store_.deactivate_service(name);
    HttpResponse r{};
    r.status = 204;
    return r;
  }
  return method_not_allowed(req);
}

// ---- SLO targets ----

HttpResponse ApiRouter::slo(const HttpRequest& req, const Segments& seg) {
  if (seg.size() == 3 && seg[1] == "compliance" && seg[2] == "global") {
    if (req.method != "GET") return method_not_allowed(req);
    return json_response(200, sloguard::engine::global_compliance(store_));
  }
  if (seg.size() == 3 && seg[1] == "targets") {
    if (!is_write(req)) return method_not_allowed(req);
    auto id = parse_id(seg[2]);
    if (!id) throw ValidationError("target id must be an integer");
    auto target = store_.find_target(*id);
    if (!target) throw NotFoundError("SLO target " + std::to_string(*id) + " not found");
    apply_target_update(*target, parse_body(req.body));
    sloguard::engine::validate_target(*target);
    return json_response(200, store_.update_target(*target));
  }
  if (seg.size() < 2) return route_not_found(req);

  std::string service(seg[1]);
  if (seg.size() == 3 && seg[2] == "targets") {
    if (req.method == "GET") {
      require_service(service);
      return json_response(200, store_.list_targets(service, false));
    }
    if (req.method == "POST") {
      require_service(service);
      auto t = target_from_json(parse_body(req.body), service);
      sloguard::engine::validate_target(t);
      t.created_at = now();
      return json_response(201, store_.create_target(t));
    }
    return method_not_allowed(req);
  }
  if (seg.size() != 2) return route_not_found(req);
  if (req.method != "GET") return method_not_allowed(req);

  auto svc = store_.find_service(service);
  if (!svc) throw NotFoundError("service '" + service + "' not found");
  auto targets = store_.list_targets(service, false);
  json latest = json::array();
  json compliance = json::array();
  for (const auto& t : targets) {
    auto snap = store_.latest_snapshot(service, t.id);
    if (snap) latest.push_back(*snap);
    double remaining = snap ? snap->budget_remaining : 100.0;
    compliance.push_back(json{
      {"slo_id", t.id},
      {"slo_name", t.name},
      {"target_value", t.target_value},
      {"budget_remaining_percent", remaining},
      {"compliant", remaining > 0.0},
      {"risk_level", std::string(sloguard::model::to_string(snap ? snap->risk : sloguard::model::RiskLevel::Safe))},
    });
  }
  return json_response(200, json{{"service", *svc}, {"targets", targets}, {"latest", latest}, {"compliance", compliance}});
}

// ---- Burn rates ----

HttpResponse ApiRouter::burn(const HttpRequest& req, const Segments& seg) {
  if (seg.size() == 1) {
    if (req.method != "GET") return method_not_allowed(req);
    json out = json::array();
    for (const auto& svc : store_.list_services(true)) {
      if (auto w = sloguard::engine::worst_latest_snapshot(store_, svc.name)) out.push_back(*w);
    }
    return json_response(200, out);
  }
  if (seg.size() != 2) return route_not_found(req);

  if (seg[1] == "compute") {
    if (req.method != "POST") return method_not_allowed(req);
    auto body = parse_body(req.body);
    if (!body.is_object()) throw ValidationError("request body must be a JSON object");
    std::string service;
    if (auto it = body.find("service_name"); it != body.end() && !it->is_null()) {
      if (!it->is_string()) throw ValidationError("field 'service_name' must be a string");
      service = it->get<std::string>();
    }
    if (!service.empty()) {
      auto svc = store_.find_service(service);
      if (!svc) throw NotFoundError("service '" + service + "' not found");
      if (!svc->active) throw ValidationError("service '" + service + "' is inactive");
      auto snaps = scheduler_.run_now(service);
      return json_response(200, json{{"computed", snaps}, {"failed", json::array()}});
    }
    json computed = json::array();
    json failed = json::array();
    for (const auto& svc : store_.list_services(true)) {
      try {
        for (auto& s : scheduler_.run_now(svc.name)) computed.push_back(s);
      } catch (const std::exception& e) {
        failed.push_back(json{{"service_name", svc.name}, {"error", e.what()}});
      }
    }
    return json_response(200, json{{"computed", computed}, {"failed", failed}});
  }

  if (req.method != "GET") return method_not_allowed(req);
  std::string service(seg[1]);
  require_service(service);
  int hours = query_int(req, "hours", 24, 1, 24 * 31);
  Timestamp since = now() - std::chrono::hours(hours);

  std::vector<sloguard::model::BurnRateSnapshot> history;
  for (const auto& t : store_.list_targets(service, true)) {
    auto h = store_.snapshot_history(service, t.id, since, 0);
    history.insert(history.end(), h.begin(), h.end());
  }
  std::stable_sort(history.begin(), history.end(), [](const auto& a, const auto& b){ return a.ts < b.ts; });
  double sum = 0.0, peak = 0.0;
  for (const auto& s : history) {
    sum += s.composite_burn_rate;
    peak = std::max(peak, s.composite_burn_rate);
  }
  auto current = sloguard::engine::worst_latest_snapshot(store_, service);
  return json_response(200, json{
    {"service_name", service},
    {"hours", hours},
    {"current", current ? json(*current) : json(nullptr)},
    {"history", history},
    {"average_composite_burn_rate", history.empty() ? 0.0 : sum / static_cast<double>(history.size())},
    {"peak_composite_burn_rate", peak},
  });
}

// ---- Forecasts ----

HttpResponse ApiRouter::forecast(const HttpRequest& req, const Segments& seg) {
  if (req.method != "GET") return method_not_allowed(req);
  if (seg.size() == 1) return json_response(200, sloguard::engine::all_forecasts(store_, forecast_points()));
  if (seg.size() != 2) return route_not_found(req);
  return json_response(200, sloguard::engine::service_forecast(store_, std::string(seg[1]), now(), forecast_points()));
}

// ---- Release gate ----

HttpResponse ApiRouter::release(const HttpRequest& req, const Segments& seg) {
  if (seg.size() == 2 && seg[1] == "check") {
    if (req.method != "POST") return method_not_allowed(req);
    auto r = release_request_from_json(parse_body(req.body));
    return json_response(200, gate_.check(r, now()));
  }
  if (seg.size() == 2 && seg[1] == "statistics") {
    if (req.method != "GET") return method_not_allowed(req);
    std::string service = query_string(req, "service");
    if (!service.empty()) require_service(service);
    int days = query_int(req, "days", 7, 1, 366);
    return json_response(200, sloguard::engine::gate_statistics(store_, now(), days, service));
  }
  if (seg.size() == 2 && seg[1] == "history") {
    if (req.method != "GET") return method_not_allowed(req);
    std::string service = query_string(req, "service");
    if (!service.empty()) require_service(service);
    int limit = query_int(req, "limit", 50, 1, 1000);
    auto decisions = gate_.history(service, static_cast<size_t>(limit));
    return json_response(200, json{{"decisions", decisions}, {"total", decisions.size()}});
  }
  if (seg.size() == 3 && seg[2] == "override") {
    if (req.method != "POST") return method_not_allowed(req);
    auto r = release_request_from_json(parse_body(req.body), std::string(seg[1]));
    r.override_requested = true;
    return json_response(200, gate_.check(r, now()));
  }
  if (seg.size() != 2) return route_not_found(req);
  if (req.method != "GET") return method_not_allowed(req);
  std::string service(seg[1]);
  require_service(service);
  return json_response(200, json{
    {"status", gate_.status(service, now())},
    {"recent_decisions", gate_.history(service, 10)},
  });
}

// ---- Summary ----

HttpResponse ApiRouter::summary(const HttpRequest& req, const Segments& seg) {
  if (req.method != "GET") return method_not_allowed(req);
  if (seg.size() == 1) return json_response(200, sloguard::engine::build_overview(store_, now(), forecast_points()));
  if (seg.size() != 2) return route_not_found(req);
  if (seg[1] == "heatmap") {
    int hours = query_int(req, "hours", 24, 1, 24 * 31);
    int interval = query_int(req, "interval_hours", 1, 1, 24 * 31);
    return json_response(200, sloguard::engine::build_heatmap(store_, now(), hours, interval));
  }
  return json_response(200, sloguard::engine::build_service_summary(store_, gate_, std::string(seg[1]), now(),
                                                                    forecast_points()));
}

// ---- Alerts ----

HttpResponse ApiRouter::alerts(const HttpRequest& req, const Segments& seg) {
  if (seg.size() == 3 && seg[2] == "acknowledge") {
    if (req.method != "PATCH" && req.method != "POST") return method_not_allowed(req);
    auto id = parse_id(seg[1]);
    if (!id) throw ValidationError("alert id must be an integer");
    std::string by = query_string(req, "acknowledged_by");
    auto body = parse_body(req.body);
    if (body.is_object()) {
      if (auto it = body.find("acknowledged_by"); it != body.end() && it->is_string())
        by = it->get<std::string>();
    }
    if (sloguard::util::is_blank(by)) by = "api";
    return json_response(200, alerts_.acknowledge(*id, by, now()));
  }
  if (seg.size() == 2 && seg[1] == "acknowledge-bulk") {
    if (req.method != "POST" && req.method != "PATCH") return method_not_allowed(req);
    return acknowledge_bulk(req);
  }
  if (seg.size() == 2 && seg[1] == "statistics") {
    if (req.method != "GET") return method_not_allowed(req);
    int days = query_int(req, "days", 7, 1, 366);
    return json_response(200, sloguard::engine::alert_statistics(store_, now(), days));
  }
  if (seg.size() > 2) return route_not_found(req);
  if (req.method != "GET") return method_not_allowed(req);

  sloguard::store::AlertQuery q{};
  q.service = seg.size() == 2 ? std::string(seg[1]) : query_string(req, "service");
  if (!q.service.empty()) require_service(q.service);
  q.acknowledged = query_bool(req, "acknowledged");
  q.limit = static_cast<size_t>(query_int(req, "limit", 100, 1, 10000));
  auto list = store_.list_alerts(q);
  size_t unacked = static_cast<size_t>(std::count_if(list.begin(), list.end(),
                                                     [](const auto& a){ return !a.acknowledged; }));
  return json_response(200, json{{"alerts", list}, {"total", list.size()}, {"unacknowledged", unacked}});
}

// Body: [ids...] or {"alert_ids": [ids...], "acknowledged_by": "..."}
HttpResponse ApiRouter::acknowledge_bulk(const HttpRequest& req) {
  auto body = parse_body(req.body);
  std::string by = query_string(req, "acknowledged_by");
  const json* ids = &body;
  if (body.is_object()) {
    auto it = body.find("alert_ids");
    if (it == body.end()) throw ValidationError("field 'alert_ids' is required");
    ids = &*it;
    if (auto b = body.find("acknowledged_by"); b != body.end() && b->is_string()) by = b->get<std::string>();
  }
  if (!ids->is_array()) throw ValidationError("alert ids must be a JSON array");
  std::vector<int64_t> alert_ids;
  alert_ids.reserve(ids->size());
  for (const auto& v : *ids) {
    if (!v.is_number_integer()) throw ValidationError("alert ids must be integers");
    alert_ids.push_back(v.get<int64_t>());
  }
  if (sloguard::util::is_blank(by)) by = "api";
  auto r = alerts_.acknowledge_many(alert_ids, by, now());
  return json_response(200, json{
    {"updated_count", r.acknowledged.size()},
    {"acknowledged", r.acknowledged},
    {"not_found", r.not_found},
    {"acknowledged_by", by},
  });
}

// ---- Metrics ----

HttpResponse ApiRouter::metrics(const HttpRequest& req, const Segments& seg) {
  if (seg.size() == 1) {
    if (req.method != "GET") return method_not_allowed(req);
    HttpResponse r{};
    r.content_type = "text/plain; version=0.0.4; charset=utf-8";
    r.body = exposition_to_prometheus(collect_exposition(store_));
    return r;
  }
  if (seg.size() != 2 || seg[1] != "ingest") return route_not_found(req);
  if (req.method != "POST") return method_not_allowed(req);

  auto parsed = samples_from_json(parse_body(req.body));
  std::map<std::string, std::vector<sloguard::model::Sample>> by_service;
  for (auto& [service, sample] : parsed) by_service[service].push_back(sample);
  // Reject the whole batch before writing anything
  for (const auto& [service, samples] : by_service) require_service(service);
  for (const auto& [service, samples] : by_service) store_.append_samples(service, samples);
  sloguard::util::debugf("api: ingested %zu samples for %zu services", parsed.size(), by_service.size());
  return json_response(200, json{{"processed", parsed.size()}, {"services", by_service.size()}});
}

} // namespace sloguard::app
