#include "app/Exposition.hpp"
#include <charconv>
#include <cstdio>
#include <algorithm>

namespace {

void append_double(std::string& out, double v) {
  char buf[32];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  if (ec == std::errc{}) {
    out.append(buf, ptr);
  } else {
    out += '0';
  }
}

void append_int(std::string& out, int v) {
  char buf[16];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  out.append(buf, ptr);
}

void append_escaped(std::string& out, std::string_view sv) {
  for (char c : sv) {
    if (c == '\\') out += "\\\\";
    else if (c == '"') out += "\\\"";
    else if (c == '\n') out += "\\n";
    else out += c;
  }
}

void emit_header(std::string& out, const char* name, const char* help, const char* type) {
  out += "# HELP ";  out += name;  out += ' ';  out += help;  out += '\n';
  out += "# TYPE ";  out += name;  out += ' ';  out += type;  out += '\n';
}

void emit_gauge_i(std::string& out, const char* name, int value) {
  out += name;  out += ' ';  append_int(out, value);  out += '\n';
}

// 1-label variant: name{key="val"} value
void emit_labeled_i(std::string& out, const char* name,
                    const char* lk, std::string_view lv, int value) {
  out += name;  out += '{';  out += lk;  out += "=\"";
  append_escaped(out, lv);
  out += "\"} ";  append_int(out, value);  out += '\n';
}

// 2-label: name{k1="v1",k2="v2"} value
void emit_labeled_2d(std::string& out, const char* name,
                     const char* k1, std::string_view v1,
                     const char* k2, std::string_view v2, double value) {
  out += name;  out += '{';
  out += k1;  out += "=\"";  append_escaped(out, v1);  out += "\",";
  out += k2;  out += "=\"";  append_escaped(out, v2);  out += "\"} ";
  append_double(out, value);  out += '\n';
}

// 3-label: name{k1="v1",k2="v2",k3="v3"} value
void emit_labeled_3d(std::string& out, const char* name,
                     const char* k1, std::string_view v1,
                     const char* k2, std::string_view v2,
                     const char* k3, std::string_view v3, double value) {
  out += name;  out += '{';
  out += k1;  out += "=\"";  append_escaped(out, v1);  out += "\",";
  out += k2;  out += "=\"";  append_escaped(out, v2);  out += "\",";
  out += k3;  out += "=\"";  append_escaped(out, v3);  out += "\"} ";
  append_double(out, value);  out += '\n';
}

} // anonymous namespace

namespace sloguard::app {

ExpositionSnapshot collect_exposition(const sloguard::store::IStore& store) {
  ExpositionSnapshot es{};
  auto services = store.list_services(false);
  es.services_total = static_cast<int>(services.size());
  for (const auto& svc : services) {
    if (!svc.active) continue;
    ++es.services_active;
    for (const auto& t : store.list_targets(svc.name, true)) {
      if (auto s = store.latest_snapshot(svc.name, t.id)) es.latest.push_back(std::move(*s));
    }
  }
  sloguard::store::AlertQuery q{};
  q.acknowledged = false;
  q.limit = 0;
  es.alerts_unacknowledged = static_cast<int>(store.list_alerts(q).size());
  std::sort(es.latest.begin(), es.latest.end(), [](const auto& a, const auto& b){
    if (a.service != b.service) return a.service < b.service;
    return a.slo_id < b.slo_id;
  });
  return es;
}

std::string exposition_to_prometheus(const ExpositionSnapshot& s) {
  std::string out;
  out.reserve(1024 + s.latest.size() * 512);

  // ---- Fleet ----
  emit_header(out, "sloguard_services_total", "Registered services by state", "gauge");
  emit_labeled_i(out, "sloguard_services_total", "state", "active", s.services_active);
  emit_labeled_i(out, "sloguard_services_total", "state", "inactive", s.services_total - s.services_active);

  emit_header(out, "sloguard_alerts_unacknowledged", "Alerts awaiting acknowledgement", "gauge");
  emit_gauge_i(out, "sloguard_alerts_unacknowledged", s.alerts_unacknowledged);

  if (s.latest.empty()) return out;

  // ---- Per (service, SLO) ----
  emit_header(out, "sloguard_burn_rate", "Error budget burn rate per evaluation window", "gauge");
  for (const auto& b : s.latest) {
    emit_labeled_3d(out, "sloguard_burn_rate", "service", b.service, "slo", b.slo_name, "window", "5m", b.burn_rate_5m);
    emit_labeled_3d(out, "sloguard_burn_rate", "service", b.service, "slo", b.slo_name, "window", "1h", b.burn_rate_1h);
    emit_labeled_3d(out, "sloguard_burn_rate", "service", b.service, "slo", b.slo_name, "window", "24h", b.burn_rate_24h);
  }

  emit_header(out, "sloguard_composite_burn_rate", "Weighted composite burn rate", "gauge");
  for (const auto& b : s.latest)
    emit_labeled_2d(out, "sloguard_composite_burn_rate", "service", b.service, "slo", b.slo_name, b.composite_burn_rate);

  emit_header(out, "sloguard_error_budget_remaining_percent", "Error budget remaining in the compliance window", "gauge");
  for (const auto& b : s.latest)
    emit_labeled_2d(out, "sloguard_error_budget_remaining_percent", "service", b.service, "slo", b.slo_name,
                    b.budget_remaining);

  emit_header(out, "sloguard_risk_level", "Risk level (0=SAFE 1=OBSERVE 2=DANGER 3=FREEZE)", "gauge");
  for (const auto& b : s.latest)
    emit_labeled_2d(out, "sloguard_risk_level", "service", b.service, "slo", b.slo_name,
                    static_cast<double>(sloguard::model::rank(b.risk)));

  return out;
}

} // namespace sloguard::app
