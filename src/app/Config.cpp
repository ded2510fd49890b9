#include "app/Config.hpp"
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace sloguard::app {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("SLOGUARD_", 0) == 0) {
    alt = std::string("sloguard_") + n.substr(9);
  } else if (n.rfind("sloguard_", 0) == 0) {
    alt = std::string("SLOGUARD_") + n.substr(9);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  try { return std::stoi(v); } catch (const std::exception&) { return defv; }
}

static bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0] == '0' || v[0] == 'f' || v[0] == 'F' || v[0] == 'n' || v[0] == 'N') return false;
  return true;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/sloguard/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/sloguard/config.toml";
  return {};
}

// Resolve an int from TOML -> env -> compiled default, clamped to [lo, hi]
static int resolve_int(const sloguard::util::TomlReader& toml, bool have_toml,
                       const char* section, const char* key,
                       const char* env_name, int def, int lo, int hi) {
  int v = def;
  if (have_toml && toml.has(section, key))
    v = toml.get_int(section, key, def);
  else if (env_name)
    v = getenv_int(env_name, def);
  return std::clamp(v, lo, hi);
}

static bool resolve_bool(const sloguard::util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  if (env_name)
    return env_flag(env_name, def);
  return def;
}

static std::string resolve_string(const sloguard::util::TomlReader& toml, bool have_toml,
                                  const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return std::string(v);
  }
  return def;
}

Config resolve_config(const sloguard::util::TomlReader& toml, bool have_toml) {
  Config c{};
  const Config d{};

  c.server.port = resolve_int(toml, have_toml, "server", "port", "SLOGUARD_PORT", d.server.port, 0, 65535);
  c.server.api_prefix = resolve_string(toml, have_toml, "server", "api_prefix", "SLOGUARD_API_PREFIX", d.server.api_prefix);
  if (!c.server.api_prefix.empty() && c.server.api_prefix.front() != '/') c.server.api_prefix.insert(0, 1, '/');
  while (c.server.api_prefix.size() > 1 && c.server.api_prefix.back() == '/') c.server.api_prefix.pop_back();
  if (c.server.api_prefix == "/") c.server.api_prefix.clear();

  c.storage.database_url = resolve_string(toml, have_toml, "storage", "database_url", "SLOGUARD_DATABASE_URL", d.storage.database_url);
  c.storage.cache_url = resolve_string(toml, have_toml, "storage", "cache_url", "SLOGUARD_CACHE_URL", d.storage.cache_url);

  auto& e = c.engine;
  e.interval_seconds = resolve_int(toml, have_toml, "engine", "interval_seconds", "SLOGUARD_INTERVAL_SECONDS", d.engine.interval_seconds, 1, 86400);
  e.tick_timeout_ms = resolve_int(toml, have_toml, "engine", "tick_timeout_ms", "SLOGUARD_TICK_TIMEOUT_MS", d.engine.tick_timeout_ms, 10, 3600000);
  e.workers = resolve_int(toml, have_toml, "engine", "workers", "SLOGUARD_WORKERS", d.engine.workers, 1, 64);
  e.forecast_points = resolve_int(toml, have_toml, "engine", "forecast_points", "SLOGUARD_FORECAST_POINTS", d.engine.forecast_points, 2, 100000);
  e.sample_retention_hours = resolve_int(toml, have_toml, "engine", "sample_retention_hours", "SLOGUARD_SAMPLE_RETENTION_HOURS", d.engine.sample_retention_hours, 25, 24 * 366);
  e.history_limit = resolve_int(toml, have_toml, "engine", "history_limit", "SLOGUARD_HISTORY_LIMIT", d.engine.history_limit, 10, 10000000);
  e.failure_alert_after = resolve_int(toml, have_toml, "engine", "failure_alert_after", "SLOGUARD_FAILURE_ALERT_AFTER", d.engine.failure_alert_after, 1, 1000);

  auto& a = c.alerts;
  a.cooldown_observe_minutes = resolve_int(toml, have_toml, "alerts", "cooldown_observe_minutes", "SLOGUARD_COOLDOWN_OBSERVE_MINUTES", d.alerts.cooldown_observe_minutes, 0, 10080);
  a.cooldown_danger_minutes = resolve_int(toml, have_toml, "alerts", "cooldown_danger_minutes", "SLOGUARD_COOLDOWN_DANGER_MINUTES", d.alerts.cooldown_danger_minutes, 0, 10080);
  a.cooldown_freeze_minutes = resolve_int(toml, have_toml, "alerts", "cooldown_freeze_minutes", "SLOGUARD_COOLDOWN_FREEZE_MINUTES", d.alerts.cooldown_freeze_minutes, 0, 10080);

  c.demo.synthetic = resolve_bool(toml, have_toml, "demo", "synthetic", "SLOGUARD_SYNTHETIC", d.demo.synthetic);
  c.demo.chaos_percent = resolve_int(toml, have_toml, "demo", "chaos_percent", "SLOGUARD_CHAOS_PERCENT", d.demo.chaos_percent, 0, 100);
  c.demo.history_hours = resolve_int(toml, have_toml, "demo", "history_hours", "SLOGUARD_DEMO_HISTORY_HOURS", d.demo.history_hours, 0, 24 * 30);

  c.log.debug = resolve_bool(toml, have_toml, "log", "debug", "SLOGUARD_DEBUG", d.log.debug);
  c.log.dir = resolve_string(toml, have_toml, "log", "dir", "SLOGUARD_LOG_DIR", d.log.dir);
  c.log.interval_ms = resolve_int(toml, have_toml, "log", "interval_ms", "SLOGUARD_LOG_INTERVAL_MS", d.log.interval_ms, 100, 86400000);
  return c;
}

Config load_config(const std::string& path) {
  std::string p = path.empty() ? config_file_path() : path;
  sloguard::util::TomlReader toml;
  bool have_toml = !p.empty() && toml.load(p);
  if (!have_toml && !path.empty())
    std::fprintf(stderr, "sloguard: config: cannot read %s, using environment and defaults\n", path.c_str());
  Config c = resolve_config(toml, have_toml);
  if (have_toml) c.source = p;
  return c;
}

SchedulerOptions scheduler_options(const Config& c) {
  SchedulerOptions o{};
  o.interval = std::chrono::seconds(c.engine.interval_seconds);
  o.tick_timeout = std::chrono::milliseconds(c.engine.tick_timeout_ms);
  o.workers = c.engine.workers;
  o.failure_alert_after = c.engine.failure_alert_after;
  o.sample_retention = std::chrono::hours(c.engine.sample_retention_hours);
  return o;
}

sloguard::engine::AlertPolicy alert_policy(const Config& c) {
  sloguard::engine::AlertPolicy p{};
  p.observe_cooldown = std::chrono::minutes(c.alerts.cooldown_observe_minutes);
  p.danger_cooldown = std::chrono::minutes(c.alerts.cooldown_danger_minutes);
  p.freeze_cooldown = std::chrono::minutes(c.alerts.cooldown_freeze_minutes);
  return p;
}

} // namespace sloguard::app
