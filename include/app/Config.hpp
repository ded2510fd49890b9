#pragma once

#include <cstdint>
#include <string>
#include "app/Scheduler.hpp"
#include "engine/AlertManager.hpp"
#include "util/TomlReader.hpp"

namespace sloguard::app {

struct ServerConfig {
  int port{8080};
  std::string api_prefix{"/api/v1"};
};

struct StorageConfig {
  std::string database_url{"memory://"};
  std::string cache_url;
};

struct EngineConfig {
  int interval_seconds{60};
  int tick_timeout_ms{10000};
  int workers{4};
  int forecast_points{60};
  int sample_retention_hours{48};
  int history_limit{10080};
  int failure_alert_after{3};
};

struct AlertConfig {
  int cooldown_observe_minutes{60};
  int cooldown_danger_minutes{30};
  int cooldown_freeze_minutes{15};
};

struct DemoConfig {
  bool synthetic{false};
  int chaos_percent{20};
  int history_hours{24};
};

struct LogConfig {
  bool debug{false};
  std::string dir;          // empty: exposition log disabled
  int interval_ms{60000};
};

struct Config {
  ServerConfig server;
  StorageConfig storage;
  EngineConfig engine;
  AlertConfig alerts;
  DemoConfig demo;
  LogConfig log;
  std::string source;       // file the TOML values came from, empty if none
};

// $XDG_CONFIG_HOME/sloguard/config.toml, else ~/.config/sloguard/config.toml
[[nodiscard]] std::string config_file_path();

// Each key resolves TOML -> environment (SLOGUARD_*) -> compiled default.
// Out-of-range values are clamped.
[[nodiscard]] Config resolve_config(const sloguard::util::TomlReader& toml, bool have_toml);

// Loads `path` (or config_file_path() when empty) and resolves.
[[nodiscard]] Config load_config(const std::string& path = "");

[[nodiscard]] SchedulerOptions scheduler_options(const Config& c);
[[nodiscard]] sloguard::engine::AlertPolicy alert_policy(const Config& c);

// Environment helpers; SLOGUARD_X and sloguard_X are interchangeable.
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);

} // namespace sloguard::app
