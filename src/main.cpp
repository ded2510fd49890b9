#include "app/ApiRouter.hpp"
#include "app/ApiServer.hpp"
#include "app/Config.hpp"
#include "app/LogWriter.hpp"
#include "app/Scheduler.hpp"
#include "app/Simulator.hpp"
#include "engine/AlertManager.hpp"
#include "engine/Evaluator.hpp"
#include "engine/ReleaseGate.hpp"
#include "engine/Summary.hpp"
#include "store/MemoryStore.hpp"
#include "util/Log.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace std::chrono_literals;

static std::atomic<bool> g_stop{false};
static void on_signal(int) { g_stop.store(true); }

static void print_usage() {
  std::cout << "Usage: sloguard [--config PATH] [--port N] [--demo] [--debug] [--once] [-h]\n";
  std::cout << "  --config PATH  TOML config (default $XDG_CONFIG_HOME/sloguard/config.toml)\n";
  std::cout << "  --port N       API port (overrides [server] port)\n";
  std::cout << "  --demo         register the demo fleet and feed synthetic traffic\n";
  std::cout << "  --debug        verbose logging\n";
  std::cout << "  --once         evaluate every service once, print a summary and exit\n";
}

static void print_summary(const sloguard::store::IStore& store, const sloguard::engine::ReleaseGate& gate,
                          sloguard::model::Timestamp now, size_t forecast_points) {
  auto overview = sloguard::engine::build_overview(store, now, forecast_points);
  std::cout << "sloguard: " << overview.active_services << " active services, health "
            << overview.health << " (" << std::fixed << std::setprecision(1) << overview.health_score << ")\n";
  std::cout << std::left << std::setw(24) << "SERVICE" << std::setw(10) << "RISK"
            << std::right << std::setw(10) << "BURN" << std::setw(12) << "BUDGET%" << "  GATE\n";
  for (const auto& st : sloguard::engine::collect_status(store, forecast_points)) {
    auto decision = gate.status(st.service.name, now);
    double burn = st.worst ? st.worst->composite_burn_rate : 0.0;
    double remaining = st.worst ? st.worst->budget_remaining : 100.0;
    std::cout << std::left << std::setw(24) << st.service.name
              << std::setw(10) << sloguard::model::to_string(decision.risk)
              << std::right << std::setw(10) << std::setprecision(2) << burn
              << std::setw(12) << std::setprecision(1) << remaining
              << "  " << sloguard::model::to_string(decision.state) << "\n";
  }
  std::cout << overview.executive_summary << "\n";
}

int main(int argc, char** argv) {
  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  std::string config_path;
  int port_override = -1;
  bool demo = false, debug = false, once = false;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--config" && i + 1 < argc) config_path = argv[++i];
    else if (a == "--port" && i + 1 < argc) {
      try { port_override = std::stoi(argv[++i]); }
      catch (const std::exception&) { std::fprintf(stderr, "sloguard: invalid --port value\n"); return 2; }
    }
    else if (a == "--demo") demo = true;
    else if (a == "--debug") debug = true;
    else if (a == "--once") once = true;
    else if (a == "-h" || a == "--help") { print_usage(); return 0; }
    else {
      std::fprintf(stderr, "sloguard: unknown argument '%s'\n", a.c_str());
      print_usage();
      return 2;
    }
  }

  auto config = sloguard::app::load_config(config_path);
  if (port_override >= 0) config.server.port = port_override;
  if (demo) config.demo.synthetic = true;
  if (debug) config.log.debug = true;
  sloguard::util::set_debug(config.log.debug);
  if (!config.source.empty()) sloguard::util::debugf("config: loaded %s", config.source.c_str());
  if (config.storage.database_url != "memory://")
    std::fprintf(stderr, "sloguard: storage: %s not supported, using in-memory store\n",
                 config.storage.database_url.c_str());
  if (!config.storage.cache_url.empty())
    std::fprintf(stderr, "sloguard: storage: cache %s ignored\n", config.storage.cache_url.c_str());

  sloguard::store::MemoryStore store(static_cast<size_t>(config.engine.history_limit));
  sloguard::engine::AlertManager alerts(store, sloguard::app::alert_policy(config));
  alerts.add_sink(std::make_shared<sloguard::engine::LogAlertSink>());
  sloguard::engine::Evaluator evaluator(store, alerts);
  const auto forecast_points = static_cast<size_t>(config.engine.forecast_points);
  sloguard::engine::ReleaseGate gate(store, forecast_points);
  sloguard::app::Scheduler scheduler(store, evaluator, alerts, sloguard::app::scheduler_options(config));

  std::unique_ptr<sloguard::app::Simulator> simulator;
  if (config.demo.synthetic) {
    simulator = std::make_unique<sloguard::app::Simulator>(store, config.demo.chaos_percent);
    auto now = sloguard::model::Clock::now();
    try {
      simulator->seed(now, config.demo.history_hours);
      simulator->replay(evaluator, now - std::chrono::hours(config.demo.history_hours), now, 15min);
    } catch (const std::exception& e) {
      std::fprintf(stderr, "sloguard: demo seeding failed: %s\n", e.what());
      return 1;
    }
  }

  if (once) {
    int failures = 0;
    for (const auto& svc : store.list_services(true)) {
      try {
        (void)scheduler.run_now(svc.name);
      } catch (const std::exception&) {
        ++failures; // already logged by the scheduler
      }
    }
    print_summary(store, gate, sloguard::model::Clock::now(), forecast_points);
    return failures == 0 ? 0 : 1;
  }

  scheduler.start();
  if (simulator) simulator->start();

  std::unique_ptr<sloguard::app::LogWriter> log_writer;
  if (!config.log.dir.empty()) {
    log_writer = std::make_unique<sloguard::app::LogWriter>(store, config.log.dir,
                                                            std::chrono::milliseconds(config.log.interval_ms));
    log_writer->start();
  }

  sloguard::app::ApiRouter router(store, scheduler, gate, alerts, config);
  sloguard::app::ApiServer server(router, static_cast<uint16_t>(config.server.port));
  if (!server.start())
    std::fprintf(stderr, "sloguard: continuing without the HTTP API\n");

  std::fprintf(stderr, "sloguard: running (api prefix '%s'), Ctrl+C to stop\n", config.server.api_prefix.c_str());
  while (!g_stop.load()) std::this_thread::sleep_for(100ms);

  std::fprintf(stderr, "sloguard: shutting down\n");
  server.stop();
  if (log_writer) log_writer->stop();
  if (simulator) simulator->stop();
  scheduler.stop();
  return 0;
}
