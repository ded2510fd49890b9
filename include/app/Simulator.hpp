#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <random>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include "engine/Evaluator.hpp"
#include "model/Sample.hpp"
#include "store/IStore.hpp"

namespace sloguard::app {

struct DemoService {
  const char* name;
  const char* team;
  int tier;
  double base_requests; // per sample
  double base_error_rate;
};

// The fixed demo fleet.
[[nodiscard]] const std::vector<DemoService>& demo_fleet();

// Synthetic traffic generator. Deterministic for a given seed and call sequence.
class Simulator {
public:
  Simulator(sloguard::store::IStore& store, int chaos_percent = 20, uint32_t seed = 42);
  ~Simulator();
  Simulator(const Simulator&) = delete;
  Simulator& operator=(const Simulator&) = delete;

  // One sample per fleet service at `ts`, in fleet order.
  std::vector<std::pair<std::string, sloguard::model::Sample>> generate(sloguard::model::Timestamp ts);

  // Generates and stores one sample per service. Services missing from the store are skipped.
  void ingest(sloguard::model::Timestamp ts);

  // Registers the fleet (existing services are left alone) with a 99.9% availability
  // SLO created `history_hours` before `now`, then back-fills one sample per minute.
  void seed(sloguard::model::Timestamp now, int history_hours);

  // Replays evaluations over [from, to] every `step` so forecasts have history.
  void replay(sloguard::engine::Evaluator& evaluator, sloguard::model::Timestamp from,
              sloguard::model::Timestamp to, std::chrono::minutes step);

  void inject_incident(const std::string& service, sloguard::model::Timestamp now,
                       std::chrono::minutes duration = std::chrono::minutes(15));
  void resolve_incident(const std::string& service);
  [[nodiscard]] bool in_incident(const std::string& service) const;

  // Produces one sample per service every `interval` until stopped.
  void start(std::chrono::milliseconds interval = std::chrono::milliseconds(60000));
  void stop();

private:
  struct Incident {
    sloguard::model::Timestamp started{};
    std::chrono::seconds duration{};
  };

  sloguard::model::Sample sample_for(const DemoService& svc, sloguard::model::Timestamp ts);
  void run(std::stop_token st, std::chrono::milliseconds interval);

  sloguard::store::IStore& store_;
  double chaos_;
  mutable std::mutex mu_;
  std::mt19937 rng_;
  std::map<std::string, Incident> incidents_;
  std::jthread thread_;
};

} // namespace sloguard::app
