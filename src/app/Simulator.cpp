#include "app/Simulator.hpp"
#include "engine/Errors.hpp"
#include <algorithm>
#include <cmath>
#include <condition_variable>
#include <cstdio>
#include <ctime>
#include <numbers>

namespace sloguard::app {

using sloguard::model::Sample;
using sloguard::model::Timestamp;

const std::vector<DemoService>& demo_fleet() {
  static const std::vector<DemoService> fleet = {
    {"api-gateway",           "platform",      1, 10000.0, 0.001},
    {"user-service",          "identity",      2,  5000.0, 0.002},
    {"payment-service",       "payments",      1,  2000.0, 0.0005},
    {"inventory-service",     "commerce",      2,  3000.0, 0.001},
    {"notification-service",  "messaging",     3,  8000.0, 0.003},
    {"search-service",        "discovery",     2,  6000.0, 0.002},
    {"recommendation-engine", "discovery",     3,  4000.0, 0.001},
    {"auth-service",          "identity",      1,  7000.0, 0.0008},
  };
  return fleet;
}

Simulator::Simulator(sloguard::store::IStore& store, int chaos_percent, uint32_t seed)
    : store_(store), chaos_(std::clamp(chaos_percent, 0, 100) / 100.0), rng_(seed) {}

Simulator::~Simulator() { stop(); }

Sample Simulator::sample_for(const DemoService& svc, Timestamp ts) {
  // Daily curve: trough at midnight UTC, peak at noon
  auto t = Timestamp::clock::to_time_t(ts);
  std::tm tm{};
  ::gmtime_r(&t, &tm);
  double hour = tm.tm_hour + tm.tm_min / 60.0;
  double day_factor = 1.0 + 0.3 * std::sin(hour / 24.0 * 2.0 * std::numbers::pi - std::numbers::pi / 2.0);

  double spread = 1.0;
  if (chaos_ > 0.0) {
    std::normal_distribution<double> variance(1.0, 0.1 * chaos_);
    spread = variance(rng_);
  }
  double requests = std::max(0.0, svc.base_requests * day_factor * spread);

  bool incident = false;
  auto it = incidents_.find(svc.name);
  if (it != incidents_.end()) {
    if (ts - it->second.started > it->second.duration) incidents_.erase(it);
    else incident = true;
  }
  if (!incident) {
    std::uniform_real_distribution<double> coin(0.0, 1.0);
    if (coin(rng_) < 0.01 * chaos_) {
      std::uniform_int_distribution<int> secs(300, 1800);
      incidents_[svc.name] = Incident{ts, std::chrono::seconds(secs(rng_))};
      incident = true;
    }
  }

  double error_rate;
  if (incident) {
    std::uniform_real_distribution<double> mult(5.0, 50.0);
    error_rate = svc.base_error_rate * mult(rng_);
  } else if (chaos_ > 0.0) {
    std::normal_distribution<double> jitter(1.0, 0.2 * chaos_);
    error_rate = svc.base_error_rate * jitter(rng_);
  } else {
    error_rate = svc.base_error_rate;
  }
  error_rate = std::clamp(error_rate, 0.0, 1.0);

  auto total = static_cast<uint64_t>(requests);
  auto errors = static_cast<uint64_t>(static_cast<double>(total) * error_rate);
  Sample s{};
  s.ts = ts;
  s.errors = errors;
  s.success = total - errors;
  return s;
}

std::vector<std::pair<std::string, Sample>> Simulator::generate(Timestamp ts) {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<std::pair<std::string, Sample>> out;
  out.reserve(demo_fleet().size());
  for (const auto& svc : demo_fleet()) out.emplace_back(svc.name, sample_for(svc, ts));
  return out;
}

void Simulator::ingest(Timestamp ts) {
  for (auto& [name, sample] : generate(ts)) {
    try {
      store_.append_samples(name, {sample});
    } catch (const sloguard::engine::NotFoundError&) {
      // not registered (or removed), nothing to feed
    }
  }
}

void Simulator::seed(Timestamp now, int history_hours) {
  Timestamp created = now - std::chrono::hours(history_hours);
  for (const auto& d : demo_fleet()) {
    if (store_.find_service(d.name)) continue;
    sloguard::model::Service svc{};
    svc.name = d.name;
    svc.team = d.team;
    svc.tier = d.tier;
    svc.description = std::string("Demo ") + d.name;
    svc.created_at = created;
    store_.create_service(svc);

    sloguard::model::SloTarget t{};
    t.service = d.name;
    t.name = "availability";
    t.target_value = 99.9;
    t.created_at = created;
    store_.create_target(t);
  }

  std::map<std::string, std::vector<Sample>> batch;
  for (Timestamp ts = created; ts <= now; ts += std::chrono::minutes(1)) {
    for (auto& [name, sample] : generate(ts)) batch[name].push_back(sample);
  }
  for (auto& [name, samples] : batch) store_.append_samples(name, samples);
  std::fprintf(stderr, "sloguard: simulator: seeded %zu services with %dh of history\n",
               demo_fleet().size(), history_hours);
}

void Simulator::replay(sloguard::engine::Evaluator& evaluator, Timestamp from, Timestamp to,
                       std::chrono::minutes step) {
  if (step.count() <= 0) return;
  for (Timestamp ts = from + step; ts <= to; ts += step) {
    for (const auto& d : demo_fleet()) evaluator.run(d.name, ts);
  }
}

void Simulator::inject_incident(const std::string& service, Timestamp now, std::chrono::minutes duration) {
  std::lock_guard<std::mutex> lk(mu_);
  incidents_[service] = Incident{now, duration};
}

void Simulator::resolve_incident(const std::string& service) {
  std::lock_guard<std::mutex> lk(mu_);
  incidents_.erase(service);
}

bool Simulator::in_incident(const std::string& service) const {
  std::lock_guard<std::mutex> lk(mu_);
  return incidents_.contains(service);
}

void Simulator::start(std::chrono::milliseconds interval) {
  thread_ = std::jthread([this, interval](std::stop_token st){ run(st, interval); });
}

void Simulator::stop() {
  if (thread_.joinable()) {
    thread_.request_stop();
    thread_.join();
  }
}

void Simulator::run(std::stop_token st, std::chrono::milliseconds interval) {
  std::mutex m;
  std::condition_variable_any cv;
  while (!st.stop_requested()) {
    auto wake = std::chrono::steady_clock::now() + interval;
    ingest(sloguard::model::Clock::now());
    std::unique_lock lk(m);
    cv.wait_until(lk, st, wake, []{ return false; });
  }
}

} // namespace sloguard::app
