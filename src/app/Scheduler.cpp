#include "app/Scheduler.hpp"
#include "util/Log.hpp"
#include <algorithm>
#include <cstdio>

using namespace std::chrono;

namespace sloguard::app {

using sloguard::model::BurnRateSnapshot;
using sloguard::model::Timestamp;

Scheduler::Scheduler(sloguard::store::IStore& store, sloguard::engine::Evaluator& evaluator,
                     sloguard::engine::AlertManager& alerts, SchedulerOptions opts)
    : store_(store), evaluator_(evaluator), alerts_(alerts), opts_(std::move(opts)) {
  if (opts_.workers < 1) opts_.workers = 1;
  if (opts_.workers > 64) opts_.workers = 64;
  if (opts_.failure_alert_after < 1) opts_.failure_alert_after = 1;
}

Scheduler::~Scheduler() { stop(); }

Timestamp Scheduler::now() const {
  return opts_.clock ? opts_.clock() : sloguard::model::Clock::now();
}

void Scheduler::start() {
  if (!workers_.empty()) return;
  for (int i = 0; i < opts_.workers; ++i)
    workers_.emplace_back([this](std::stop_token st){ worker(st); });
  if (opts_.interval.count() > 0)
    cadence_ = std::jthread([this](std::stop_token st){ run(st); });
}

void Scheduler::stop() {
  if (cadence_.joinable()) {
    cadence_.request_stop();
    cadence_.join();
  }
  for (auto& w : workers_) w.request_stop();
  cv_.notify_all();
  for (auto& w : workers_)
    if (w.joinable()) w.join();
  workers_.clear();
}

Scheduler::Slot& Scheduler::slot_locked(const std::string& service) {
  auto& p = slots_[service];
  if (!p) p = std::make_unique<Slot>();
  return *p;
}

void Scheduler::dispatch_locked(Slot& slot, const std::string& service) {
  slot.in_flight = true;
  slot.started = {};
  ++slot.generation;
  queue_.emplace_back(service, slot.generation);
  cv_.notify_one();
}

bool Scheduler::request_tick(const std::string& service) {
  std::lock_guard<std::mutex> lk(mu_);
  Slot& slot = slot_locked(service);
  if (!slot.in_flight) {
    dispatch_locked(slot, service);
    return true;
  }
  bool newly_queued = !slot.queued;
  slot.queued = true;
  if (slot.started != steady_clock::time_point{} &&
      steady_clock::now() - slot.started > opts_.tick_timeout) {
    auto ms = duration_cast<milliseconds>(steady_clock::now() - slot.started).count();
    std::fprintf(stderr, "sloguard: scheduler: abandoning tick for %s after %lldms\n",
                 service.c_str(), static_cast<long long>(ms));
    slot.queued = false;
    dispatch_locked(slot, service);
    return true;
  }
  return newly_queued;
}

void Scheduler::request_all() {
  for (const auto& s : store_.list_services(true)) request_tick(s.name);
}

int Scheduler::consecutive_failures(const std::string& service) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = slots_.find(service);
  return it == slots_.end() ? 0 : it->second->consecutive_failures;
}

std::vector<BurnRateSnapshot> Scheduler::tick(Slot& slot, const std::string& service, const uint64_t* generation) {
  // Queued ticks read outside the commit lock so a stuck read can be abandoned;
  // synchronous ticks read and commit under it.
  std::unique_lock<std::mutex> commit_lock(slot.commit_mu, std::defer_lock);
  if (!generation) commit_lock.lock();
  auto input = evaluator_.prepare(service, now());
  if (generation) {
    commit_lock.lock();
    std::lock_guard<std::mutex> lk(mu_);
    if (slot.generation != *generation) {
      ++discarded_;
      sloguard::util::debugf("scheduler: discarding stale tick for %s (generation %llu)",
                             service.c_str(), static_cast<unsigned long long>(*generation));
      return {};
    }
  }
  if (evaluator_.superseded(input)) {
    ++discarded_;
    sloguard::util::debugf("scheduler: discarding tick for %s, a later one already committed", service.c_str());
    return {};
  }
  auto out = evaluator_.commit(input);
  {
    std::lock_guard<std::mutex> lk(mu_);
    slot.consecutive_failures = 0;
    slot.failure_alerted = false;
  }
  ++completed_;
  return out;
}

void Scheduler::record_failure(Slot& slot, const std::string& service, const char* what) {
  bool raise = false;
  int n = 0;
  {
    std::lock_guard<std::mutex> lk(mu_);
    n = ++slot.consecutive_failures;
    if (n >= opts_.failure_alert_after && !slot.failure_alerted) {
      slot.failure_alerted = true;
      raise = true;
    }
  }
  ++failed_;
  std::fprintf(stderr, "sloguard: scheduler: tick for %s failed (%d consecutive): %s\n",
               service.c_str(), n, what);
  if (!raise) return;
  std::string detail = "Evaluation for " + service + " failed " + std::to_string(n) +
                       " consecutive times. Last error: " + what;
  try {
    (void)alerts_.raise_operational(service, detail, now());
  } catch (const std::exception& e) {
    std::fprintf(stderr, "sloguard: scheduler: could not raise operational alert for %s: %s\n",
                 service.c_str(), e.what());
    std::lock_guard<std::mutex> lk(mu_);
    slot.failure_alerted = false;
  }
}

void Scheduler::execute(const std::string& service, uint64_t generation) {
  Slot* slot = nullptr;
  {
    std::lock_guard<std::mutex> lk(mu_);
    slot = &slot_locked(service);
    if (slot->generation != generation) {
      ++discarded_;
      return;
    }
    slot->started = steady_clock::now();
  }

  try {
    (void)tick(*slot, service, &generation);
  } catch (const std::exception& e) {
    bool current = false;
    {
      std::lock_guard<std::mutex> lk(mu_);
      current = slot->generation == generation;
    }
    if (current) record_failure(*slot, service, e.what());
    else sloguard::util::debugf("scheduler: abandoned tick for %s failed: %s", service.c_str(), e.what());
  }

  std::lock_guard<std::mutex> lk(mu_);
  if (slot->generation != generation) return;
  slot->in_flight = false;
  slot->started = {};
  if (slot->queued) {
    slot->queued = false;
    dispatch_locked(*slot, service);
  }
}

std::vector<BurnRateSnapshot> Scheduler::run_now(const std::string& service) {
  Slot* slot = nullptr;
  {
    std::lock_guard<std::mutex> lk(mu_);
    slot = &slot_locked(service);
  }
  try {
    return tick(*slot, service, nullptr);
  } catch (const std::exception& e) {
    record_failure(*slot, service, e.what());
    throw;
  }
}

void Scheduler::worker(std::stop_token st) {
  while (!st.stop_requested()) {
    std::pair<std::string, uint64_t> job;
    {
      std::unique_lock<std::mutex> lk(mu_);
      if (!cv_.wait(lk, st, [this]{ return !queue_.empty(); })) break;
      job = std::move(queue_.front());
      queue_.pop_front();
    }
    execute(job.first, job.second);
  }
}

void Scheduler::run(std::stop_token st) {
  std::fprintf(stderr, "sloguard: scheduler: %d workers, interval %llds, tick timeout %lldms\n",
               opts_.workers, static_cast<long long>(opts_.interval.count()),
               static_cast<long long>(opts_.tick_timeout.count()));
  auto next_tick = steady_clock::now();
  while (!st.stop_requested()) {
    auto t = steady_clock::now();
    if (t >= next_tick) {
      try {
        request_all();
        size_t pruned = store_.prune_samples(now() - opts_.sample_retention);
        if (pruned > 0) sloguard::util::debugf("scheduler: pruned %zu samples", pruned);
      } catch (const std::exception& e) {
        std::fprintf(stderr, "sloguard: scheduler: cadence pass failed: %s\n", e.what());
      }
      next_tick = t + opts_.interval;
    }
    auto sleep_for = duration_cast<milliseconds>(next_tick - steady_clock::now());
    if (sleep_for < 10ms) sleep_for = 10ms;
    if (sleep_for > 200ms) sleep_for = 200ms;
    std::this_thread::sleep_for(sleep_for);
  }
}

} // namespace sloguard::app
