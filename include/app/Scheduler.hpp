#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include "engine/AlertManager.hpp"
#include "engine/Evaluator.hpp"
#include "store/IStore.hpp"

namespace sloguard::app {

struct SchedulerOptions {
  std::chrono::seconds interval{60};             // <= 0 disables the cadence thread
  std::chrono::milliseconds tick_timeout{10000};
  int workers{4};
  int failure_alert_after{3};
  std::chrono::hours sample_retention{48};
  std::function<sloguard::model::Timestamp()> clock; // empty: system clock
};

// Runs evaluation ticks: one cadence thread enqueues every active service per
// interval, a fixed pool of workers drains the queue. Per service at most one
// tick is in flight; further requests coalesce into one queued tick.
class Scheduler {
public:
  Scheduler(sloguard::store::IStore& store, sloguard::engine::Evaluator& evaluator,
            sloguard::engine::AlertManager& alerts, SchedulerOptions opts = {});
  ~Scheduler();
  Scheduler(const Scheduler&) = delete;
  Scheduler& operator=(const Scheduler&) = delete;

  void start();
  void stop();

  // Asynchronous. Returns true if a tick was dispatched or newly queued.
  bool request_tick(const std::string& service);
  void request_all();

  // Synchronous tick. Reads the clock and the store under the service's commit
  // lock, so concurrent calls commit in clock order; a queued tick that read an
  // earlier clock is discarded. Failures are counted like scheduled failures
  // and rethrown.
  std::vector<sloguard::model::BurnRateSnapshot> run_now(const std::string& service);

  [[nodiscard]] int consecutive_failures(const std::string& service) const;
  [[nodiscard]] uint64_t completed_ticks() const { return completed_.load(); }
  [[nodiscard]] uint64_t discarded_ticks() const { return discarded_.load(); }
  [[nodiscard]] uint64_t failed_ticks() const { return failed_.load(); }
  [[nodiscard]] const SchedulerOptions& options() const { return opts_; }

private:
  struct Slot {
    std::mutex commit_mu;
    uint64_t generation{0};
    bool in_flight{false};
    bool queued{false};
    std::chrono::steady_clock::time_point started{};
    int consecutive_failures{0};
    bool failure_alerted{false};
  };

  void run(std::stop_token st);
  void worker(std::stop_token st);
  void execute(const std::string& service, uint64_t generation);
  std::vector<sloguard::model::BurnRateSnapshot> tick(Slot& slot, const std::string& service,
                                                      const uint64_t* generation);
  void dispatch_locked(Slot& slot, const std::string& service);
  void record_failure(Slot& slot, const std::string& service, const char* what);
  Slot& slot_locked(const std::string& service);
  [[nodiscard]] sloguard::model::Timestamp now() const;

  sloguard::store::IStore& store_;
  sloguard::engine::Evaluator& evaluator_;
  sloguard::engine::AlertManager& alerts_;
  SchedulerOptions opts_;

  mutable std::mutex mu_;
  std::condition_variable_any cv_;
  std::map<std::string, std::unique_ptr<Slot>> slots_;
  std::deque<std::pair<std::string, uint64_t>> queue_;

  std::atomic<uint64_t> completed_{0};
  std::atomic<uint64_t> discarded_{0};
  std::atomic<uint64_t> failed_{0};

  std::jthread cadence_{};
  std::vector<std::jthread> workers_;
};

} // namespace sloguard::app
