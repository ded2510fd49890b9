#pragma once
#include <chrono>
#include <vector>
#include "model/Evaluation.hpp"
#include "model/Sample.hpp"

namespace sloguard::engine {

inline constexpr std::chrono::seconds kWindow5m{5 * 60};
inline constexpr std::chrono::seconds kWindow1h{60 * 60};
inline constexpr std::chrono::seconds kWindow24h{24 * 60 * 60};

struct WindowRates {
  sloguard::model::WindowRate w5m;
  sloguard::model::WindowRate w1h;
  sloguard::model::WindowRate w24h;
};

// All functions expect `samples` in ascending timestamp order.

// Sum of samples with ts in [at - window, at]. Samples after `at` are ignored.
[[nodiscard]] sloguard::model::WindowRate aggregate_window(const std::vector<sloguard::model::Sample>& samples,
                                                           sloguard::model::Timestamp at,
                                                           std::chrono::seconds window);

[[nodiscard]] WindowRates aggregate_windows(const std::vector<sloguard::model::Sample>& samples,
                                            sloguard::model::Timestamp at);

// Sum of samples with ts in (from, to].
[[nodiscard]] sloguard::model::WindowRate aggregate_range(const std::vector<sloguard::model::Sample>& samples,
                                                          sloguard::model::Timestamp from,
                                                          sloguard::model::Timestamp to);

} // namespace sloguard::engine
