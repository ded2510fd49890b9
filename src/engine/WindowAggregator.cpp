#include "engine/WindowAggregator.hpp"
#include <algorithm>

namespace sloguard::engine {

using sloguard::model::Sample;
using sloguard::model::Timestamp;
using sloguard::model::WindowRate;

namespace {

bool ts_less(const Sample& s, Timestamp t) { return s.ts < t; }
bool ts_greater(Timestamp t, const Sample& s) { return t < s.ts; }

template <typename It>
void accumulate(WindowRate& r, It first, It last) {
  for (auto it = first; it != last; ++it) {
    r.errors += it->errors;
    r.total += it->total();
  }
  r.error_rate = r.total > 0 ? static_cast<double>(r.errors) / static_cast<double>(r.total) : 0.0;
}

} // namespace

WindowRate aggregate_window(const std::vector<Sample>& samples, Timestamp at, std::chrono::seconds window) {
  WindowRate r{};
  r.window = window;
  auto first = std::lower_bound(samples.begin(), samples.end(), at - window, ts_less);
  auto last = std::upper_bound(first, samples.end(), at, ts_greater);
  accumulate(r, first, last);
  return r;
}

WindowRates aggregate_windows(const std::vector<Sample>& samples, Timestamp at) {
  return WindowRates{
    aggregate_window(samples, at, kWindow5m),
    aggregate_window(samples, at, kWindow1h),
    aggregate_window(samples, at, kWindow24h),
  };
}

WindowRate aggregate_range(const std::vector<Sample>& samples, Timestamp from, Timestamp to) {
  WindowRate r{};
  r.window = std::chrono::duration_cast<std::chrono::seconds>(to - from);
  if (to <= from) return r;
  auto first = std::upper_bound(samples.begin(), samples.end(), from, ts_greater);
  auto last = std::upper_bound(first, samples.end(), to, ts_greater);
  accumulate(r, first, last);
  return r;
}

} // namespace sloguard::engine
