#pragma once

#include <atomic>
#include <cstdarg>
#include <cstdio>

namespace sloguard::util {

inline std::atomic<bool>& debug_flag() {
  static std::atomic<bool> flag{false};
  return flag;
}

inline void set_debug(bool on) { debug_flag().store(on, std::memory_order_relaxed); }
[[nodiscard]] inline bool debug_enabled() { return debug_flag().load(std::memory_order_relaxed); }

// "sloguard: debug: ..." line on stderr, only when debug output is enabled.
[[gnu::format(printf, 1, 2)]] inline void debugf(const char* fmt, ...) {
  if (!debug_enabled()) return;
  std::va_list ap;
  va_start(ap, fmt);
  std::fputs("sloguard: debug: ", stderr);
  std::vfprintf(stderr, fmt, ap);
  std::fputc('\n', stderr);
  va_end(ap);
}

} // namespace sloguard::util
