#include "util/TimeFormat.hpp"
#include <charconv>
#include <cmath>
#include <cstdio>
#include <ctime>

namespace sloguard::util {

using sloguard::model::Clock;
using sloguard::model::Timestamp;

std::string format_iso8601(Timestamp t) {
  auto secs = std::chrono::floor<std::chrono::seconds>(t);
  std::time_t tt = Clock::to_time_t(secs);
  std::tm tm{};
  ::gmtime_r(&tt, &tm);
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02dZ",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                tm.tm_hour, tm.tm_min, tm.tm_sec);
  return buf;
}

namespace {

bool read_fixed(std::string_view s, size_t pos, size_t len, int& out) {
  if (pos + len > s.size()) return false;
  const char* first = s.data() + pos;
  auto [ptr, ec] = std::from_chars(first, first + len, out);
  return ec == std::errc{} && ptr == first + len;
}

} // namespace

std::optional<Timestamp> parse_iso8601(std::string_view s) {
  // YYYY-MM-DDTHH:MM:SS is 19 chars
  if (s.size() < 19) return std::nullopt;
  if (s[4] != '-' || s[7] != '-' || (s[10] != 'T' && s[10] != 't' && s[10] != ' ') ||
      s[13] != ':' || s[16] != ':') return std::nullopt;
  int year, mon, day, hour, min, sec;
  if (!read_fixed(s, 0, 4, year) || !read_fixed(s, 5, 2, mon) || !read_fixed(s, 8, 2, day) ||
      !read_fixed(s, 11, 2, hour) || !read_fixed(s, 14, 2, min) || !read_fixed(s, 17, 2, sec))
    return std::nullopt;
  if (mon < 1 || mon > 12 || day < 1 || day > 31 || hour > 23 || min > 59 || sec > 60) return std::nullopt;

  size_t pos = 19;
  long long frac_us = 0;
  if (pos < s.size() && s[pos] == '.') {
    ++pos;
    long long scale = 100000;
    while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
      frac_us += (s[pos] - '0') * scale;
      scale /= 10;
      ++pos;
    }
  }

  int offset_minutes = 0;
  if (pos < s.size()) {
    char c = s[pos];
    if (c == 'Z' || c == 'z') {
      ++pos;
    } else if (c == '+' || c == '-') {
      int oh, om;
      if (!read_fixed(s, pos + 1, 2, oh)) return std::nullopt;
      size_t mpos = pos + 3;
      if (mpos < s.size() && s[mpos] == ':') ++mpos;
      if (!read_fixed(s, mpos, 2, om)) return std::nullopt;
      offset_minutes = (oh * 60 + om) * (c == '-' ? -1 : 1);
      pos = mpos + 2;
    } else {
      return std::nullopt;
    }
  }
  if (pos != s.size()) return std::nullopt;

  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon = mon - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min = min;
  tm.tm_sec = sec;
  std::time_t tt = ::timegm(&tm);
  tt -= offset_minutes * 60;
  if (tt < 0 || tt >= kMaxEpochSeconds) return std::nullopt;
  Timestamp t = Clock::from_time_t(tt);
  t += std::chrono::microseconds(frac_us);
  return t;
}

std::optional<Timestamp> from_epoch_seconds(double seconds) {
  if (!std::isfinite(seconds) || seconds < 0.0 || seconds >= static_cast<double>(kMaxEpochSeconds))
    return std::nullopt;
  return Timestamp{} + std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(seconds));
}

Timestamp floor_to_hour(Timestamp t) {
  auto since = t.time_since_epoch();
  return Timestamp(std::chrono::floor<std::chrono::hours>(since));
}

} // namespace sloguard::util
