#pragma once

#include <cctype>
#include <string>
#include <string_view>

namespace sloguard::util {

[[nodiscard]] constexpr char ascii_lower(unsigned char c) {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : static_cast<char>(c);
}

[[nodiscard]] inline std::string to_lower(std::string_view sv) {
  std::string out;
  out.reserve(sv.size());
  for (char c : sv) out += ascii_lower(static_cast<unsigned char>(c));
  return out;
}

[[nodiscard]] constexpr bool iequals(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (ascii_lower(static_cast<unsigned char>(a[i])) != ascii_lower(static_cast<unsigned char>(b[i]))) return false;
  }
  return true;
}

[[nodiscard]] inline std::string_view trim(std::string_view sv) {
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
  return sv;
}

[[nodiscard]] inline bool is_blank(std::string_view sv) { return trim(sv).empty(); }

} // namespace sloguard::util
