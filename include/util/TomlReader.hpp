#pragma once

#include <charconv>
#include <cstdint>
#include <fstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "util/Strings.hpp"

namespace sloguard::util {

// Flat TOML subset: [section] headers, key = value lines, '#' comments,
// double-quoted strings with \" and \\ escapes. Enough for sloguard's config.
class TomlReader {
public:
  bool load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) return false;
    sections_.clear();
    std::string current;
    std::string line;
    while (std::getline(in, line)) parse_line(line, current);
    return true;
  }

  // Same grammar as load(), from a string.
  void parse(std::string_view text) {
    sections_.clear();
    std::string current;
    while (!text.empty()) {
      auto nl = text.find('\n');
      std::string_view line = text.substr(0, nl);
      parse_line(line, current);
      if (nl == std::string_view::npos) break;
      text.remove_prefix(nl + 1);
    }
  }

  [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                       const std::string& def = "") const {
    const auto* v = find(section, key);
    return v ? *v : def;
  }

  [[nodiscard]] int get_int(std::string_view section, std::string_view key, int def = 0) const {
    const auto* v = find(section, key);
    if (!v || v->empty()) return def;
    int out = def;
    auto [ptr, ec] = std::from_chars(v->data(), v->data() + v->size(), out);
    if (ec != std::errc{} || ptr != v->data() + v->size()) return def;
    return out;
  }

  [[nodiscard]] double get_double(std::string_view section, std::string_view key, double def = 0.0) const {
    const auto* v = find(section, key);
    if (!v || v->empty()) return def;
    double out = def;
    auto [ptr, ec] = std::from_chars(v->data(), v->data() + v->size(), out);
    if (ec != std::errc{} || ptr != v->data() + v->size()) return def;
    return out;
  }

  [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool def = false) const {
    const auto* v = find(section, key);
    if (!v || v->empty()) return def;
    if (iequals(*v, "true") || *v == "1" || iequals(*v, "yes") || iequals(*v, "on")) return true;
    if (iequals(*v, "false") || *v == "0" || iequals(*v, "no") || iequals(*v, "off")) return false;
    return def;
  }

  [[nodiscard]] bool has(std::string_view section, std::string_view key) const {
    return find(section, key) != nullptr;
  }

  [[nodiscard]] std::vector<std::string> keys(std::string_view section) const {
    std::vector<std::string> out;
    for (const auto& [name, entries] : sections_) {
      if (name != section) continue;
      for (const auto& [k, v] : entries) out.push_back(k);
    }
    return out;
  }

private:
  using Entries = std::vector<std::pair<std::string, std::string>>;
  std::vector<std::pair<std::string, Entries>> sections_;

  void parse_line(std::string_view raw, std::string& current) {
    auto sv = trim(raw);
    if (sv.empty() || sv.front() == '#') return;
    if (sv.front() == '[') {
      auto close = sv.find(']');
      if (close == std::string_view::npos) return;
      current = std::string(trim(sv.substr(1, close - 1)));
      section(current);
      return;
    }
    auto eq = sv.find('=');
    if (eq == std::string_view::npos) return;
    std::string key(trim(sv.substr(0, eq)));
    if (key.empty()) return;
    set(section(current), key, parse_value(trim(sv.substr(eq + 1))));
  }

  static std::string parse_value(std::string_view v) {
    if (!v.empty() && v.front() == '"') {
      std::string out;
      for (size_t i = 1; i < v.size(); ++i) {
        char c = v[i];
        if (c == '\\' && i + 1 < v.size()) {
          char n = v[++i];
          out += (n == 'n') ? '\n' : (n == 't') ? '\t' : n;
        } else if (c == '"') {
          break;
        } else {
          out += c;
        }
      }
      return out;
    }
    auto hash = v.find('#');
    if (hash != std::string_view::npos) v = trim(v.substr(0, hash));
    return std::string(v);
  }

  Entries& section(const std::string& name) {
    for (auto& [n, e] : sections_)
      if (n == name) return e;
    sections_.emplace_back(name, Entries{});
    return sections_.back().second;
  }

  static void set(Entries& entries, const std::string& key, std::string value) {
    for (auto& [k, v] : entries) {
      if (k == key) { v = std::move(value); return; }
    }
    entries.emplace_back(key, std::move(value));
  }

  [[nodiscard]] const std::string* find(std::string_view section, std::string_view key) const {
    for (const auto& [n, entries] : sections_) {
      if (n != section) continue;
      for (const auto& [k, v] : entries)
        if (k == key) return &v;
    }
    return nullptr;
  }
};

} // namespace sloguard::util
