#pragma once

#include <cctype>
#include <charconv>
#include <cstdint>
#include <fstream>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace iorate::util {

// Reader for the flat TOML subset used by config.toml: [section] headers,
// key = value pairs, "quoted" strings and # comments. Arrays, inline tables
// and multi-line strings are not supported.
class TomlReader {
public:
  bool load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) return false;
    return parse(in);
  }

  // Parse from a stream. Malformed lines are recorded in bad_lines() and skipped.
  bool parse(std::istream& in) {
    sections_.clear();
    bad_lines_.clear();
    std::string section;
    std::string line;
    int lineno = 0;
    while (std::getline(in, line)) {
      ++lineno;
      auto sv = trim(strip_comment(line));
      if (sv.empty()) continue;
      if (sv.front() == '[') {
        if (sv.back() != ']' || sv.size() < 3) { bad_lines_.push_back(lineno); continue; }
        section = std::string(trim(sv.substr(1, sv.size() - 2)));
        sections_[section];
        continue;
      }
      auto eq = sv.find('=');
      if (eq == std::string_view::npos || eq == 0) { bad_lines_.push_back(lineno); continue; }
      std::string key(trim(sv.substr(0, eq)));
      std::string val(trim(sv.substr(eq + 1)));
      if (val.size() >= 2 && val.front() == '"' && val.back() == '"')
        val = val.substr(1, val.size() - 2);
      sections_[section][key] = std::move(val);
    }
    return !in.bad();
  }

  [[nodiscard]] bool has(std::string_view section, std::string_view key) const {
    return find(section, key) != nullptr;
  }

  [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                       const std::string& def = "") const {
    const auto* v = find(section, key);
    return v ? *v : def;
  }

  [[nodiscard]] std::optional<int64_t> get_int(std::string_view section, std::string_view key) const {
    const auto* v = find(section, key);
    if (!v || v->empty()) return std::nullopt;
    int64_t out = 0;
    auto [ptr, ec] = std::from_chars(v->data(), v->data() + v->size(), out);
    if (ec != std::errc() || ptr != v->data() + v->size()) return std::nullopt;
    return out;
  }

  [[nodiscard]] std::optional<double> get_double(std::string_view section, std::string_view key) const {
    const auto* v = find(section, key);
    if (!v || v->empty()) return std::nullopt;
    double out = 0.0;
    auto [ptr, ec] = std::from_chars(v->data(), v->data() + v->size(), out);
    if (ec != std::errc() || ptr != v->data() + v->size()) return std::nullopt;
    return out;
  }

  [[nodiscard]] std::optional<bool> get_bool(std::string_view section, std::string_view key) const {
    const auto* v = find(section, key);
    if (!v) return std::nullopt;
    if (*v == "true" || *v == "True" || *v == "TRUE" || *v == "1") return true;
    if (*v == "false" || *v == "False" || *v == "FALSE" || *v == "0") return false;
    return std::nullopt;
  }

  [[nodiscard]] const std::vector<int>& bad_lines() const { return bad_lines_; }

private:
  std::map<std::string, std::map<std::string, std::string, std::less<>>, std::less<>> sections_;
  std::vector<int> bad_lines_;

  [[nodiscard]] const std::string* find(std::string_view section, std::string_view key) const {
    auto s = sections_.find(section);
    if (s == sections_.end()) return nullptr;
    auto k = s->second.find(key);
    if (k == s->second.end()) return nullptr;
    return &k->second;
  }

  // '#' starts a comment unless it sits inside a quoted value
  static std::string_view strip_comment(std::string_view sv) {
    bool quoted = false;
    for (size_t i = 0; i < sv.size(); ++i) {
      if (sv[i] == '"') quoted = !quoted;
      else if (sv[i] == '#' && !quoted) return sv.substr(0, i);
    }
    return sv;
  }

  static std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
  }
};

} // namespace iorate::util
