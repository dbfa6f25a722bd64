#include "util/Procfs.hpp"
#include "util/Log.hpp"

#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace iorate::util {

static std::string proc_root() {
  const char* env = std::getenv("IORATE_PROC_ROOT");
  if (env && *env) return std::string(env);
  return std::string();
}

auto map_proc_path(const std::string& abs) -> std::string {
  if (!abs.starts_with("/proc")) return abs;
  auto root = proc_root();
  if (root.empty()) return abs;
  std::filesystem::path p(root);
  p /= std::filesystem::path(abs.substr(1)); // drop leading '/'
  return p.string();
}

auto read_file_string(const std::string& abs) -> std::optional<std::string> {
  auto path = map_proc_path(abs);
  std::ifstream in(path);
  if (!in) {
    log_debug("Procfs", "cannot open %s: %s", path.c_str(), std::strerror(errno));
    return std::nullopt;
  }
  std::string s((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    log_debug("Procfs", "read error on %s", path.c_str());
    return std::nullopt;
  }
  return s;
}

static bool is_ws(char c) { return c == ' ' || c == '\t' || c == '\r'; }

auto split_ws(std::string_view line) -> std::vector<std::string_view> {
  std::vector<std::string_view> toks;
  size_t i = 0;
  while (i < line.size()) {
    while (i < line.size() && is_ws(line[i])) ++i;
    size_t j = i;
    while (j < line.size() && !is_ws(line[j])) ++j;
    if (j > i) toks.push_back(line.substr(i, j - i));
    i = j;
  }
  return toks;
}

auto parse_u64(std::string_view tok) -> uint64_t {
  uint64_t v = 0;
  auto [ptr, ec] = std::from_chars(tok.data(), tok.data() + tok.size(), v);
  if (ec != std::errc() || ptr != tok.data() + tok.size()) return 0;
  return v;
}

} // namespace iorate::util
