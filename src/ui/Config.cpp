#include "ui/Config.hpp"
#include "util/Log.hpp"
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <optional>
#include <string_view>
#include <system_error>
#include <vector>

namespace iorate::ui {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("IORATE_", 0) == 0) {
    alt = std::string("iorate_") + n.substr(7);
  } else if (n.rfind("iorate_", 0) == 0) {
    alt = std::string("IORATE_") + n.substr(7);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/iorate/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/iorate/config.toml";
  return {};
}

static std::string lower(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

static std::optional<double> parse_interval(std::string_view s) {
  double v = 0.0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  if (!std::isfinite(v) || v <= 0.0 || v > kMaxIntervalSeconds) return std::nullopt;
  return v;
}

static std::optional<uint32_t> parse_count(std::string_view s) {
  uint32_t v = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return v;
}

static std::optional<bool> parse_flag(std::string_view s) {
  auto l = lower(s);
  if (l == "1" || l == "true" || l == "yes" || l == "on") return true;
  if (l == "0" || l == "false" || l == "no" || l == "off") return false;
  return std::nullopt;
}

static std::optional<iorate::engine::Unit> parse_unit(std::string_view s) {
  auto l = lower(s);
  if (l == "kb" || l == "k" || l == "kilobytes") return iorate::engine::Unit::Kilobytes;
  if (l == "mb" || l == "m" || l == "megabytes") return iorate::engine::Unit::Megabytes;
  return std::nullopt;
}

static bool apply_show(Options& o, std::string_view s) {
  auto l = lower(s);
  if (l == "all")    { o.show_cpu = true;  o.show_devices = true;  return true; }
  if (l == "cpu")    { o.show_cpu = true;  o.show_devices = false; return true; }
  if (l == "device") { o.show_cpu = false; o.show_devices = true;  return true; }
  return false;
}

// --- config file layer ---

static void apply_toml(Options& o, const iorate::util::TomlReader& toml) {
  for (int ln : toml.bad_lines())
    iorate::util::log_warn("Config", "config.toml line %d is malformed, skipped", ln);

  if (toml.has("report", "extended")) {
    if (auto v = toml.get_bool("report", "extended")) o.extended = *v;
    else iorate::util::log_warn("Config", "[report] extended: expected true/false");
  }
  if (toml.has("report", "omit_first")) {
    if (auto v = toml.get_bool("report", "omit_first")) o.omit_first = *v;
    else iorate::util::log_warn("Config", "[report] omit_first: expected true/false");
  }
  if (toml.has("report", "unit")) {
    if (auto v = parse_unit(toml.get_string("report", "unit"))) o.unit = *v;
    else iorate::util::log_warn("Config", "[report] unit: expected \"kb\" or \"mb\"");
  }
  if (toml.has("report", "show")) {
    if (!apply_show(o, toml.get_string("report", "show")))
      iorate::util::log_warn("Config", "[report] show: expected \"all\", \"cpu\" or \"device\"");
  }
  if (toml.has("sampling", "interval")) {
    auto v = toml.get_double("sampling", "interval");
    if (v && std::isfinite(*v) && *v > 0.0 && *v <= kMaxIntervalSeconds) o.interval_s = *v;
    else iorate::util::log_warn("Config", "[sampling] interval: expected seconds in (0, %g]", kMaxIntervalSeconds);
  }
  if (toml.has("sampling", "count")) {
    auto v = toml.get_int("sampling", "count");
    if (v && *v >= 0 && *v <= std::numeric_limits<uint32_t>::max()) o.count = static_cast<uint32_t>(*v);
    else iorate::util::log_warn("Config", "[sampling] count: expected a non-negative integer");
  }
}

// --- environment layer ---

static void apply_env(Options& o) {
  if (const char* v = getenv_compat("IORATE_EXTENDED")) {
    if (auto b = parse_flag(v)) o.extended = *b;
    else iorate::util::log_warn("Config", "ignoring IORATE_EXTENDED=%s", v);
  }
  if (const char* v = getenv_compat("IORATE_OMIT_FIRST")) {
    if (auto b = parse_flag(v)) o.omit_first = *b;
    else iorate::util::log_warn("Config", "ignoring IORATE_OMIT_FIRST=%s", v);
  }
  if (const char* v = getenv_compat("IORATE_UNIT")) {
    if (auto u = parse_unit(v)) o.unit = *u;
    else iorate::util::log_warn("Config", "ignoring IORATE_UNIT=%s", v);
  }
  if (const char* v = getenv_compat("IORATE_INTERVAL")) {
    if (auto d = parse_interval(v)) o.interval_s = *d;
    else iorate::util::log_warn("Config", "ignoring IORATE_INTERVAL=%s", v);
  }
  if (const char* v = getenv_compat("IORATE_COUNT")) {
    if (auto c = parse_count(v)) o.count = *c;
    else iorate::util::log_warn("Config", "ignoring IORATE_COUNT=%s", v);
  }
}

Options resolve_defaults(const iorate::util::TomlReader& toml, bool have_toml) {
  Options o{};
  if (have_toml) apply_toml(o, toml);
  apply_env(o);
  return o;
}

Options load_defaults() {
  iorate::util::TomlReader toml;
  auto path = config_file_path();
  bool have_toml = !path.empty() && toml.load(path);
  if (have_toml) iorate::util::log_debug("Config", "loaded %s", path.c_str());
  return resolve_defaults(toml, have_toml);
}

// --- command line layer ---

const char* usage() {
  return
    "Usage: iorate [-x] [-c] [-d] [-k|-m] [-y] [interval [count]]\n"
    "Report CPU and block device I/O statistics.\n"
    "\n"
    "  -x, --extended     show extended device statistics\n"
    "  -c, --cpu          show the CPU report\n"
    "  -d, --device       show the device report (both when neither -c nor -d)\n"
    "  -k, --kilobytes    throughput in kB/s (default)\n"
    "  -m, --megabytes    throughput in MB/s\n"
    "  -y, --omit-first   skip the first report (statistics since boot)\n"
    "  -h, --help         print this help\n"
    "\n"
    "  interval           seconds between reports (default 1)\n"
    "  count              number of reports, 0 = until interrupted (default 0)\n";
}

namespace {
struct CliFlags { bool x{}, c{}, d{}, k{}, m{}, y{}; };

bool short_flag(char ch, CliFlags& f) {
  switch (ch) {
    case 'x': f.x = true; return true;
    case 'c': f.c = true; return true;
    case 'd': f.d = true; return true;
    case 'k': f.k = true; return true;
    case 'm': f.m = true; return true;
    case 'y': f.y = true; return true;
    default: return false;
  }
}
} // namespace

ParseStatus parse_args(int argc, const char* const* argv, Options& opts, std::string& err) {
  CliFlags f{};
  std::vector<std::string_view> positionals;
  for (int i = 1; i < argc; ++i) {
    std::string_view a = argv[i];
    if (a == "-h" || a == "--help") return ParseStatus::Help;
    else if (a == "--extended") f.x = true;
    else if (a == "--cpu") f.c = true;
    else if (a == "--device") f.d = true;
    else if (a == "--kilobytes") f.k = true;
    else if (a == "--megabytes") f.m = true;
    else if (a == "--omit-first") f.y = true;
    else if (a.size() > 1 && a[0] == '-' && std::isdigit(static_cast<unsigned char>(a[1])))
      positionals.push_back(a); // negative number: rejected below as an interval or count
    else if (a.size() > 1 && a[0] == '-' && a[1] != '-') {
      // clustered short flags: -xk
      for (char ch : a.substr(1)) {
        if (ch == 'h') return ParseStatus::Help;
        if (!short_flag(ch, f)) { err = "unknown option -" + std::string(1, ch); return ParseStatus::Error; }
      }
    }
    else if (a.starts_with("--")) { err = "unknown option " + std::string(a); return ParseStatus::Error; }
    else positionals.push_back(a);
  }
  if (positionals.size() > 2) { err = "too many arguments"; return ParseStatus::Error; }
  if (positionals.size() >= 1) {
    auto v = parse_interval(positionals[0]);
    if (!v) { err = "invalid interval '" + std::string(positionals[0]) + "'"; return ParseStatus::Error; }
    opts.interval_s = *v;
  }
  if (positionals.size() == 2) {
    auto v = parse_count(positionals[1]);
    if (!v) { err = "invalid count '" + std::string(positionals[1]) + "'"; return ParseStatus::Error; }
    opts.count = *v;
  }

  if (f.x) opts.extended = true;
  if (f.y) opts.omit_first = true;
  if (f.m) opts.unit = iorate::engine::Unit::Megabytes;
  else if (f.k) opts.unit = iorate::engine::Unit::Kilobytes;
  if (f.c || f.d) {
    // -c and -d together mean both
    opts.show_cpu = f.c;
    opts.show_devices = f.d;
  }
  return ParseStatus::Run;
}

iorate::app::CycleOptions to_cycle_options(const Options& o) {
  iorate::app::CycleOptions c{};
  c.show_cpu = o.show_cpu;
  c.show_devices = o.show_devices;
  c.omit_first = o.omit_first;
  c.interval_s = o.interval_s;
  c.count = o.count;
  c.unit_divisor = iorate::engine::unit_divisor(o.unit);
  return c;
}

} // namespace iorate::ui
