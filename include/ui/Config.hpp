#pragma once

#include <cstdint>
#include <string>
#include "app/ReportCycle.hpp"
#include "engine/Metrics.hpp"
#include "util/TomlReader.hpp"

namespace iorate::ui {

struct Options {
  bool extended{false};
  bool show_cpu{true};
  bool show_devices{true};
  iorate::engine::Unit unit{iorate::engine::Unit::Kilobytes};
  bool omit_first{false};
  double interval_s{1.0};
  uint32_t count{0}; // 0 => unbounded
};

// Longest accepted interval; larger values do not fit the sleep clock's ticks
inline constexpr double kMaxIntervalSeconds = 1e9;

enum class ParseStatus { Run, Help, Error };

// $XDG_CONFIG_HOME/iorate/config.toml, else ~/.config/iorate/config.toml; empty if neither is set
std::string config_file_path();

// Compiled defaults overlaid with the config file (when have_toml) and then IORATE_* variables.
// Invalid values are logged and skipped.
Options resolve_defaults(const iorate::util::TomlReader& toml, bool have_toml);

// resolve_defaults() with the file at config_file_path()
Options load_defaults();

// Apply command-line flags and positionals on top of opts. On Error, err holds the message.
ParseStatus parse_args(int argc, const char* const* argv, Options& opts, std::string& err);

const char* usage();

iorate::app::CycleOptions to_cycle_options(const Options& o);

// Environment variable helpers (accept IORATE_ and iorate_ prefixes)
const char* getenv_compat(const char* name);

} // namespace iorate::ui
