#include "collectors/DiskCollector.hpp"
#include "engine/DeviceClassifier.hpp"
#include "util/Log.hpp"
#include "util/Procfs.hpp"
#include <string>
#include <vector>

namespace iorate::collectors {

static uint64_t field(const std::vector<std::string_view>& toks, size_t idx) {
  return idx < toks.size() ? iorate::util::parse_u64(toks[idx]) : 0;
}

bool DiskCollector::parse_line(std::string_view line, std::string& name, iorate::model::DiskCounters& out) {
  // major minor name rd rd_merged rd_sectors rd_ms wr wr_merged wr_sectors wr_ms in_flight io_ms weighted_ms [...]
  auto toks = iorate::util::split_ws(line);
  if (toks.size() < 3) return false;
  name.assign(toks[2]);
  auto& c = out.cumulative;
  c.reads_completed     = field(toks, 3);
  c.reads_merged        = field(toks, 4);
  c.sectors_read        = field(toks, 5);
  c.read_time_ms        = field(toks, 6);
  c.writes_completed    = field(toks, 7);
  c.writes_merged       = field(toks, 8);
  c.sectors_written     = field(toks, 9);
  c.write_time_ms       = field(toks, 10);
  out.gauges.io_in_progress = field(toks, 11);
  c.io_time_ms          = field(toks, 12);
  c.weighted_io_time_ms = field(toks, 13);
  return true;
}

bool DiskCollector::sample(iorate::model::DeviceMap& out) {
  auto txt_opt = iorate::util::read_file_string("/proc/diskstats");
  if (!txt_opt) {
    iorate::util::log_error("DiskCollector", "cannot read %s",
                            iorate::util::map_proc_path("/proc/diskstats").c_str());
    return false;
  }
  const std::string& txt = *txt_opt;
  out.clear();
  size_t start = 0;
  while (start < txt.size()) {
    size_t end = txt.find('\n', start); if (end == std::string::npos) end = txt.size();
    std::string_view line(txt.data() + start, end - start);
    start = end + 1;
    std::string name; iorate::model::DiskCounters d{};
    if (!parse_line(line, name, d)) continue;
    if (iorate::engine::is_partition(name)) continue;
    out[name] = d;
  }
  iorate::util::log_debug("DiskCollector", "%zu whole-disk devices", out.size());
  return true;
}

} // namespace iorate::collectors
