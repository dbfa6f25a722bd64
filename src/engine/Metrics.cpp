#include "engine/Metrics.hpp"
#include <algorithm>

namespace iorate::engine {

double unit_divisor(Unit u) {
  return u == Unit::Megabytes ? 1024.0 : 1.0;
}

const char* unit_label(Unit u) {
  return u == Unit::Megabytes ? "MB" : "kB";
}

model::CpuPercentages cpu_percentages(const model::CpuCounters& d) {
  model::CpuPercentages p;
  auto total = static_cast<double>(d.total());
  if (total == 0.0) return p;
  auto pct = [total](uint64_t v) { return static_cast<double>(v) / total * 100.0; };
  p.user   = pct(d.user + d.nice);
  p.system = pct(d.system);
  p.iowait = pct(d.iowait);
  p.steal  = pct(d.steal);
  p.idle   = pct(d.idle);
  p.irq    = pct(d.irq + d.softirq);
  return p;
}

model::DeviceRates device_rates(const model::DiskCounters& d, double elapsed_s, double unit_div) {
  const auto& c = d.cumulative;
  double dt = elapsed_s;
  if (dt <= 0.0) dt = 1.0;
  if (unit_div <= 0.0) unit_div = 1.0;

  model::DeviceRates r;
  r.reads_per_s  = static_cast<double>(c.reads_completed) / dt;
  r.writes_per_s = static_cast<double>(c.writes_completed) / dt;
  r.tps = r.reads_per_s + r.writes_per_s;
  r.read_per_s    = static_cast<double>(c.sectors_read) * kSectorBytes / 1024.0 / dt / unit_div;
  r.written_per_s = static_cast<double>(c.sectors_written) * kSectorBytes / 1024.0 / dt / unit_div;

  r.read_merged_per_s  = static_cast<double>(c.reads_merged) / dt;
  r.write_merged_per_s = static_cast<double>(c.writes_merged) / dt;
  uint64_t ios = c.reads_completed + c.writes_completed;
  if (ios > 0) {
    r.await_ms = static_cast<double>(c.read_time_ms + c.write_time_ms) / static_cast<double>(ios);
    r.svctm_ms = static_cast<double>(c.io_time_ms) / static_cast<double>(ios);
  }
  // io_time_ms is wall time with at least one request in flight
  r.util_pct = std::min(100.0, (static_cast<double>(c.io_time_ms) / (dt * 1000.0)) * 100.0);
  return r;
}

} // namespace iorate::engine
