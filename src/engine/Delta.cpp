#include "engine/Delta.hpp"

namespace iorate::engine {

model::CpuCounters delta(const model::CpuCounters& cur, const model::CpuCounters& prev) {
  model::CpuCounters d;
  d.user    = saturating_sub(cur.user, prev.user);
  d.nice    = saturating_sub(cur.nice, prev.nice);
  d.system  = saturating_sub(cur.system, prev.system);
  d.idle    = saturating_sub(cur.idle, prev.idle);
  d.iowait  = saturating_sub(cur.iowait, prev.iowait);
  d.irq     = saturating_sub(cur.irq, prev.irq);
  d.softirq = saturating_sub(cur.softirq, prev.softirq);
  d.steal   = saturating_sub(cur.steal, prev.steal);
  return d;
}

static model::DiskCumulative delta(const model::DiskCumulative& cur, const model::DiskCumulative& prev) {
  model::DiskCumulative d;
  d.reads_completed     = saturating_sub(cur.reads_completed, prev.reads_completed);
  d.reads_merged        = saturating_sub(cur.reads_merged, prev.reads_merged);
  d.sectors_read        = saturating_sub(cur.sectors_read, prev.sectors_read);
  d.read_time_ms        = saturating_sub(cur.read_time_ms, prev.read_time_ms);
  d.writes_completed    = saturating_sub(cur.writes_completed, prev.writes_completed);
  d.writes_merged       = saturating_sub(cur.writes_merged, prev.writes_merged);
  d.sectors_written     = saturating_sub(cur.sectors_written, prev.sectors_written);
  d.write_time_ms       = saturating_sub(cur.write_time_ms, prev.write_time_ms);
  d.io_time_ms          = saturating_sub(cur.io_time_ms, prev.io_time_ms);
  d.weighted_io_time_ms = saturating_sub(cur.weighted_io_time_ms, prev.weighted_io_time_ms);
  return d;
}

model::DiskCounters delta(const model::DiskCounters& cur, const model::DiskCounters& prev) {
  model::DiskCounters d;
  d.cumulative = delta(cur.cumulative, prev.cumulative);
  d.gauges = cur.gauges;
  return d;
}

model::DeviceMap delta(const model::DeviceMap& cur, const model::DeviceMap& prev) {
  model::DeviceMap out;
  for (const auto& [name, counters] : cur) {
    auto it = prev.find(name);
    if (it == prev.end()) continue; // appeared since the last sample
    out.emplace(name, delta(counters, it->second));
  }
  return out;
}

model::CounterSnapshot delta(const model::CounterSnapshot& cur, const model::CounterSnapshot& prev) {
  model::CounterSnapshot d;
  d.cpu = delta(cur.cpu, prev.cpu);
  d.disks = delta(cur.disks, prev.disks);
  return d;
}

} // namespace iorate::engine
