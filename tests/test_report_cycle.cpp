#include "minitest.hpp"
#include "app/ReportCycle.hpp"
#include <chrono>
#include <deque>
#include <initializer_list>
#include <vector>

using namespace iorate;

namespace {

// Replays a fixed sequence of snapshots; fails once the script runs out.
class ScriptedProvider : public collectors::ISnapshotProvider {
public:
  ScriptedProvider(std::initializer_list<model::CounterSnapshot> script) : script_(script) {}
  bool read_cpu(model::CpuCounters& out) override {
    if (script_.empty()) return false;
    out = script_.front().cpu;
    return true;
  }
  bool read_disks(model::DeviceMap& out) override {
    if (script_.empty()) return false;
    out = script_.front().disks;
    script_.pop_front();
    ++reads;
    return true;
  }
  const char* name() const override { return "scripted"; }
  int reads{0};
private:
  std::deque<model::CounterSnapshot> script_;
};

struct CapturingSink : ui::IReportSink {
  std::vector<model::CpuPercentages> cpus;
  std::vector<std::vector<ui::DeviceReportRow>> disks;
  bool healthy{true};
  void cpu(const model::CpuPercentages& p) override { cpus.push_back(p); }
  void devices(const std::vector<ui::DeviceReportRow>& rows) override { disks.push_back(rows); }
  bool ok() const override { return healthy; }
};

struct SleepLog {
  std::vector<double> naps;
  app::ReportCycle::Sleeper sleeper() {
    return [this](std::chrono::duration<double> d){ naps.push_back(d.count()); };
  }
};

model::CounterSnapshot snap(uint64_t user, uint64_t idle, uint64_t sda_reads, uint64_t sda_sectors) {
  model::CounterSnapshot s;
  s.cpu.user = user; s.cpu.idle = idle;
  auto& d = s.disks["sda"];
  d.cumulative.reads_completed = sda_reads;
  d.cumulative.sectors_read = sda_sectors;
  return s;
}

} // namespace

TEST(cycle_first_report_is_since_boot) {
  ScriptedProvider p{snap(25, 75, 300, 4096)};
  CapturingSink sink; SleepLog sl;
  app::CycleOptions o{}; o.count = 1; o.interval_s = 5.0;
  app::ReportCycle cycle(p, sink, o, sl.sleeper());
  ASSERT_TRUE(cycle.run() == app::CycleStatus::Completed);
  ASSERT_EQ(cycle.reports_emitted(), 1u);
  ASSERT_TRUE(sl.naps.empty());
  ASSERT_EQ(sink.cpus.size(), 1u);
  ASSERT_NEAR(sink.cpus[0].user, 25.0, 1e-9);
  ASSERT_NEAR(sink.cpus[0].idle, 75.0, 1e-9);
  // lifetime totals over a nominal one second, not over the interval
  ASSERT_EQ(sink.disks.size(), 1u);
  ASSERT_EQ(sink.disks[0].size(), 1u);
  ASSERT_EQ(sink.disks[0][0].name, "sda");
  ASSERT_NEAR(sink.disks[0][0].rates.reads_per_s, 300.0, 1e-9);
  ASSERT_NEAR(sink.disks[0][0].rates.read_per_s, 2048.0, 1e-9);
}

TEST(cycle_steady_state_uses_deltas_over_interval) {
  ScriptedProvider p{snap(100, 800, 10, 0), snap(150, 850, 30, 2048)};
  CapturingSink sink; SleepLog sl;
  app::CycleOptions o{}; o.count = 1; o.omit_first = true; o.interval_s = 2.0;
  app::ReportCycle cycle(p, sink, o, sl.sleeper());
  ASSERT_TRUE(cycle.run() == app::CycleStatus::Completed);
  ASSERT_EQ(sl.naps.size(), 1u);
  ASSERT_NEAR(sl.naps[0], 2.0, 1e-12);
  ASSERT_EQ(sink.cpus.size(), 1u);
  ASSERT_NEAR(sink.cpus[0].user, 50.0, 1e-9);
  ASSERT_NEAR(sink.disks[0][0].rates.reads_per_s, 10.0, 1e-9);
  ASSERT_NEAR(sink.disks[0][0].rates.read_per_s, 512.0, 1e-9);
}

TEST(cycle_count_includes_first_report) {
  ScriptedProvider p{snap(1, 1, 0, 0), snap(2, 2, 0, 0), snap(3, 3, 0, 0), snap(4, 4, 0, 0)};
  CapturingSink sink; SleepLog sl;
  app::CycleOptions o{}; o.count = 3;
  app::ReportCycle cycle(p, sink, o, sl.sleeper());
  ASSERT_TRUE(cycle.run() == app::CycleStatus::Completed);
  ASSERT_EQ(cycle.reports_emitted(), 3u);
  ASSERT_EQ(sl.naps.size(), 2u);
  ASSERT_EQ(p.reads, 3);
}

TEST(cycle_previous_snapshot_rolls_forward) {
  ScriptedProvider p{snap(0, 0, 0, 0), snap(10, 10, 0, 0), snap(40, 20, 0, 0)};
  CapturingSink sink; SleepLog sl;
  app::CycleOptions o{}; o.count = 2; o.omit_first = true;
  app::ReportCycle cycle(p, sink, o, sl.sleeper());
  ASSERT_TRUE(cycle.run() == app::CycleStatus::Completed);
  ASSERT_EQ(sink.cpus.size(), 2u);
  ASSERT_NEAR(sink.cpus[0].user, 50.0, 1e-9);
  // second report is 30 user / 10 idle against the second sample, not the first
  ASSERT_NEAR(sink.cpus[1].user, 75.0, 1e-9);
}

TEST(cycle_new_device_skipped_until_paired) {
  auto a = snap(0, 0, 5, 0);
  auto b = snap(10, 10, 6, 0);
  b.disks["sdb"].cumulative.reads_completed = 1000;
  auto c = b;
  c.disks["sdb"].cumulative.reads_completed = 1004;
  ScriptedProvider p{a, b, c};
  CapturingSink sink; SleepLog sl;
  app::CycleOptions o{}; o.count = 2; o.omit_first = true;
  app::ReportCycle cycle(p, sink, o, sl.sleeper());
  ASSERT_TRUE(cycle.run() == app::CycleStatus::Completed);
  ASSERT_EQ(sink.disks[0].size(), 1u);
  ASSERT_EQ(sink.disks[1].size(), 2u);
  ASSERT_EQ(sink.disks[1][1].name, "sdb");
  ASSERT_NEAR(sink.disks[1][1].rates.reads_per_s, 4.0, 1e-9);
}

TEST(cycle_source_failure_is_fatal) {
  ScriptedProvider p{snap(1, 1, 0, 0), snap(2, 2, 0, 0)};
  CapturingSink sink; SleepLog sl;
  app::CycleOptions o{}; // unbounded
  app::ReportCycle cycle(p, sink, o, sl.sleeper());
  ASSERT_TRUE(cycle.run() == app::CycleStatus::SourceUnreadable);
  ASSERT_EQ(cycle.reports_emitted(), 2u);
  ASSERT_EQ(sl.naps.size(), 2u);
}

TEST(cycle_initial_source_failure_emits_nothing) {
  ScriptedProvider p{};
  CapturingSink sink; SleepLog sl;
  app::CycleOptions o{}; o.count = 1;
  app::ReportCycle cycle(p, sink, o, sl.sleeper());
  ASSERT_TRUE(cycle.run() == app::CycleStatus::SourceUnreadable);
  ASSERT_EQ(cycle.reports_emitted(), 0u);
  ASSERT_TRUE(sink.cpus.empty());
}

TEST(cycle_respects_cpu_and_device_toggles) {
  ScriptedProvider p{snap(1, 1, 1, 1)};
  CapturingSink sink; SleepLog sl;
  app::CycleOptions o{}; o.count = 1; o.show_cpu = false;
  app::ReportCycle cycle(p, sink, o, sl.sleeper());
  ASSERT_TRUE(cycle.run() == app::CycleStatus::Completed);
  ASSERT_TRUE(sink.cpus.empty());
  ASSERT_EQ(sink.disks.size(), 1u);
}

TEST(cycle_output_failure_stops) {
  ScriptedProvider p{snap(1, 1, 0, 0), snap(2, 2, 0, 0)};
  CapturingSink sink; sink.healthy = false; SleepLog sl;
  app::CycleOptions o{};
  app::ReportCycle cycle(p, sink, o, sl.sleeper());
  ASSERT_TRUE(cycle.run() == app::CycleStatus::OutputFailed);
  ASSERT_EQ(cycle.reports_emitted(), 1u);
}
