#include "ui/Report.hpp"
#include <algorithm>
#include <cstdarg>
#include <cstdio>
#include <string>

namespace iorate::ui {

ReportWriter::ReportWriter(std::ostream& out, bool extended, iorate::engine::Unit unit)
    : out_(out), extended_(extended), unit_(unit) {}

void ReportWriter::line(const char* fmt, ...) {
  char buf[256];
  va_list ap;
  va_start(ap, fmt);
  int n = std::vsnprintf(buf, sizeof(buf), fmt, ap);
  va_end(ap);
  if (n < 0) return;
  out_.write(buf, std::min<std::streamsize>(n, sizeof(buf) - 1));
  out_.put('\n');
}

void ReportWriter::cpu(const iorate::model::CpuPercentages& p) {
  line("avg-cpu:");
  line("%6s %6s %6s %6s %6s %6s", "%user", "%sys", "%iowait", "%steal", "%idle", "%irq");
  line("%6.2f %6.2f %6.2f %6.2f %6.2f %6.2f", p.user, p.system, p.iowait, p.steal, p.idle, p.irq);
  out_.put('\n');
  out_.flush();
}

void ReportWriter::devices(const std::vector<DeviceReportRow>& rows) {
  const std::string u = iorate::engine::unit_label(unit_);
  line("Device:");
  if (extended_) {
    std::string r = "r" + u + "/s", w = "w" + u + "/s";
    line("%-12s %8s %8s %10s %10s %8s %8s %7s %7s %6s",
         "Device", "r/s", "w/s", r.c_str(), w.c_str(), "rrqm/s", "wrqm/s", "await", "svctm", "%util");
    for (const auto& row : rows) {
      const auto& d = row.rates;
      line("%-12s %8.2f %8.2f %10.2f %10.2f %8.2f %8.2f %7.2f %7.2f %6.2f",
           row.name.c_str(), d.reads_per_s, d.writes_per_s, d.read_per_s, d.written_per_s,
           d.read_merged_per_s, d.write_merged_per_s, d.await_ms, d.svctm_ms, d.util_pct);
    }
  } else {
    std::string r = u + "_read/s", w = u + "_wrtn/s";
    line("%-12s %8s %10s %10s", "Device", "tps", r.c_str(), w.c_str());
    for (const auto& row : rows) {
      const auto& d = row.rates;
      line("%-12s %8.2f %10.2f %10.2f", row.name.c_str(), d.tps, d.read_per_s, d.written_per_s);
    }
  }
  out_.put('\n');
  out_.flush();
}

} // namespace iorate::ui
