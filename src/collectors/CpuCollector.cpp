#include "collectors/CpuCollector.hpp"
#include "util/Log.hpp"
#include "util/Procfs.hpp"
#include <string>
#include <string_view>

namespace iorate::collectors {

static void parse_cpu_line(std::string_view line, iorate::model::CpuCounters& out) {
  // "cpu" label, then up to 8 counters; absent ones stay 0
  auto toks = iorate::util::split_ws(line);
  auto at = [&](size_t i) -> uint64_t { return i < toks.size() ? iorate::util::parse_u64(toks[i]) : 0; };
  out.user = at(1); out.nice = at(2); out.system = at(3); out.idle = at(4);
  out.iowait = at(5); out.irq = at(6); out.softirq = at(7); out.steal = at(8);
}

bool CpuCollector::sample(iorate::model::CpuCounters& out) {
  auto txt_opt = iorate::util::read_file_string("/proc/stat");
  if (!txt_opt) {
    iorate::util::log_error("CpuCollector", "cannot read %s",
                            iorate::util::map_proc_path("/proc/stat").c_str());
    return false;
  }
  const std::string& txt = *txt_opt;
  out = iorate::model::CpuCounters{};
  size_t start = 0;
  while (start < txt.size()) {
    size_t end = txt.find('\n', start); if (end == std::string::npos) end = txt.size();
    std::string_view line(txt.data() + start, end - start);
    if (line.starts_with("cpu ")) { parse_cpu_line(line, out); return true; }
    start = end + 1;
  }
  iorate::util::log_debug("CpuCollector", "no aggregate cpu line; counters left at zero");
  return true;
}

} // namespace iorate::collectors
