#pragma once
#include "model/Disk.hpp"
#include <string_view>

namespace iorate::collectors {

// Reads /proc/diskstats into a map of whole-disk devices.
class DiskCollector {
public:
  bool sample(iorate::model::DeviceMap& out);

  // Parse one diskstats line. Returns false only when the line has no device name;
  // counters that are missing or unparsable are left at 0.
  static bool parse_line(std::string_view line, std::string& name, iorate::model::DiskCounters& out);
};

} // namespace iorate::collectors
