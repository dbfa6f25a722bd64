#include "engine/DeviceClassifier.hpp"

namespace iorate::engine {

static bool all_digits(std::string_view s) {
  if (s.empty()) return false;
  for (char c : s) {
    if (c < '0' || c > '9') return false;
  }
  return true;
}

bool is_partition(std::string_view name) {
  // nvme0n1p1: the namespace never contains 'p', so whatever follows the last one is the partition
  if (name.find("nvme") != std::string_view::npos && name.find('p') != std::string_view::npos) {
    return all_digits(name.substr(name.rfind('p') + 1));
  }
  // sda1, hdb2, vdc3
  if (name.starts_with("sd") || name.starts_with("hd") || name.starts_with("vd")) {
    if (name.size() <= 3) return false;
    return all_digits(name.substr(3));
  }
  if (name.starts_with("loop") && name.find('p', 4) != std::string_view::npos) return true;
  return false;
}

} // namespace iorate::engine
