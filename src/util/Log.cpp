#include "util/Log.hpp"
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace iorate::util {

bool debug_enabled() {
  const char* v = std::getenv("IORATE_DEBUG");
  if (!v || !*v) return false;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F') return false;
  return true;
}

std::string format_log_line(const char* component, const char* msg) {
  return std::string("iorate: ") + component + ": " + msg + "\n";
}

static void vlog(const char* component, const char* fmt, va_list ap) {
  char msg[1024];
  std::vsnprintf(msg, sizeof(msg), fmt, ap);
  std::fputs(format_log_line(component, msg).c_str(), stderr);
}

void log_debug(const char* component, const char* fmt, ...) {
  if (!debug_enabled()) return;
  va_list ap;
  va_start(ap, fmt);
  vlog(component, fmt, ap);
  va_end(ap);
}

void log_warn(const char* component, const char* fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  vlog(component, fmt, ap);
  va_end(ap);
}

void log_error(const char* component, const char* fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  vlog(component, fmt, ap);
  va_end(ap);
}

} // namespace iorate::util
