// stderr diagnostics: "iorate: <component>: <message>"
#pragma once
#include <string>

namespace iorate::util {

// IORATE_DEBUG=1 (or any value not starting with 0/f/F) enables log_debug
[[nodiscard]] bool debug_enabled();

// One diagnostic line, newline included; every log_* level uses this shape
[[nodiscard]] std::string format_log_line(const char* component, const char* msg);

void log_debug(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void log_warn(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void log_error(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));

} // namespace iorate::util
