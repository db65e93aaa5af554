#pragma once

namespace herd::util {

// stderr diagnostics: "herd: <component>: <message>\n".
// Informational lines are suppressed when HERD_QUIET is set to a truthy value.
void log_info(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void log_error(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));

[[nodiscard]] bool log_quiet();

} // namespace herd::util
