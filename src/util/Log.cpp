#include "util/Log.hpp"

#include <cstdarg>
#include <cstdio>
#include <cstdlib>

namespace herd::util {

bool log_quiet() {
  const char* v = std::getenv("HERD_QUIET");
  if (!v || !*v) return false;
  return !(v[0] == '0' || v[0] == 'f' || v[0] == 'F' || v[0] == 'n' || v[0] == 'N');
}

static void vlog(const char* component, const char* fmt, va_list ap) {
  char line[1024];
  std::vsnprintf(line, sizeof(line), fmt, ap);
  std::fprintf(stderr, "herd: %s: %s\n", component, line);
}

void log_info(const char* component, const char* fmt, ...) {
  if (log_quiet()) return;
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

} // namespace herd::util
