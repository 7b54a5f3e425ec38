#include "sc/core/Log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>

namespace sc {

namespace {
std::atomic<bool> g_logEnabled{true};
} // namespace

void setLogEnabled(bool enabled) {
  g_logEnabled.store(enabled, std::memory_order_relaxed);
}

bool logEnabled() {
  return g_logEnabled.load(std::memory_order_relaxed);
}

void logMessage(const char* tag, const char* fmt, ...) {
  if (!logEnabled()) return;

  char buf[512];
  va_list args;
  va_start(args, fmt);
  std::vsnprintf(buf, sizeof(buf), fmt, args);
  va_end(args);

  std::fprintf(stderr, "[%s] %s\n", tag, buf);
}

} // namespace sc
