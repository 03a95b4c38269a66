#include "SecmonLog.h"

#include <atomic>
#include <cstdio>
#include <strings.h>
#include <time.h>

namespace secmon_log {

static std::atomic<int> g_level{DEBUG_L};

static const char *lvl_str(Level l) {
  switch (l) {
  case DEBUG_L:
    return "D";
  case INFO_L:
    return "I";
  case WARN_L:
    return "W";
  default:
    return "E";
  }
}

static unsigned long long monotonic_ms() {
  struct timespec ts;
  clock_gettime(CLOCK_MONOTONIC, &ts);
  return (unsigned long long)ts.tv_sec * 1000ull + (unsigned long long)ts.tv_nsec / 1000000ull;
}

void setLevel(Level lvl) { g_level.store(lvl); }

Level level() { return (Level)g_level.load(); }

bool parseLevel(const char *name, Level &out) {
  if (!name) return false;
  if (strcasecmp(name, "debug") == 0) {
    out = DEBUG_L;
  } else if (strcasecmp(name, "info") == 0) {
    out = INFO_L;
  } else if (strcasecmp(name, "warn") == 0 || strcasecmp(name, "warning") == 0) {
    out = WARN_L;
  } else if (strcasecmp(name, "error") == 0) {
    out = ERROR_L;
  } else {
    return false;
  }
  return true;
}

void vlog(Level lvl, const char *tag, const char *fmt, va_list ap) {
  if ((int)lvl < g_level.load()) return;
  char msg[512];
  vsnprintf(msg, sizeof(msg), fmt, ap);
  // single fprintf so concurrent threads do not interleave within a line
  fprintf(stderr, "[%llu][%s][%s] %s\n", monotonic_ms(), lvl_str(lvl), tag ? tag : "-", msg);
}

void log(Level lvl, const char *tag, const char *fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  vlog(lvl, tag, fmt, ap);
  va_end(ap);
}

} // namespace secmon_log
