#include "log.h"

#include <stdarg.h>
#include <stdio.h>

#include <atomic>

namespace {

std::atomic<bool> gVerbose(false);

}  // namespace

void logPrintf(const char *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vfprintf(stdout, fmt, args);
  va_end(args);
  fflush(stdout);
}

void logErrorf(const char *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vfprintf(stderr, fmt, args);
  va_end(args);
  fflush(stderr);
}

void setVerboseLogging(bool enabled) {
  gVerbose.store(enabled);
}

bool verboseLogging() {
  return gVerbose.load();
}
