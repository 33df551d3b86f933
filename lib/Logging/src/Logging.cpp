#include "Logging.h"

#include <chrono>
#include <utility>

namespace {
LogWriter logWriter;
LogClock logClock;
bool logEnabled = true;

void writeStderr(const char* line) {
  fputs(line, stderr);
  fflush(stderr);
}

unsigned long steadyMillis() {
  static const auto start = std::chrono::steady_clock::now();
  const auto elapsed = std::chrono::steady_clock::now() - start;
  return static_cast<unsigned long>(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
}
}  // namespace

unsigned long logMillis() { return logClock ? logClock() : steadyMillis(); }

void logSetWriter(LogWriter writer) { logWriter = std::move(writer); }

void logSetClock(LogClock clock) { logClock = std::move(clock); }

void logSetEnabled(const bool enabled) { logEnabled = enabled; }

void logPrintf(const char* level, const char* origin, const char* format, ...) {
  if (!logEnabled) {
    return;
  }
  va_list args;
  va_start(args, format);
  char buf[256];
  char* c = buf;
  const char* const end = buf + sizeof(buf);

  int len = snprintf(c, end - c, "[%lu] ", logMillis());
  if (len > 0) c += (len < end - c) ? len : end - c - 1;

  const char* p = level;
  while (*p && c < end - 1) *c++ = *p++;
  if (c < end - 1) *c++ = ' ';

  len = snprintf(c, end - c, "[%s] ", origin);
  if (len > 0) c += (len < end - c) ? len : end - c - 1;

  vsnprintf(c, end - c, format, args);
  va_end(args);

  if (logWriter) {
    logWriter(buf);
  } else {
    writeStderr(buf);
  }
}
