#include "utils/Log.h"

#include <stdio.h>
#include <strings.h>

#include <atomic>
#include <mutex>

#include "utils/Clock.h"

/*
  Log.cpp

  Formats into a bounded stack buffer (like the RX debug note on the
  firmware side) and writes the whole line with one fputs so lines from
  the reader thread and the main thread never interleave.
*/

namespace {

constexpr size_t LOG_LINE_BYTES = 256;

std::atomic<int> g_level(static_cast<int>(LogLevel::INFO));
std::mutex g_write_mutex;

}  // namespace

void setLogLevel(LogLevel level) {
  g_level.store(static_cast<int>(level));
}

LogLevel logLevel() {
  return static_cast<LogLevel>(g_level.load());
}

bool parseLogLevel(const char* s, LogLevel& out_level) {
  if (!s) return false;
  if (strcasecmp(s, "error") == 0) { out_level = LogLevel::ERROR; return true; }
  if (strcasecmp(s, "warn") == 0)  { out_level = LogLevel::WARN;  return true; }
  if (strcasecmp(s, "info") == 0)  { out_level = LogLevel::INFO;  return true; }
  if (strcasecmp(s, "debug") == 0) { out_level = LogLevel::DEBUG; return true; }
  return false;
}

const char* toString(LogLevel level) {
  switch (level) {
    case LogLevel::ERROR: return "ERROR";
    case LogLevel::WARN:  return "WARN";
    case LogLevel::INFO:  return "INFO";
    case LogLevel::DEBUG: return "DEBUG";
  }
  return "?";
}

void vlogMessage(LogLevel level, const char* fmt, va_list args) {
  if (static_cast<int>(level) > g_level.load()) return;

  char line[LOG_LINE_BYTES];
  int n = snprintf(line, sizeof(line), "[%8lu ms] %-5s ",
                   (unsigned long)monotonicMs(), toString(level));
  if (n < 0) return;
  if ((size_t)n >= sizeof(line)) n = (int)sizeof(line) - 1;

  vsnprintf(line + n, sizeof(line) - (size_t)n, fmt, args);

  std::lock_guard<std::mutex> lock(g_write_mutex);
  fputs(line, stderr);
  fputc('\n', stderr);
}

void logMessage(LogLevel level, const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vlogMessage(level, fmt, args);
  va_end(args);
}
