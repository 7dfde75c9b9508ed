#pragma once

#include <stdarg.h>
#include <stddef.h>

/*
===============================================================================
  Log.h
===============================================================================

  PURPOSE
  -------
  Minimal printf-style logger for the host process.

  Each call writes one line to stderr:
      [   12345 ms] WARN  link: resync dropped 3 bytes

  The level is process-wide. Lines above the current level are dropped
  before formatting.
===============================================================================
*/

enum class LogLevel : int {
  ERROR = 0,
  WARN  = 1,
  INFO  = 2,
  DEBUG = 3,
};

void setLogLevel(LogLevel level);
LogLevel logLevel();

// Parses "error" / "warn" / "info" / "debug" (case-insensitive)
bool parseLogLevel(const char* s, LogLevel& out_level);
const char* toString(LogLevel level);

void logMessage(LogLevel level, const char* fmt, ...)
#if defined(__GNUC__)
  __attribute__((format(printf, 2, 3)))
#endif
  ;

void vlogMessage(LogLevel level, const char* fmt, va_list args);

#define LOG_ERROR(...) logMessage(LogLevel::ERROR, __VA_ARGS__)
#define LOG_WARN(...)  logMessage(LogLevel::WARN,  __VA_ARGS__)
#define LOG_INFO(...)  logMessage(LogLevel::INFO,  __VA_ARGS__)
#define LOG_DEBUG(...) logMessage(LogLevel::DEBUG, __VA_ARGS__)
