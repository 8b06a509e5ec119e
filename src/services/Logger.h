#pragma once

#include <stdint.h>

#ifndef APP_VERBOSE_LOG
#define APP_VERBOSE_LOG 0
#endif

enum class LogLevel : uint8_t { debug, info, warn, error };

static inline const char* toString(LogLevel lv) {
  switch (lv) {
    case LogLevel::debug: return "debug";
    case LogLevel::info:  return "info";
    case LogLevel::warn:  return "warn";
    case LogLevel::error: return "error";
    default:              return "unknown";
  }
}

namespace Log {

using Sink = void (*)(LogLevel level, const char* tag, const char* msg);

// Passing nullptr restores the stderr sink.
void setSink(Sink sink);

// Call sites keep debug lines inside #if APP_VERBOSE_LOG.
void debug(const char* tag, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void info(const char* tag, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void warn(const char* tag, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void error(const char* tag, const char* fmt, ...) __attribute__((format(printf, 2, 3)));

} // namespace Log
