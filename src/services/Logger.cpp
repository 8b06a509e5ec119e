#include "services/Logger.h"

#include <cstdarg>
#include <cstdio>

namespace {

void stderrSink(LogLevel level, const char* tag, const char* msg) {
  std::fprintf(stderr, "[%s] %s: %s\n", tag, toString(level), msg);
}

Log::Sink gSink = stderrSink;

void emit(LogLevel level, const char* tag, const char* fmt, va_list args) {
  char line[320];
  std::vsnprintf(line, sizeof(line), fmt, args);
  gSink(level, tag ? tag : "-", line);
}

} // namespace

namespace Log {

void setSink(Sink sink) {
  gSink = sink ? sink : stderrSink;
}

void debug(const char* tag, const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  emit(LogLevel::debug, tag, fmt, args);
  va_end(args);
}

void info(const char* tag, const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  emit(LogLevel::info, tag, fmt, args);
  va_end(args);
}

void warn(const char* tag, const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  emit(LogLevel::warn, tag, fmt, args);
  va_end(args);
}

void error(const char* tag, const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  emit(LogLevel::error, tag, fmt, args);
  va_end(args);
}

} // namespace Log
