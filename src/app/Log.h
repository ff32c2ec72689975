#pragma once

#include <stdint.h>

enum class LogLevel : uint8_t {
  error,
  warn,
  info,
  debug
};

static const char* toString(LogLevel lv) {
  switch (lv) {
    case LogLevel::error: return "E";
    case LogLevel::warn:  return "W";
    case LogLevel::info:  return "I";
    case LogLevel::debug: return "D";
    default:              return "?";
  }
}

// printf-style logging for the engine. Lines are dropped until a sink is set.
namespace Log {

using Sink = void (*)(LogLevel level, const char* tag, const char* msg);

void setSink(Sink sink);
void setLevel(LogLevel level);
LogLevel level();

void write(LogLevel level, const char* tag, const char* fmt, ...)
  __attribute__((format(printf, 3, 4)));

} // namespace Log

#define LOG_ERROR(tag, ...) Log::write(LogLevel::error, tag, __VA_ARGS__)
#define LOG_WARN(tag, ...)  Log::write(LogLevel::warn, tag, __VA_ARGS__)
#define LOG_INFO(tag, ...)  Log::write(LogLevel::info, tag, __VA_ARGS__)
#define LOG_DEBUG(tag, ...) Log::write(LogLevel::debug, tag, __VA_ARGS__)
