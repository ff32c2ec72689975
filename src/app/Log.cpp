#include "app/Log.h"

#include <stdarg.h>
#include <stdio.h>

namespace Log {

namespace {
Sink gSink = nullptr;
LogLevel gLevel = LogLevel::info;
constexpr size_t kLineMax = 192;
} // namespace

void setSink(Sink sink) {
  gSink = sink;
}

void setLevel(LogLevel level) {
  gLevel = level;
}

LogLevel level() {
  return gLevel;
}

void write(LogLevel level, const char* tag, const char* fmt, ...) {
  if (!gSink) return;
  if ((uint8_t)level > (uint8_t)gLevel) return;

  char line[kLineMax];
  va_list args;
  va_start(args, fmt);
  vsnprintf(line, sizeof(line), fmt, args);
  va_end(args);

  gSink(level, tag ? tag : "-", line);
}

} // namespace Log
