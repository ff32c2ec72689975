#include "Logger.h"

namespace {
void serialSink(LogLevel level, const char* tag, const char* msg) {
  Serial.print("[LOG] ");
  Serial.print(toString(level));
  Serial.print(" ");
  Serial.print(tag ? tag : "-");
  Serial.print(": ");
  Serial.println(msg ? msg : "");
}
} // namespace

void Logger::begin(LogLevel level) {
  Log::setLevel(level);
  Log::setSink(serialSink);
}

void Logger::logCommand(const char* origin, const Command& cmd, bool ok, const char* detail) {
  if (cmd.kind == CommandKind::none) return;
  Serial.print("[");
  Serial.print(origin ? origin : "CMD");
  Serial.print("] ");
  Serial.print(toString(cmd.kind));
  if (!cmd.id.empty()) {
    Serial.print(" id=");
    Serial.print(cmd.id.c_str());
  }
  Serial.print(ok ? " -> ok" : " -> rejected");
  if (detail && detail[0]) {
    Serial.print(" (");
    Serial.print(detail);
    Serial.print(")");
  }
  Serial.println();
}
