#include "Notify.h"

void Notify::begin(bool serialEnabled) {
  serialEnabled_ = serialEnabled;
}

void Notify::setSerialEnabled(bool enabled) {
  serialEnabled_ = enabled;
}

void Notify::send(const String& msg) {
  if (!serialEnabled_) return;
  Serial.print("[NOTIFY] ");
  Serial.println(msg);
}

void Notify::alert(uint8_t severity, const String& msg) {
  if (!serialEnabled_) return;
  Serial.print("[NOTIFY][SEV");
  Serial.print(severity);
  Serial.print("] ");
  Serial.println(msg);
}
