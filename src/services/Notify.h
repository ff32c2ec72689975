#pragma once
#include <Arduino.h>

// Human-readable one-liners for whoever watches the console.
class Notify {
public:
  void begin(bool serialEnabled);
  void setSerialEnabled(bool enabled);

  void send(const String& msg);
  void alert(uint8_t severity, const String& msg);

private:
  bool serialEnabled_ = false;
};
