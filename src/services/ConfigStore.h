#pragma once
#include <Arduino.h>

#include "app/Config.h"
#include "app/Outcome.h"

#if defined(ARDUINO_ARCH_ESP32)
#include <Preferences.h>
#endif

// Runtime Config overrides kept in NVS and replayed over the defaults at boot.
class ConfigStore {
public:
  bool begin();
  // Applies every stored key to cfg; returns how many were applied.
  uint8_t load(Config& cfg);
  Outcome set(const char* key, uint32_t value, Config& cfg);
  bool ready() const { return ready_; }

private:
#if defined(ARDUINO_ARCH_ESP32)
  Preferences pref_;
#endif
  bool ready_ = false;
};
