#include "ConfigStore.h"

#include "app/ConfigKeys.h"

bool ConfigStore::begin() {
#if defined(ARDUINO_ARCH_ESP32)
  ready_ = pref_.begin("erccfg", false);
#else
  ready_ = false;
#endif
  if (!ready_) Serial.println("[CFG] NVS unavailable, using defaults");
  return ready_;
}

uint8_t ConfigStore::load(Config& cfg) {
  if (!ready_) return 0;
  uint8_t applied = 0;
#if defined(ARDUINO_ARCH_ESP32)
  for (size_t i = 0; i < ConfigKeys::count(); ++i) {
    const char* key = ConfigKeys::name(i);
    if (!pref_.isKey(key)) continue;
    const uint32_t value = pref_.getUInt(key, 0);
    if (ConfigKeys::apply(cfg, key, value) == Outcome::ok) {
      ++applied;
    } else {
      // Stale value from an older firmware; forget it.
      pref_.remove(key);
    }
  }
#else
  (void)cfg;
#endif
  return applied;
}

Outcome ConfigStore::set(const char* key, uint32_t value, Config& cfg) {
  const Outcome res = ConfigKeys::apply(cfg, key ? key : "", value);
  if (res != Outcome::ok) return res;
#if defined(ARDUINO_ARCH_ESP32)
  if (ready_) pref_.putUInt(key, value);
#endif
  return Outcome::ok;
}
