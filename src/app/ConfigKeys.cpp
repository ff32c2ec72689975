#include "app/ConfigKeys.h"

#include "app/Log.h"

namespace {
constexpr const char* TAG = "CFG";

enum class Key : uint8_t {
  window_ms,
  tick_ms,
  power_poll_ms,
  wb_poll_ms,
  wb_overdue_ms,
  gen_auto,
  gen_delay_ms,
  gen_cooldown_ms,
  gen_min_fuel,
  light_min_batt,
  contact_sev,
  heartbeat_ms,
  notify_serial,
  remote_no_tok
};

struct KeySpec {
  Key key;
  const char* name;
  uint32_t min;
  uint32_t max;
};

const KeySpec kKeys[] = {
  {Key::window_ms,       "window_ms",       1000, 600000},
  {Key::tick_ms,         "tick_ms",         100, 60000},
  {Key::power_poll_ms,   "power_poll_ms",   1000, 3600000},
  {Key::wb_poll_ms,      "wb_poll_ms",      1000, 86400000},
  {Key::wb_overdue_ms,   "wb_overdue_ms",   1000, 86400000},
  {Key::gen_auto,        "gen_auto",        0, 1},
  {Key::gen_delay_ms,    "gen_delay_ms",    0, 600000},
  {Key::gen_cooldown_ms, "gen_cooldown_ms", 0, 3600000},
  {Key::gen_min_fuel,    "gen_min_fuel",    0, 100},
  {Key::light_min_batt,  "light_min_batt",  0, 100},
  {Key::contact_sev,     "contact_sev",     1, 5},
  {Key::heartbeat_ms,    "heartbeat_ms",    1000, 3600000},
  {Key::notify_serial,   "notify_serial",   0, 1},
  {Key::remote_no_tok,   "remote_no_tok",   0, 1}
};

constexpr size_t kKeyCount = sizeof(kKeys) / sizeof(kKeys[0]);

const KeySpec* findSpec(const std::string& key) {
  for (size_t i = 0; i < kKeyCount; ++i) {
    if (key == kKeys[i].name) return &kKeys[i];
  }
  return nullptr;
}
} // namespace

namespace ConfigKeys {

size_t count() {
  return kKeyCount;
}

const char* name(size_t index) {
  return index < kKeyCount ? kKeys[index].name : nullptr;
}

Outcome apply(Config& cfg, const std::string& key, uint32_t value) {
  const KeySpec* spec = findSpec(key);
  if (!spec) {
    LOG_WARN(TAG, "unknown key %s", key.c_str());
    return Outcome::validation_failure;
  }
  if (value < spec->min || value > spec->max) {
    LOG_WARN(TAG, "%s=%lu out of range [%lu..%lu]",
             spec->name, (unsigned long)value, (unsigned long)spec->min, (unsigned long)spec->max);
    return Outcome::validation_failure;
  }

  switch (spec->key) {
    case Key::window_ms:       cfg.correlation_window_ms = value; break;
    case Key::tick_ms:         cfg.correlation_tick_ms = value; break;
    case Key::power_poll_ms:   cfg.power_poll_ms = value; break;
    case Key::wb_poll_ms:      cfg.wellbeing_poll_ms = value; break;
    case Key::wb_overdue_ms:   cfg.wellbeing_overdue_ms = value; break;
    case Key::gen_auto:        cfg.generator_auto_start = (value != 0); break;
    case Key::gen_delay_ms:    cfg.generator_autostart_delay_ms = value; break;
    case Key::gen_cooldown_ms: cfg.generator_cooldown_ms = value; break;
    case Key::gen_min_fuel:    cfg.generator_min_fuel = (uint8_t)value; break;
    case Key::light_min_batt:  cfg.min_light_battery = (uint8_t)value; break;
    case Key::contact_sev:     cfg.contact_severity_threshold = (uint8_t)value; break;
    case Key::heartbeat_ms:    cfg.status_heartbeat_ms = value; break;
    case Key::notify_serial:   cfg.serial_notify_enabled = (value != 0); break;
    case Key::remote_no_tok:   cfg.allow_remote_without_token = (value != 0); break;
  }
  LOG_INFO(TAG, "%s=%lu", spec->name, (unsigned long)value);
  return Outcome::ok;
}

bool read(const Config& cfg, const std::string& key, uint32_t& out) {
  const KeySpec* spec = findSpec(key);
  if (!spec) return false;

  switch (spec->key) {
    case Key::window_ms:       out = cfg.correlation_window_ms; break;
    case Key::tick_ms:         out = cfg.correlation_tick_ms; break;
    case Key::power_poll_ms:   out = cfg.power_poll_ms; break;
    case Key::wb_poll_ms:      out = cfg.wellbeing_poll_ms; break;
    case Key::wb_overdue_ms:   out = cfg.wellbeing_overdue_ms; break;
    case Key::gen_auto:        out = cfg.generator_auto_start ? 1u : 0u; break;
    case Key::gen_delay_ms:    out = cfg.generator_autostart_delay_ms; break;
    case Key::gen_cooldown_ms: out = cfg.generator_cooldown_ms; break;
    case Key::gen_min_fuel:    out = cfg.generator_min_fuel; break;
    case Key::light_min_batt:  out = cfg.min_light_battery; break;
    case Key::contact_sev:     out = cfg.contact_severity_threshold; break;
    case Key::heartbeat_ms:    out = cfg.status_heartbeat_ms; break;
    case Key::notify_serial:   out = cfg.serial_notify_enabled ? 1u : 0u; break;
    case Key::remote_no_tok:   out = cfg.allow_remote_without_token ? 1u : 0u; break;
  }
  return true;
}

} // namespace ConfigKeys
