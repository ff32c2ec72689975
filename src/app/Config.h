#pragma once

#include <stdint.h>

#ifndef ALLOW_REMOTE_WITHOUT_TOKEN_DEFAULT
#define ALLOW_REMOTE_WITHOUT_TOKEN_DEFAULT 0
#endif

#ifndef GENERATOR_AUTOSTART_DEFAULT
#define GENERATOR_AUTOSTART_DEFAULT 1
#endif

struct Config {
  uint32_t correlation_window_ms = 30000;
  uint32_t correlation_tick_ms = 5000;
  uint32_t power_poll_ms = 120000;
  uint32_t wellbeing_poll_ms = 1800000;
  uint32_t wellbeing_overdue_ms = 1800000;

  // Generator start is deferred after a mains loss; 0 starts it immediately.
  bool generator_auto_start = (GENERATOR_AUTOSTART_DEFAULT != 0);
  uint32_t generator_autostart_delay_ms = 30000;
  uint32_t generator_cooldown_ms = 300000;
  uint8_t generator_min_fuel = 5;

  uint8_t min_light_battery = 5;
  uint8_t contact_severity_threshold = 4;
  uint8_t optimal_backup_level = 50;

  bool allow_remote_without_token = (ALLOW_REMOTE_WITHOUT_TOKEN_DEFAULT != 0);
  bool allow_serial_commands = true;
  bool serial_notify_enabled = true;
  uint32_t status_heartbeat_ms = 30000;
};
