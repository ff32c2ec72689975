#pragma once

#include <stdint.h>

// Plain structs only: these are copied byte-wise through FreeRTOS queues and
// into the NVS store-and-forward ring.

struct StatusSnapshot {
  uint16_t incidents_active = 0;
  uint16_t incidents_total = 0;
  uint16_t wellbeing_pending = 0;
  uint16_t sensors_online = 0;
  uint8_t lights_active = 0;
  uint8_t routes_cleared = 0;
  bool lockdown = false;
  bool panic = false;
  bool mains_lost = false;
  bool power_optimal = true;
  uint32_t generator_starts = 0;
  uint32_t actions_failed = 0;
};

enum class PublishKind : uint8_t {
  incident,
  alert,
  action,
  status,
  ack
};

struct PublishMsg {
  PublishKind kind = PublishKind::status;
  bool ok = false;
  uint8_t severity = 0;
  uint16_t number = 0;
  uint32_t ts_ms = 0;
  char id[24]{};
  char name[28]{};
  char state[16]{};
  char text[128]{};
  StatusSnapshot st{};
};

struct CmdMsg {
  char payload[160]{};
};
