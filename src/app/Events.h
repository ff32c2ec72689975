#pragma once

#include <stdint.h>
#include <string.h>

#include <string>

enum class SensorType : uint8_t {
  smoke_detector,
  co_detector,
  flood_sensor,
  motion_sensor,
  glass_break_sensor,
  gas_detector,
  temperature_extreme
};

static const char* toString(SensorType t) {
  switch (t) {
    case SensorType::smoke_detector:      return "smoke_detector";
    case SensorType::co_detector:         return "co_detector";
    case SensorType::flood_sensor:        return "flood_sensor";
    case SensorType::motion_sensor:       return "motion_sensor";
    case SensorType::glass_break_sensor:  return "glass_break_sensor";
    case SensorType::gas_detector:        return "gas_detector";
    case SensorType::temperature_extreme: return "temperature_extreme";
    default:                              return "unknown";
  }
}

static bool parseSensorType(const char* s, SensorType& out) {
  if (!s) return false;
  static const SensorType all[] = {
    SensorType::smoke_detector,
    SensorType::co_detector,
    SensorType::flood_sensor,
    SensorType::motion_sensor,
    SensorType::glass_break_sensor,
    SensorType::gas_detector,
    SensorType::temperature_extreme
  };
  for (SensorType t : all) {
    if (strcmp(s, toString(t)) == 0) {
      out = t;
      return true;
    }
  }
  return false;
}

// One raw report from a sensor, stamped on arrival.
struct SensorEvent {
  std::string sensor_id;
  SensorType sensor_type = SensorType::smoke_detector;
  std::string location;
  int8_t floor = 0;
  std::string event_type;
  std::string payload;
  uint32_t ts_ms = 0;
};
