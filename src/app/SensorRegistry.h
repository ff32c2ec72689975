#pragma once

#include <stdint.h>

#include <string>
#include <vector>

#include "app/Events.h"

struct SensorRecord {
  std::string id;
  SensorType type = SensorType::smoke_detector;
  std::string location;
  int8_t floor = 0;
  uint8_t battery = 100;
  bool online = true;
  bool triggered = false;
  uint32_t last_triggered_ms = 0;
  uint32_t trigger_count = 0;
};

struct SensorTypeSummary {
  SensorType type = SensorType::smoke_detector;
  uint16_t total = 0;
  uint16_t online = 0;
  uint32_t triggers = 0;
};

class SensorRegistry {
public:
  void loadDefaults();
  void clear();

  bool add(const SensorRecord& rec);
  const SensorRecord* find(const std::string& id) const;

  // Counts one accepted event against the sensor and marks it online.
  bool markTriggered(const std::string& id, uint32_t nowMs);
  bool setOnline(const std::string& id, bool online);

  const std::vector<SensorRecord>& sensors() const { return sensors_; }
  void summarize(std::vector<SensorTypeSummary>& out) const;
  uint16_t onlineCount() const;
  uint8_t averageBattery() const;

private:
  SensorRecord* findMutable(const std::string& id);

  std::vector<SensorRecord> sensors_;
};
