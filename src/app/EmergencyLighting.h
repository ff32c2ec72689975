#pragma once

#include <stdint.h>

#include <string>
#include <vector>

enum class LightStatus : uint8_t {
  ready,
  active,
  fault
};

static const char* toString(LightStatus s) {
  switch (s) {
    case LightStatus::ready:  return "ready";
    case LightStatus::active: return "active";
    case LightStatus::fault:  return "fault";
    default:                  return "unknown";
  }
}

struct EmergencyLight {
  std::string id;
  std::string location;
  int8_t floor = 0;
  uint8_t battery = 100;
  bool auto_activate = true;
  LightStatus status = LightStatus::ready;
};

class EmergencyLighting {
public:
  void loadDefaults();
  void setMinBattery(uint8_t pct) { minBattery_ = pct; }

  // Both return how many lights changed state.
  uint8_t activate();
  uint8_t deactivate();

  bool setBattery(const std::string& id, uint8_t pct);

  bool anyActive() const { return activeCount() > 0; }
  uint8_t activeCount() const;
  uint8_t usableCount() const;
  const std::vector<EmergencyLight>& lights() const { return lights_; }

private:
  std::vector<EmergencyLight> lights_;
  uint8_t minBattery_ = 5;
};
