#include "app/EmergencyLighting.h"

namespace {
struct DefaultLight {
  const char* id;
  const char* location;
  int8_t floor;
  uint8_t battery;
};

const DefaultLight kDefaultLights[] = {
  {"emlight_hallway1",   "Ground Floor Hallway", 1, 100},
  {"emlight_hallway2",   "Upstairs Hallway",     2, 98},
  {"emlight_stairs1",    "Main Staircase",       1, 95},
  {"emlight_basement",   "Basement",             0, 92},
  {"emlight_garage",     "Garage",               0, 88},
  {"emlight_kitchen",    "Kitchen",              1, 97},
  {"emlight_exit_front", "Front Exit",           1, 100},
  {"emlight_exit_back",  "Back Exit",            1, 100},
};
} // namespace

void EmergencyLighting::loadDefaults() {
  lights_.clear();
  for (const DefaultLight& d : kDefaultLights) {
    EmergencyLight l;
    l.id = d.id;
    l.location = d.location;
    l.floor = d.floor;
    l.battery = d.battery;
    lights_.push_back(l);
  }
}

uint8_t EmergencyLighting::activate() {
  uint8_t n = 0;
  for (EmergencyLight& l : lights_) {
    if (!l.auto_activate) continue;
    if (l.status != LightStatus::ready) continue;
    if (l.battery <= minBattery_) continue;
    l.status = LightStatus::active;
    ++n;
  }
  return n;
}

uint8_t EmergencyLighting::deactivate() {
  uint8_t n = 0;
  for (EmergencyLight& l : lights_) {
    if (l.status != LightStatus::active) continue;
    l.status = LightStatus::ready;
    ++n;
  }
  return n;
}

bool EmergencyLighting::setBattery(const std::string& id, uint8_t pct) {
  for (EmergencyLight& l : lights_) {
    if (l.id != id) continue;
    l.battery = pct > 100 ? 100 : pct;
    return true;
  }
  return false;
}

uint8_t EmergencyLighting::activeCount() const {
  uint8_t n = 0;
  for (const EmergencyLight& l : lights_) {
    if (l.status == LightStatus::active) ++n;
  }
  return n;
}

uint8_t EmergencyLighting::usableCount() const {
  uint8_t n = 0;
  for (const EmergencyLight& l : lights_) {
    if (l.status != LightStatus::fault && l.battery > minBattery_) ++n;
  }
  return n;
}
