#include "app/SensorRegistry.h"

namespace {
struct DefaultSensor {
  const char* id;
  SensorType type;
  const char* location;
  int8_t floor;
  uint8_t battery;
};

const DefaultSensor kDefaultSensors[] = {
  {"smoke_detector_living",  SensorType::smoke_detector,      "Living Room",      1, 92},
  {"smoke_detector_kitchen", SensorType::smoke_detector,      "Kitchen",          1, 88},
  {"smoke_detector_bedroom", SensorType::smoke_detector,      "Master Bedroom",   2, 95},
  {"smoke_detector_hallway", SensorType::smoke_detector,      "Upstairs Hallway", 2, 90},
  {"co_detector_basement",   SensorType::co_detector,         "Basement",         0, 85},
  {"co_detector_garage",     SensorType::co_detector,         "Garage",           0, 78},
  {"flood_sensor_basement",  SensorType::flood_sensor,        "Basement Floor",   0, 91},
  {"flood_sensor_bathroom",  SensorType::flood_sensor,        "Main Bathroom",    1, 87},
  {"flood_sensor_laundry",   SensorType::flood_sensor,        "Laundry Room",     1, 93},
  {"motion_sensor_front",    SensorType::motion_sensor,       "Front Entrance",   1, 82},
  {"motion_sensor_back",     SensorType::motion_sensor,       "Back Entrance",    1, 79},
  {"motion_sensor_garage",   SensorType::motion_sensor,       "Garage",           0, 84},
  {"motion_sensor_living",   SensorType::motion_sensor,       "Living Room",      1, 88},
  {"motion_sensor_upstairs", SensorType::motion_sensor,       "Upstairs Landing", 2, 91},
  {"glass_break_front",      SensorType::glass_break_sensor,  "Front Windows",    1, 94},
  {"glass_break_back",       SensorType::glass_break_sensor,  "Back Windows",     1, 89},
  {"glass_break_basement",   SensorType::glass_break_sensor,  "Basement Windows", 0, 86},
  {"gas_detector_kitchen",   SensorType::gas_detector,        "Kitchen",          1, 90},
  {"temp_extreme_attic",     SensorType::temperature_extreme, "Attic",            3, 83},
  {"temp_extreme_basement",  SensorType::temperature_extreme, "Basement",         0, 87},
};
} // namespace

void SensorRegistry::loadDefaults() {
  sensors_.clear();
  for (const DefaultSensor& d : kDefaultSensors) {
    SensorRecord rec;
    rec.id = d.id;
    rec.type = d.type;
    rec.location = d.location;
    rec.floor = d.floor;
    rec.battery = d.battery;
    sensors_.push_back(rec);
  }
}

void SensorRegistry::clear() {
  sensors_.clear();
}

bool SensorRegistry::add(const SensorRecord& rec) {
  if (rec.id.empty()) return false;
  if (find(rec.id)) return false;
  sensors_.push_back(rec);
  return true;
}

const SensorRecord* SensorRegistry::find(const std::string& id) const {
  for (const SensorRecord& s : sensors_) {
    if (s.id == id) return &s;
  }
  return nullptr;
}

SensorRecord* SensorRegistry::findMutable(const std::string& id) {
  for (SensorRecord& s : sensors_) {
    if (s.id == id) return &s;
  }
  return nullptr;
}

bool SensorRegistry::markTriggered(const std::string& id, uint32_t nowMs) {
  SensorRecord* s = findMutable(id);
  if (!s) return false;
  s->triggered = true;
  s->last_triggered_ms = nowMs;
  s->online = true;
  ++s->trigger_count;
  return true;
}

bool SensorRegistry::setOnline(const std::string& id, bool online) {
  SensorRecord* s = findMutable(id);
  if (!s) return false;
  s->online = online;
  return true;
}

void SensorRegistry::summarize(std::vector<SensorTypeSummary>& out) const {
  out.clear();
  for (const SensorRecord& s : sensors_) {
    SensorTypeSummary* slot = nullptr;
    for (SensorTypeSummary& sum : out) {
      if (sum.type == s.type) {
        slot = &sum;
        break;
      }
    }
    if (!slot) {
      SensorTypeSummary fresh;
      fresh.type = s.type;
      out.push_back(fresh);
      slot = &out.back();
    }
    ++slot->total;
    if (s.online) ++slot->online;
    slot->triggers += s.trigger_count;
  }
}

uint16_t SensorRegistry::onlineCount() const {
  uint16_t n = 0;
  for (const SensorRecord& s : sensors_) {
    if (s.online) ++n;
  }
  return n;
}

uint8_t SensorRegistry::averageBattery() const {
  if (sensors_.empty()) return 0;
  uint32_t sum = 0;
  for (const SensorRecord& s : sensors_) sum += s.battery;
  return (uint8_t)((sum + sensors_.size() / 2) / sensors_.size());
}
