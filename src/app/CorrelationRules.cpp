#include "app/CorrelationRules.h"

namespace CorrelationRules {

namespace {
CorrelationRule allOf(const char* id, SensorType a, SensorType b, const char* type, const char* reason) {
  CorrelationRule r;
  r.id = id;
  r.shape = RuleShape::all_of_types;
  r.type_a = a;
  r.type_b = b;
  r.min_count = 2;
  r.emergency_type = type;
  r.reason = reason;
  return r;
}

CorrelationRule countOf(const char* id, SensorType a, uint8_t minCount, bool distinct, const char* type) {
  CorrelationRule r;
  r.id = id;
  r.shape = RuleShape::count_of_type;
  r.type_a = a;
  r.type_b = a;
  r.min_count = minCount;
  r.distinct_sensors = distinct;
  r.emergency_type = type;
  return r;
}

void appendUnique(std::string& list, const std::string& item) {
  if (item.empty()) return;
  size_t pos = 0;
  while (pos <= list.size()) {
    const size_t end = list.find(", ", pos);
    const size_t stop = (end == std::string::npos) ? list.size() : end;
    if (list.compare(pos, stop - pos, item) == 0 && (stop - pos) == item.size()) return;
    if (end == std::string::npos) break;
    pos = end + 2;
  }
  if (!list.empty()) list += ", ";
  list += item;
}
} // namespace

void loadDefaults(std::vector<CorrelationRule>& out) {
  out.clear();
  out.push_back(allOf("smoke_heat",
                      SensorType::smoke_detector,
                      SensorType::temperature_extreme,
                      "fire",
                      "Multi-sensor correlation: smoke and extreme heat detected"));
  out.push_back(allOf("motion_glass",
                      SensorType::motion_sensor,
                      SensorType::glass_break_sensor,
                      "intruder",
                      "Multi-sensor correlation: motion and glass break detected"));
  out.push_back(countOf("multi_flood", SensorType::flood_sensor, 2, true, "flood"));
  out.push_back(countOf("multi_smoke", SensorType::smoke_detector, 2, true, "fire"));
  out.push_back(countOf("multi_heat", SensorType::temperature_extreme, 2, true, "fire"));
  out.push_back(countOf("multi_glass", SensorType::glass_break_sensor, 2, true, "intruder"));
  // A home usually carries a single CO or gas detector; repeated reports confirm.
  out.push_back(countOf("repeat_co", SensorType::co_detector, 2, false, "carbon-monoxide"));
  out.push_back(countOf("repeat_gas", SensorType::gas_detector, 2, false, "gas-leak"));
}

bool consumes(const CorrelationRule& rule, const SensorEvent& e) {
  if (e.sensor_type == rule.type_a) return true;
  return rule.shape == RuleShape::all_of_types && e.sensor_type == rule.type_b;
}

bool evaluate(const CorrelationRule& rule,
              const std::vector<SensorEvent>& events,
              CorrelationMatch& out) {
  std::string sensors;
  std::string locations;
  uint32_t countA = 0;
  uint32_t countB = 0;
  uint32_t total = 0;

  for (const SensorEvent& e : events) {
    if (!consumes(rule, e)) continue;
    ++total;
    if (e.sensor_type == rule.type_a) {
      // Distinct mode only counts the first event from each sensor.
      const size_t before = sensors.size();
      appendUnique(sensors, e.sensor_id);
      const bool fresh = sensors.size() != before;
      if (!rule.distinct_sensors || fresh) ++countA;
    } else {
      appendUnique(sensors, e.sensor_id);
      ++countB;
    }
    appendUnique(locations, e.location);
  }

  bool matched = false;
  if (rule.shape == RuleShape::all_of_types) {
    matched = countA > 0 && countB > 0;
  } else {
    matched = countA >= rule.min_count;
  }
  if (!matched) return false;

  out.rule_id = rule.id;
  out.emergency_type = rule.emergency_type;
  out.event_count = total;
  if (!rule.reason.empty()) {
    out.reason = rule.reason;
  } else {
    out.reason = std::string("Multiple ") + toString(rule.type_a) + " sensors triggered at: " + locations;
  }
  out.details = "sensors=" + sensors + "; locations=" + locations;
  return true;
}

} // namespace CorrelationRules
