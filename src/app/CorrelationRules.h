#pragma once

#include <stdint.h>

#include <string>
#include <vector>

#include "app/Events.h"

// all_of_types: one event each of type_a and type_b.
// count_of_type: min_count events of type_a, optionally from distinct sensors.
enum class RuleShape : uint8_t {
  all_of_types,
  count_of_type
};

static const char* toString(RuleShape s) {
  switch (s) {
    case RuleShape::all_of_types:  return "all_of_types";
    case RuleShape::count_of_type: return "count_of_type";
    default:                       return "unknown";
  }
}

struct CorrelationRule {
  std::string id;
  RuleShape shape = RuleShape::all_of_types;
  SensorType type_a = SensorType::smoke_detector;
  SensorType type_b = SensorType::smoke_detector;
  uint8_t min_count = 2;
  bool distinct_sensors = true;
  std::string emergency_type;
  std::string reason;
};

struct CorrelationMatch {
  std::string rule_id;
  std::string emergency_type;
  std::string reason;
  std::string details;
  uint32_t event_count = 0;
};

namespace CorrelationRules {

void loadDefaults(std::vector<CorrelationRule>& out);

// Returns true and fills `out` when the buffered events satisfy the rule.
bool evaluate(const CorrelationRule& rule,
              const std::vector<SensorEvent>& events,
              CorrelationMatch& out);

// True when the event is one of the sensor types the rule consumes.
bool consumes(const CorrelationRule& rule, const SensorEvent& e);

} // namespace CorrelationRules
