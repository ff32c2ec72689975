#pragma once

#include <stdint.h>

#include <string>
#include <vector>

#include "app/CorrelationRules.h"
#include "app/Events.h"
#include "app/Outcome.h"
#include "app/SensorRegistry.h"

// Time-bounded queue of raw sensor reports, scanned for multi-sensor patterns.
class CorrelationBuffer {
public:
  struct ReportResult {
    Outcome outcome = Outcome::ok;
    bool single_sensor_warning = false;
    SensorEvent event;
  };

  struct Stats {
    uint32_t accepted = 0;
    uint32_t rejected = 0;
    uint32_t pruned = 0;
    uint32_t matched = 0;
    uint32_t warnings = 0;
  };

  void attachRegistry(SensorRegistry* registry) { registry_ = registry; }
  void setWindow(uint32_t windowMs) { windowMs_ = windowMs; }
  void setRules(const std::vector<CorrelationRule>& rules) { rules_ = rules; }

  ReportResult report(const std::string& sensorId,
                      const std::string& eventType,
                      const std::string& payload,
                      uint32_t nowMs);

  // Prunes stale events, then appends one match per satisfied rule.
  // Events of a matched rule's sensor types are consumed.
  void tick(uint32_t nowMs, std::vector<CorrelationMatch>& out);

  void clear() { events_.clear(); }

  const std::vector<SensorEvent>& events() const { return events_; }
  const std::vector<CorrelationRule>& rules() const { return rules_; }
  uint32_t windowMs() const { return windowMs_; }
  const Stats& stats() const { return stats_; }

private:
  bool inWindow(uint32_t nowMs, uint32_t tsMs) const;
  void prune(uint32_t nowMs);

  SensorRegistry* registry_ = nullptr;
  std::vector<CorrelationRule> rules_;
  std::vector<SensorEvent> events_;
  uint32_t windowMs_ = 30000;
  Stats stats_;
};
