#pragma once

#include <stdint.h>

#include <string>

#include "app/EmergencyCatalog.h"
#include "app/EmergencyLighting.h"
#include "app/EngineObserver.h"
#include "app/Incident.h"

// Device-side collaborator for protocol actions. Calls are fire-and-forget;
// returning false marks the step failed.
class ActionSink {
public:
  virtual ~ActionSink() = default;
  virtual bool perform(ActionKind kind, const std::string& description, const std::string& incidentId) = 0;
};

class ActionExecutor {
public:
  struct Stats {
    uint32_t executed = 0;
    uint32_t failed = 0;
    uint32_t forwarded = 0;
  };

  void attachSink(ActionSink* sink) { sink_ = sink; }
  void attachLighting(EmergencyLighting* lighting) { lighting_ = lighting; }
  void attachObserver(EngineObserver* observer) { observer_ = observer; }

  StepStatus execute(ActionKind kind, const std::string& description, const std::string& incidentId);

  uint8_t lightsOn();
  uint8_t lightsOff();

  const Stats& stats() const { return stats_; }

private:
  bool run(ActionKind kind, const std::string& description, const std::string& incidentId);

  ActionSink* sink_ = nullptr;
  EmergencyLighting* lighting_ = nullptr;
  EngineObserver* observer_ = nullptr;
  Stats stats_;
};
