#pragma once

#include <stdint.h>

#include "app/Events.h"
#include "app/Incident.h"

struct PowerBackupUnit;
struct WellbeingCheck;

enum class PowerAlert : uint8_t {
  ups_critical,
  battery_low,
  fuel_low
};

static const char* toString(PowerAlert a) {
  switch (a) {
    case PowerAlert::ups_critical: return "ups_critical";
    case PowerAlert::battery_low:  return "battery_low";
    case PowerAlert::fuel_low:     return "fuel_low";
    default:                       return "unknown";
  }
}

// Outbound notifications. Every callback runs inside the engine call that
// caused it and must not call back into the engine.
class EngineObserver {
public:
  virtual ~EngineObserver() = default;

  virtual void onSensorWarning(const SensorEvent&) {}
  virtual void onIncidentCreated(const Incident&) {}
  virtual void onIncidentUpdated(const Incident&, const IncidentUpdate&) {}
  virtual void onIncidentResolved(const Incident&, const RecoveryPlan*) {}
  virtual void onRecoveryStepCompleted(const RecoveryPlan&, const RecoveryStep&) {}
  virtual void onLockdownChanged(bool, const std::string&) {}
  virtual void onPanicChanged(bool, const std::string&) {}
  virtual void onLightingChanged(bool, uint8_t) {}
  virtual void onGeneratorStarted(const PowerBackupUnit&) {}
  virtual void onPowerAlert(PowerAlert, const PowerBackupUnit&) {}
  virtual void onWellbeingScheduled(const WellbeingCheck&) {}
  virtual void onWellbeingOverdue(const WellbeingCheck&) {}
};
