#pragma once

#include <stdint.h>

#include <string>
#include <vector>

#include "app/ActionExecutor.h"
#include "app/EngineObserver.h"
#include "app/Incident.h"
#include "app/Outcome.h"

class IncidentManager;

// Global lockdown and panic modes. Lockdown toggles are idempotent.
class SafetyModeController {
public:
  struct PanicResult {
    Outcome outcome = Outcome::ok;
    bool created = false;
    std::string incident_id;
  };

  void attachExecutor(ActionExecutor* executor) { executor_ = executor; }
  void attachIncidents(IncidentManager* incidents) { incidents_ = incidents; }
  void attachObserver(EngineObserver* observer) { observer_ = observer; }

  // Return true only when the mode actually changed.
  bool activateLockdown(const std::string& reason, uint32_t nowMs);
  bool deactivateLockdown(const std::string& reason, uint32_t nowMs);

  PanicResult triggerPanicButton(const std::string& source, const std::string& details, uint32_t nowMs);
  bool deactivatePanicButton();

  bool lockdownActive() const { return lockdown_; }
  bool panicActive() const { return panic_; }
  const std::string& lockdownReason() const { return lockdownReason_; }
  const std::string& panicSource() const { return panicSource_; }
  uint32_t lockdownSinceMs() const { return lockdownSinceMs_; }
  const std::vector<ActionRecord>& lockdownActions() const { return lockdownActions_; }
  uint32_t lockdownActivations() const { return lockdownActivations_; }
  uint32_t panicActivations() const { return panicActivations_; }

  // Drops both modes without notifications. Used when the engine stops.
  void reset();

private:
  ActionExecutor* executor_ = nullptr;
  IncidentManager* incidents_ = nullptr;
  EngineObserver* observer_ = nullptr;

  bool lockdown_ = false;
  std::string lockdownReason_;
  uint32_t lockdownSinceMs_ = 0;
  std::vector<ActionRecord> lockdownActions_;
  uint32_t lockdownActivations_ = 0;

  bool panic_ = false;
  std::string panicSource_;
  uint32_t panicActivations_ = 0;
};
