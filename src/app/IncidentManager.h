#pragma once

#include <stdint.h>

#include <string>
#include <vector>

#include "app/ActionExecutor.h"
#include "app/AlertDispatcher.h"
#include "app/EmergencyCatalog.h"
#include "app/EngineObserver.h"
#include "app/Incident.h"
#include "app/Outcome.h"

class SafetyModeController;
class WellbeingScheduler;

// Owns the append-only incident log. The active set indexes into it and
// holds at most one incident per emergency type.
class IncidentManager {
public:
  struct TriggerTags {
    bool panic_button = false;
    std::string source;
  };

  struct TriggerResult {
    Outcome outcome = Outcome::ok;
    bool created = false;
    std::string incident_id;
  };

  struct ResolveResult {
    Outcome outcome = Outcome::ok;
    Incident incident;
    bool has_recovery = false;
    RecoveryPlan recovery;
  };

  struct Stats {
    uint32_t created = 0;
    uint32_t deduplicated = 0;
    uint32_t resolved = 0;
    uint32_t rejected = 0;
    uint32_t lockdown_lifts = 0;
  };

  void attachCatalog(const EmergencyCatalog* catalog) { catalog_ = catalog; }
  void attachExecutor(ActionExecutor* executor) { executor_ = executor; }
  void attachDispatcher(const AlertDispatcher* dispatcher) { dispatcher_ = dispatcher; }
  void attachSafety(SafetyModeController* safety) { safety_ = safety; }
  void attachWellbeing(WellbeingScheduler* wellbeing) { wellbeing_ = wellbeing; }
  void attachObserver(EngineObserver* observer) { observer_ = observer; }

  TriggerResult trigger(const std::string& typeId,
                        const std::string& reason,
                        const std::string& details,
                        uint32_t nowMs,
                        const TriggerTags* tags = nullptr);

  // resolution == nullptr records "Manually resolved".
  ResolveResult resolve(const std::string& incidentId, const char* resolution, uint32_t nowMs);

  Outcome completeRecoveryStep(const std::string& incidentId, uint16_t step, uint32_t nowMs);

  const Incident* find(const std::string& incidentId) const;
  const Incident* findActiveByType(const std::string& typeId) const;
  const RecoveryPlan* recoveryPlan(const std::string& incidentId) const;

  void activeIncidents(std::vector<Incident>& out) const;
  // Newest first. limit == 0 returns the whole log.
  void history(size_t limit, std::vector<Incident>& out) const;

  size_t activeCount() const { return active_.size(); }
  const std::vector<Incident>& log() const { return log_; }
  const std::vector<RecoveryPlan>& recoveryPlans() const { return plans_; }
  const Stats& stats() const { return stats_; }

  // Empties the active set. Log entries are left untouched.
  void clearActive() { active_.clear(); }

private:
  Incident* findMutable(const std::string& incidentId);
  void runProtocol(Incident& incident, const EmergencyType& type, uint32_t nowMs);
  bool buildRecoveryPlan(const Incident& incident, const EmergencyType& type, uint32_t nowMs);

  const EmergencyCatalog* catalog_ = nullptr;
  ActionExecutor* executor_ = nullptr;
  const AlertDispatcher* dispatcher_ = nullptr;
  SafetyModeController* safety_ = nullptr;
  WellbeingScheduler* wellbeing_ = nullptr;
  EngineObserver* observer_ = nullptr;

  std::vector<Incident> log_;
  std::vector<size_t> active_;
  std::vector<RecoveryPlan> plans_;
  uint32_t nextSeq_ = 1;
  Stats stats_;
};
