#pragma once

#include <stdint.h>

#include <string>
#include <vector>

#include "app/ActionExecutor.h"
#include "app/AlertDispatcher.h"
#include "app/Config.h"
#include "app/ContactBook.h"
#include "app/CorrelationBuffer.h"
#include "app/EmergencyCatalog.h"
#include "app/EmergencyLighting.h"
#include "app/EngineObserver.h"
#include "app/EvacuationRoutes.h"
#include "app/IncidentManager.h"
#include "app/PowerBackupSupervisor.h"
#include "app/SafetyModeController.h"
#include "app/SensorRegistry.h"
#include "app/WellbeingScheduler.h"

struct EngineStatistics {
  uint32_t incidents_total = 0;
  uint32_t incidents_active = 0;
  uint32_t incidents_resolved = 0;
  uint32_t avg_response_ms = 0;
  uint32_t deduplicated_triggers = 0;
  uint32_t panic_incidents = 0;

  uint32_t sensor_events = 0;
  uint32_t sensor_events_rejected = 0;
  uint32_t sensor_warnings = 0;
  uint32_t correlation_matches = 0;
  uint32_t buffered_events = 0;
  uint16_t sensors_total = 0;
  uint16_t sensors_online = 0;
  uint8_t avg_sensor_battery = 0;

  uint32_t actions_executed = 0;
  uint32_t actions_failed = 0;
  uint32_t alerts_sent = 0;

  bool lockdown_active = false;
  bool panic_active = false;
  uint32_t lockdown_activations = 0;

  uint8_t lights_total = 0;
  uint8_t lights_active = 0;
  uint8_t lights_usable = 0;

  const char* power_status = "optimal";
  bool mains_lost = false;
  uint32_t power_failures = 0;
  uint32_t generator_starts = 0;

  uint16_t wellbeing_pending = 0;
  uint16_t wellbeing_completed = 0;
  uint32_t wellbeing_escalations = 0;

  uint32_t recovery_plans = 0;
  uint32_t recovery_plans_complete = 0;

  uint16_t contacts = 0;
  uint8_t routes_total = 0;
  uint8_t routes_cleared = 0;
};

// Single owner of all engine state. Callers must serialize every call;
// each one runs to completion before the next.
class EmergencyEngine {
public:
  explicit EmergencyEngine(const Config& cfg = Config());
  EmergencyEngine(const EmergencyEngine&) = delete;
  EmergencyEngine& operator=(const EmergencyEngine&) = delete;

  // Re-applies tunables to every component. Safe before begin().
  void configure(const Config& cfg);

  void attachObserver(EngineObserver* observer);
  void attachActionSink(ActionSink* sink) { executor_.attachSink(sink); }

  void begin(uint32_t nowMs);
  void tick(uint32_t nowMs);
  // Clears timers and transient state. The incident log, registries and
  // counters survive.
  void stop();
  bool running() const { return running_; }

  CorrelationBuffer::ReportResult reportSensorEvent(const std::string& sensorId,
                                                    const std::string& eventType,
                                                    const std::string& payload,
                                                    uint32_t nowMs);
  IncidentManager::TriggerResult triggerEmergency(const std::string& typeId,
                                                  const std::string& reason,
                                                  const std::string& details,
                                                  uint32_t nowMs);
  SafetyModeController::PanicResult triggerPanicButton(const std::string& source,
                                                       const std::string& details,
                                                       uint32_t nowMs);
  bool deactivatePanicButton() { return safety_.deactivatePanicButton(); }
  bool activateLockdown(const std::string& reason, uint32_t nowMs) { return safety_.activateLockdown(reason, nowMs); }
  bool deactivateLockdown(const std::string& reason, uint32_t nowMs) { return safety_.deactivateLockdown(reason, nowMs); }
  Outcome handlePowerFailure(uint32_t nowMs, std::string* outIncidentId = nullptr);
  Outcome handlePowerRestored(uint32_t nowMs) { return power_.handlePowerRestored(nowMs); }
  IncidentManager::ResolveResult resolveEmergency(const std::string& incidentId,
                                                  const char* resolution,
                                                  uint32_t nowMs);
  Outcome completeRecoveryStep(const std::string& incidentId, uint16_t step, uint32_t nowMs);
  Outcome respondToWellbeingCheck(const std::string& checkId, const std::string& response, uint32_t nowMs);
  Outcome setEvacuationRouteClearance(const std::string& routeId, bool cleared);
  Outcome recommendEvacuationRoute(const std::string& preferredId, EvacuationRoute& out) const;
  Outcome addContact(const EmergencyContact& contact, std::string& outId) { return contacts_.add(contact, outId); }
  Outcome removeContact(const std::string& contactId) { return contacts_.remove(contactId); }

  void getActiveEmergencies(std::vector<Incident>& out) const { incidents_.activeIncidents(out); }
  void getIncidentHistory(size_t limit, std::vector<Incident>& out) const { incidents_.history(limit, out); }
  void getSensorStatus(std::vector<SensorTypeSummary>& out) const { registry_.summarize(out); }
  void getPowerBackupStatus(PowerBackupStatus& out) const { power_.snapshot(out); }
  void getLightingStatus(std::vector<EmergencyLight>& out) const { out = lighting_.lights(); }
  void getPendingWellbeingChecks(std::vector<WellbeingCheck>& out) const { out = wellbeing_.pending(); }
  void getCompletedWellbeingChecks(std::vector<WellbeingCheck>& out) const { out = wellbeing_.completed(); }
  void getStatistics(EngineStatistics& out) const;

  const Config& config() const { return cfg_; }
  const SensorRegistry& sensors() const { return registry_; }
  const EmergencyCatalog& catalog() const { return catalog_; }
  const CorrelationBuffer& correlation() const { return correlation_; }
  const IncidentManager& incidents() const { return incidents_; }
  const AlertDispatcher& alerts() const { return dispatcher_; }
  const SafetyModeController& safety() const { return safety_; }
  const EmergencyLighting& lighting() const { return lighting_; }
  const PowerBackupSupervisor& power() const { return power_; }
  const WellbeingScheduler& wellbeing() const { return wellbeing_; }
  const ContactBook& contacts() const { return contacts_; }
  const EvacuationRoutes& routes() const { return routes_; }

  PowerBackupSupervisor& power() { return power_; }
  EmergencyLighting& lighting() { return lighting_; }
  AlertDispatcher& alerts() { return dispatcher_; }

private:
  void runCorrelation(uint32_t nowMs);

  Config cfg_;
  EngineObserver* observer_ = nullptr;

  SensorRegistry registry_;
  EmergencyCatalog catalog_;
  CorrelationBuffer correlation_;
  EmergencyLighting lighting_;
  ActionExecutor executor_;
  ContactBook contacts_;
  AlertDispatcher dispatcher_;
  WellbeingScheduler wellbeing_;
  SafetyModeController safety_;
  IncidentManager incidents_;
  PowerBackupSupervisor power_;
  EvacuationRoutes routes_;

  bool running_ = false;
  uint32_t nextCorrelationMs_ = 0;
  uint32_t nextPowerPollMs_ = 0;
  uint32_t nextWellbeingPollMs_ = 0;
};
