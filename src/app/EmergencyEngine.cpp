#include "app/EmergencyEngine.h"

#include "app/Log.h"

namespace {
constexpr const char* TAG = "ENGINE";

bool reached(uint32_t nowMs, uint32_t targetMs) {
  return (int32_t)(nowMs - targetMs) >= 0;
}
} // namespace

EmergencyEngine::EmergencyEngine(const Config& cfg)
: cfg_(cfg) {
  registry_.loadDefaults();
  catalog_.loadDefaults();

  std::vector<CorrelationRule> rules;
  CorrelationRules::loadDefaults(rules);
  correlation_.setRules(rules);
  correlation_.attachRegistry(&registry_);

  lighting_.loadDefaults();
  executor_.attachLighting(&lighting_);

  contacts_.loadDefaults();
  dispatcher_.loadDefaults();
  dispatcher_.attachContacts(&contacts_);

  safety_.attachExecutor(&executor_);
  safety_.attachIncidents(&incidents_);

  incidents_.attachCatalog(&catalog_);
  incidents_.attachExecutor(&executor_);
  incidents_.attachDispatcher(&dispatcher_);
  incidents_.attachSafety(&safety_);
  incidents_.attachWellbeing(&wellbeing_);

  power_.loadDefaults();
  power_.attachIncidents(&incidents_);
  power_.attachExecutor(&executor_);

  routes_.loadDefaults();

  configure(cfg_);
}

void EmergencyEngine::configure(const Config& cfg) {
  cfg_ = cfg;
  correlation_.setWindow(cfg_.correlation_window_ms);
  lighting_.setMinBattery(cfg_.min_light_battery);
  dispatcher_.setContactThreshold(cfg_.contact_severity_threshold);
  wellbeing_.setOverdueAfter(cfg_.wellbeing_overdue_ms);
  power_.configure(cfg_);
}

void EmergencyEngine::attachObserver(EngineObserver* observer) {
  observer_ = observer;
  executor_.attachObserver(observer);
  wellbeing_.attachObserver(observer);
  safety_.attachObserver(observer);
  incidents_.attachObserver(observer);
  power_.attachObserver(observer);
}

void EmergencyEngine::begin(uint32_t nowMs) {
  running_ = true;
  nextCorrelationMs_ = nowMs + cfg_.correlation_tick_ms;
  nextPowerPollMs_ = nowMs + cfg_.power_poll_ms;
  nextWellbeingPollMs_ = nowMs + cfg_.wellbeing_poll_ms;
  LOG_INFO(TAG, "started: %u sensors, %u types, %u rules, window %lu ms",
           (unsigned)registry_.sensors().size(),
           (unsigned)catalog_.types().size(),
           (unsigned)correlation_.rules().size(),
           (unsigned long)cfg_.correlation_window_ms);
}

void EmergencyEngine::tick(uint32_t nowMs) {
  if (!running_) return;

  power_.update(nowMs);

  if (reached(nowMs, nextCorrelationMs_)) {
    nextCorrelationMs_ = nowMs + cfg_.correlation_tick_ms;
    runCorrelation(nowMs);
  }
  if (reached(nowMs, nextPowerPollMs_)) {
    nextPowerPollMs_ = nowMs + cfg_.power_poll_ms;
    power_.poll(nowMs);
  }
  if (reached(nowMs, nextWellbeingPollMs_)) {
    nextWellbeingPollMs_ = nowMs + cfg_.wellbeing_poll_ms;
    wellbeing_.poll(nowMs);
  }
}

void EmergencyEngine::stop() {
  running_ = false;
  incidents_.clearActive();
  correlation_.clear();
  safety_.reset();
  lighting_.deactivate();
  power_.cancelTimers();
  LOG_INFO(TAG, "stopped");
}

void EmergencyEngine::runCorrelation(uint32_t nowMs) {
  std::vector<CorrelationMatch> matches;
  correlation_.tick(nowMs, matches);
  for (const CorrelationMatch& m : matches) {
    incidents_.trigger(m.emergency_type, m.reason, m.details, nowMs);
  }
}

CorrelationBuffer::ReportResult EmergencyEngine::reportSensorEvent(const std::string& sensorId,
                                                                   const std::string& eventType,
                                                                   const std::string& payload,
                                                                   uint32_t nowMs) {
  CorrelationBuffer::ReportResult res = correlation_.report(sensorId, eventType, payload, nowMs);
  if (res.outcome == Outcome::ok && res.single_sensor_warning && observer_) {
    observer_->onSensorWarning(res.event);
  }
  return res;
}

IncidentManager::TriggerResult EmergencyEngine::triggerEmergency(const std::string& typeId,
                                                                 const std::string& reason,
                                                                 const std::string& details,
                                                                 uint32_t nowMs) {
  return incidents_.trigger(typeId, reason, details, nowMs);
}

SafetyModeController::PanicResult EmergencyEngine::triggerPanicButton(const std::string& source,
                                                                      const std::string& details,
                                                                      uint32_t nowMs) {
  return safety_.triggerPanicButton(source, details, nowMs);
}

Outcome EmergencyEngine::handlePowerFailure(uint32_t nowMs, std::string* outIncidentId) {
  return power_.handlePowerFailure(nowMs, outIncidentId);
}

IncidentManager::ResolveResult EmergencyEngine::resolveEmergency(const std::string& incidentId,
                                                                 const char* resolution,
                                                                 uint32_t nowMs) {
  return incidents_.resolve(incidentId, resolution, nowMs);
}

Outcome EmergencyEngine::completeRecoveryStep(const std::string& incidentId, uint16_t step, uint32_t nowMs) {
  return incidents_.completeRecoveryStep(incidentId, step, nowMs);
}

Outcome EmergencyEngine::respondToWellbeingCheck(const std::string& checkId,
                                                 const std::string& response,
                                                 uint32_t nowMs) {
  return wellbeing_.respond(checkId, response, nowMs);
}

Outcome EmergencyEngine::setEvacuationRouteClearance(const std::string& routeId, bool cleared) {
  return routes_.setClearance(routeId, cleared);
}

Outcome EmergencyEngine::recommendEvacuationRoute(const std::string& preferredId, EvacuationRoute& out) const {
  return routes_.recommend(preferredId, out);
}

void EmergencyEngine::getStatistics(EngineStatistics& out) const {
  out = EngineStatistics{};

  const std::vector<Incident>& log = incidents_.log();
  uint64_t responseSum = 0;
  for (const Incident& i : log) {
    if (i.status == IncidentStatus::resolved) {
      ++out.incidents_resolved;
      responseSum += i.response_time_ms;
    }
    if (i.panic_button) ++out.panic_incidents;
    out.alerts_sent += (uint32_t)i.alerts_sent.size();
  }
  out.incidents_total = (uint32_t)log.size();
  out.incidents_active = (uint32_t)incidents_.activeCount();
  if (out.incidents_resolved > 0) {
    out.avg_response_ms = (uint32_t)(responseSum / out.incidents_resolved);
  }
  out.deduplicated_triggers = incidents_.stats().deduplicated;

  const CorrelationBuffer::Stats& cs = correlation_.stats();
  out.sensor_events = cs.accepted;
  out.sensor_events_rejected = cs.rejected;
  out.sensor_warnings = cs.warnings;
  out.correlation_matches = cs.matched;
  out.buffered_events = (uint32_t)correlation_.events().size();
  out.sensors_total = (uint16_t)registry_.sensors().size();
  out.sensors_online = registry_.onlineCount();
  out.avg_sensor_battery = registry_.averageBattery();

  out.actions_executed = executor_.stats().executed;
  out.actions_failed = executor_.stats().failed;

  out.lockdown_active = safety_.lockdownActive();
  out.panic_active = safety_.panicActive();
  out.lockdown_activations = safety_.lockdownActivations();

  out.lights_total = (uint8_t)lighting_.lights().size();
  out.lights_active = lighting_.activeCount();
  out.lights_usable = lighting_.usableCount();

  out.power_status = power_.overallStatus();
  out.mains_lost = power_.mainsLost();
  out.power_failures = power_.failures();
  out.generator_starts = power_.generatorStarts();

  out.wellbeing_pending = (uint16_t)wellbeing_.pending().size();
  out.wellbeing_completed = (uint16_t)wellbeing_.completed().size();
  out.wellbeing_escalations = wellbeing_.escalations();

  for (const RecoveryPlan& p : incidents_.recoveryPlans()) {
    ++out.recovery_plans;
    if (p.complete) ++out.recovery_plans_complete;
  }

  out.contacts = (uint16_t)contacts_.contacts().size();
  out.routes_total = (uint8_t)routes_.routes().size();
  out.routes_cleared = routes_.clearedCount();
}
