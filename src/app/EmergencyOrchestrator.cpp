#include "app/EmergencyOrchestrator.h"

#include <cstdio>
#include <cstring>

#include "app/MqttConfig.h"

#ifndef FW_CMD_TOKEN
#define FW_CMD_TOKEN ""
#endif

namespace {
constexpr int kRemoteBurst = 4;

bool reached(uint32_t nowMs, uint32_t targetMs) {
  return (int32_t)(nowMs - targetMs) >= 0;
}

String str(const std::string& s) {
  return String(s.c_str());
}

const char* outcomeDetail(Outcome o) {
  switch (o) {
    case Outcome::ok:                 return "ok";
    case Outcome::not_found:          return "not found";
    case Outcome::invalid_transition: return "invalid transition";
    case Outcome::validation_failure: return "validation failure";
    default:                          return "unknown";
  }
}
} // namespace

void EmergencyOrchestrator::begin() {
  logger_.begin(APP_VERBOSE_LOG ? LogLevel::debug : LogLevel::info);

  if (configStore_.begin()) {
    const uint8_t applied = configStore_.load(cfg_);
    if (applied > 0) Serial.printf("[CFG] %u overrides loaded\n", (unsigned)applied);
  }
  engine_.configure(cfg_);
  notify_.begin(cfg_.serial_notify_enabled);

  engine_.attachObserver(this);
  engine_.attachActionSink(this);

  mqttBus_.begin();

  const uint32_t nowMs = millis();
  engine_.begin(nowMs);
  nextHeartbeatMs_ = nowMs + cfg_.status_heartbeat_ms;

  Serial.println("READY");
  Serial.println(CommandParser::helpText());
  if (strlen(FW_CMD_TOKEN) == 0 && !cfg_.allow_remote_without_token) {
    Serial.println("Policy: no FW_CMD_TOKEN set, remote accepts status only.");
  }
  publishStatus("boot");
}

void EmergencyOrchestrator::tick(uint32_t nowMs) {
  mqttBus_.update(nowMs);

  String payload;
  int burst = 0;
  while (burst < kRemoteBurst && mqttBus_.pollCommand(payload)) {
    processRemoteCommand(payload, nowMs);
    ++burst;
  }

  String line;
  if (serialReader_.poll(nowMs, line)) processSerialLine(line, nowMs);

  engine_.tick(nowMs);

  if (reached(nowMs, nextHeartbeatMs_)) {
    nextHeartbeatMs_ = nowMs + cfg_.status_heartbeat_ms;
    publishStatus("heartbeat");
  }
}

void EmergencyOrchestrator::processRemoteCommand(const String& payload, uint32_t nowMs) {
  std::string line;
  const AuthResult auth = CommandParser::authorize(payload.c_str(),
                                                   FW_CMD_TOKEN,
                                                   cfg_.allow_remote_without_token,
                                                   line);
  if (auth != AuthResult::ok) {
    Serial.print("[REMOTE] rejected: ");
    Serial.println(toString(auth));
    mqttBus_.publishAck("auth", false, toString(auth));
    publishStatus("remote_auth_reject");
    return;
  }

  Command cmd;
  std::string error;
  if (!CommandParser::parse(line, cmd, error)) {
    Serial.print("[REMOTE] ");
    Serial.println(error.c_str());
    mqttBus_.publishAck("parse", false, error.c_str());
    return;
  }

  String detail;
  const bool ok = execute(cmd, "REMOTE", nowMs, detail);
  logger_.logCommand("REMOTE", cmd, ok, detail.c_str());
  mqttBus_.publishAck(toString(cmd.kind), ok, detail.c_str());
}

void EmergencyOrchestrator::processSerialLine(const String& line, uint32_t nowMs) {
  if (!cfg_.allow_serial_commands) {
    Serial.println("[SERIAL] commands disabled");
    return;
  }

  Command cmd;
  std::string error;
  if (!CommandParser::parse(line.c_str(), cmd, error)) {
    Serial.print("[SERIAL] ");
    Serial.println(error.c_str());
    Serial.println("[SERIAL] use '?' for help");
    return;
  }

  String detail;
  const bool ok = execute(cmd, "SERIAL", nowMs, detail);
  logger_.logCommand("SERIAL", cmd, ok, detail.c_str());
}

bool EmergencyOrchestrator::execute(const Command& cmd, const char* origin, uint32_t nowMs, String& outDetail) {
  switch (cmd.kind) {
    case CommandKind::status: {
      printStatus();
      publishStatus("command");
      const MqttBus::Stats st = mqttBus_.stats();
      char detail[64];
      snprintf(detail, sizeof(detail), "d:%lu/%lu/%lu o:%lu s:%lu",
               (unsigned long)st.pubDrops,
               (unsigned long)st.cmdDrops,
               (unsigned long)st.storeDrops,
               (unsigned long)st.tickOverruns,
               (unsigned long)st.storeDepth);
      outDetail = detail;
      return true;
    }

    case CommandKind::help:
      Serial.println(CommandParser::helpText());
      outDetail = "ok";
      return true;

    case CommandKind::sensor: {
      const CorrelationBuffer::ReportResult res = engine_.reportSensorEvent(cmd.id, cmd.arg, cmd.text, nowMs);
      if (res.outcome != Outcome::ok) {
        outDetail = "unknown sensor";
        return false;
      }
      outDetail = res.single_sensor_warning ? "buffered, awaiting confirmation" : "buffered";
      return true;
    }

    case CommandKind::trigger: {
      const std::string reason = cmd.text.empty() ? std::string("Manual trigger from ") + origin : cmd.text;
      const IncidentManager::TriggerResult res = engine_.triggerEmergency(cmd.id, reason, std::string(), nowMs);
      if (res.outcome != Outcome::ok) {
        outDetail = "unknown emergency type";
        return false;
      }
      outDetail = str(res.incident_id) + (res.created ? " created" : " updated");
      return true;
    }

    case CommandKind::resolve: {
      const IncidentManager::ResolveResult res =
        engine_.resolveEmergency(cmd.id, cmd.text.empty() ? nullptr : cmd.text.c_str(), nowMs);
      if (res.outcome != Outcome::ok) {
        outDetail = outcomeDetail(res.outcome);
        return false;
      }
      outDetail = str(res.incident.id) + " resolved in " + String(res.incident.response_time_ms / 1000) + "s";
      return true;
    }

    case CommandKind::recovery: {
      const Outcome res = engine_.completeRecoveryStep(cmd.id, cmd.step, nowMs);
      outDetail = outcomeDetail(res);
      return res == Outcome::ok;
    }

    case CommandKind::panic: {
      const std::string source = cmd.text.empty() ? std::string(origin) : cmd.text;
      const SafetyModeController::PanicResult res = engine_.triggerPanicButton(source, std::string(), nowMs);
      if (res.outcome != Outcome::ok) {
        outDetail = outcomeDetail(res.outcome);
        return false;
      }
      outDetail = str(res.incident_id);
      return true;
    }

    case CommandKind::panic_off:
      outDetail = engine_.deactivatePanicButton() ? "cleared" : "not active";
      return true;

    case CommandKind::lockdown_on: {
      const std::string reason = cmd.text.empty() ? std::string("Manual lockdown") : cmd.text;
      outDetail = engine_.activateLockdown(reason, nowMs) ? "activated" : "already active";
      return true;
    }

    case CommandKind::lockdown_off: {
      const std::string reason = cmd.text.empty() ? std::string("Manual release") : cmd.text;
      outDetail = engine_.deactivateLockdown(reason, nowMs) ? "deactivated" : "not active";
      return true;
    }

    case CommandKind::power_fail: {
      std::string incidentId;
      const Outcome res = engine_.handlePowerFailure(nowMs, &incidentId);
      if (res != Outcome::ok) {
        outDetail = outcomeDetail(res);
        return false;
      }
      outDetail = str(incidentId);
      return true;
    }

    case CommandKind::power_restored: {
      const Outcome res = engine_.handlePowerRestored(nowMs);
      outDetail = res == Outcome::invalid_transition ? "mains was not lost" : outcomeDetail(res);
      return res == Outcome::ok;
    }

    case CommandKind::wellbeing: {
      const Outcome res = engine_.respondToWellbeingCheck(cmd.id, cmd.text, nowMs);
      outDetail = outcomeDetail(res);
      return res == Outcome::ok;
    }

    case CommandKind::route_set: {
      const Outcome res = engine_.setEvacuationRouteClearance(cmd.id, cmd.cleared);
      outDetail = outcomeDetail(res);
      return res == Outcome::ok;
    }

    case CommandKind::route_best: {
      EvacuationRoute route;
      const Outcome res = engine_.recommendEvacuationRoute(cmd.id, route);
      if (res != Outcome::ok) {
        outDetail = res == Outcome::invalid_transition ? "route blocked" : "no cleared route";
        return false;
      }
      outDetail = str(route.name) + " -> " + str(route.assembly_point) + " (" + String(route.estimated_s) + "s)";
      Serial.print("[EVAC] ");
      Serial.println(outDetail);
      return true;
    }

    case CommandKind::config_set: {
      const Outcome res = configStore_.set(cmd.id.c_str(), cmd.value, cfg_);
      if (res != Outcome::ok) {
        outDetail = "bad key or value";
        return false;
      }
      engine_.configure(cfg_);
      notify_.setSerialEnabled(cfg_.serial_notify_enabled);
      outDetail = configStore_.ready() ? "saved" : "applied, not persisted";
      return true;
    }

    default:
      outDetail = "unsupported command";
      return false;
  }
}

StatusSnapshot EmergencyOrchestrator::snapshot() const {
  EngineStatistics stats;
  engine_.getStatistics(stats);

  StatusSnapshot st;
  st.incidents_active = (uint16_t)stats.incidents_active;
  st.incidents_total = (uint16_t)stats.incidents_total;
  st.wellbeing_pending = stats.wellbeing_pending;
  st.sensors_online = stats.sensors_online;
  st.lights_active = stats.lights_active;
  st.routes_cleared = stats.routes_cleared;
  st.lockdown = stats.lockdown_active;
  st.panic = stats.panic_active;
  st.mains_lost = stats.mains_lost;
  st.power_optimal = engine_.power().optimal();
  st.generator_starts = stats.generator_starts;
  st.actions_failed = stats.actions_failed;
  return st;
}

void EmergencyOrchestrator::publishStatus(const char* reason) {
  mqttBus_.publishStatus(snapshot(), reason);
}

void EmergencyOrchestrator::printStatus() const {
  EngineStatistics stats;
  engine_.getStatistics(stats);

  Serial.printf("[STATUS] incidents active=%lu total=%lu resolved=%lu avg_response=%lus\n",
                (unsigned long)stats.incidents_active,
                (unsigned long)stats.incidents_total,
                (unsigned long)stats.incidents_resolved,
                (unsigned long)(stats.avg_response_ms / 1000));
  Serial.printf("[STATUS] lockdown=%u panic=%u lights=%u/%u power=%s gen_starts=%lu\n",
                stats.lockdown_active ? 1u : 0u,
                stats.panic_active ? 1u : 0u,
                (unsigned)stats.lights_active,
                (unsigned)stats.lights_total,
                stats.power_status,
                (unsigned long)stats.generator_starts);
  Serial.printf("[STATUS] sensors=%u/%u battery=%u%% buffered=%lu warnings=%lu wellbeing=%u pending\n",
                (unsigned)stats.sensors_online,
                (unsigned)stats.sensors_total,
                (unsigned)stats.avg_sensor_battery,
                (unsigned long)stats.buffered_events,
                (unsigned long)stats.sensor_warnings,
                (unsigned)stats.wellbeing_pending);

  std::vector<Incident> active;
  engine_.getActiveEmergencies(active);
  for (const Incident& i : active) {
    Serial.printf("[STATUS]   %s %s sev=%u %s\n",
                  i.id.c_str(), i.type_id.c_str(), (unsigned)i.severity, i.reason.c_str());
  }
}

void EmergencyOrchestrator::onSensorWarning(const SensorEvent& e) {
  Serial.printf("[SENSOR] %s (%s) %s at %s, awaiting confirmation\n",
                e.sensor_id.c_str(), toString(e.sensor_type), e.event_type.c_str(), e.location.c_str());
  notify_.send("Sensor warning: " + str(e.location) + " " + toString(e.sensor_type));
}

void EmergencyOrchestrator::onIncidentCreated(const Incident& incident) {
  Serial.printf("[INCIDENT] created %s %s sev=%u: %s\n",
                incident.id.c_str(), incident.type_id.c_str(),
                (unsigned)incident.severity, incident.reason.c_str());
  mqttBus_.publishIncident("created", incident, incident.reason);
  for (const AlertRecord& a : incident.alerts_sent) {
    mqttBus_.publishAlert(incident, a);
  }
  notify_.alert(incident.severity, str(incident.label) + ": " + str(incident.reason));
  publishStatus("incident_created");
}

void EmergencyOrchestrator::onIncidentUpdated(const Incident& incident, const IncidentUpdate& update) {
  Serial.printf("[INCIDENT] update %s (%u updates): %s\n",
                incident.id.c_str(), (unsigned)incident.updates.size(), update.reason.c_str());
  mqttBus_.publishIncident("updated", incident, update.reason);
}

void EmergencyOrchestrator::onIncidentResolved(const Incident& incident, const RecoveryPlan* plan) {
  Serial.printf("[INCIDENT] resolved %s after %lus: %s\n",
                incident.id.c_str(),
                (unsigned long)(incident.response_time_ms / 1000),
                incident.resolution.c_str());
  mqttBus_.publishIncident("resolved", incident, incident.resolution);
  if (plan) {
    for (const RecoveryStep& s : plan->steps) {
      Serial.printf("[RECOVERY] %s step %u: %s\n", plan->incident_id.c_str(), (unsigned)s.step, s.description.c_str());
    }
  }
  notify_.send(str(incident.label) + " resolved: " + str(incident.resolution));
  publishStatus("incident_resolved");
}

void EmergencyOrchestrator::onRecoveryStepCompleted(const RecoveryPlan& plan, const RecoveryStep& step) {
  Serial.printf("[RECOVERY] %s step %u done%s\n",
                plan.incident_id.c_str(), (unsigned)step.step, plan.complete ? ", plan complete" : "");
  const Incident* incident = engine_.incidents().find(plan.incident_id);
  if (incident) mqttBus_.publishIncident(plan.complete ? "recovered" : "recovery_step", *incident, step.description);
}

void EmergencyOrchestrator::onLockdownChanged(bool active, const std::string& reason) {
  Serial.printf("[SAFETY] lockdown %s: %s\n", active ? "on" : "off", reason.c_str());
  notify_.alert(active ? 4 : 2, String("Lockdown ") + (active ? "activated: " : "lifted: ") + str(reason));
  publishStatus(active ? "lockdown_on" : "lockdown_off");
}

void EmergencyOrchestrator::onPanicChanged(bool active, const std::string& source) {
  Serial.printf("[SAFETY] panic %s (%s)\n", active ? "on" : "off", source.c_str());
  if (active) notify_.alert(5, "Panic button pressed at " + str(source));
  publishStatus(active ? "panic_on" : "panic_off");
}

void EmergencyOrchestrator::onLightingChanged(bool on, uint8_t activeCount) {
  Serial.printf("[LIGHTS] emergency lighting %s, %u active\n", on ? "on" : "off", (unsigned)activeCount);
}

void EmergencyOrchestrator::onGeneratorStarted(const PowerBackupUnit& generator) {
  Serial.printf("[POWER] generator started, fuel %.1f%%\n", generator.level);
  notify_.send("Backup generator running");
  publishStatus("generator_started");
}

void EmergencyOrchestrator::onPowerAlert(PowerAlert alert, const PowerBackupUnit& unit) {
  Serial.printf("[POWER] %s: %s at %.1f%%\n", toString(alert), unit.name.c_str(), unit.level);
  notify_.alert(alert == PowerAlert::ups_critical ? 4 : 3, String(toString(alert)) + " " + str(unit.name));
  publishStatus(toString(alert));
}

void EmergencyOrchestrator::onWellbeingScheduled(const WellbeingCheck& check) {
  Serial.printf("[WELLBEING] %s scheduled for %s after %s\n",
                check.id.c_str(), check.person.c_str(), check.incident_id.c_str());
}

void EmergencyOrchestrator::onWellbeingOverdue(const WellbeingCheck& check) {
  Serial.printf("[WELLBEING] %s overdue, no response from %s\n", check.id.c_str(), check.person.c_str());
  notify_.alert(4, "Wellbeing check overdue: " + str(check.id));
  publishStatus("wellbeing_overdue");
}

bool EmergencyOrchestrator::perform(ActionKind kind, const std::string& description, const std::string& incidentId) {
#if APP_VERBOSE_LOG
  Serial.printf("[ACTION] %s %s: %s\n", incidentId.c_str(), toString(kind), description.c_str());
#endif
  mqttBus_.publishAction(incidentId, kind, description, true);
  return true;
}
