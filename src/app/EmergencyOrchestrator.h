#pragma once

#include <Arduino.h>

#include <string>

#include "app/CommandParser.h"
#include "app/Config.h"
#include "app/EmergencyEngine.h"
#include "pipelines/SerialLineReader.h"
#include "services/ConfigStore.h"
#include "services/Logger.h"
#include "services/MqttBus.h"
#include "services/Notify.h"

// Device shell around the engine: feeds it Serial and MQTT commands from
// loop(), and turns its notifications and actions into Serial lines and
// MQTT publications.
class EmergencyOrchestrator : public EngineObserver, public ActionSink {
public:
  void begin();
  void tick(uint32_t nowMs);

  void onSensorWarning(const SensorEvent& e) override;
  void onIncidentCreated(const Incident& incident) override;
  void onIncidentUpdated(const Incident& incident, const IncidentUpdate& update) override;
  void onIncidentResolved(const Incident& incident, const RecoveryPlan* plan) override;
  void onRecoveryStepCompleted(const RecoveryPlan& plan, const RecoveryStep& step) override;
  void onLockdownChanged(bool active, const std::string& reason) override;
  void onPanicChanged(bool active, const std::string& source) override;
  void onLightingChanged(bool on, uint8_t activeCount) override;
  void onGeneratorStarted(const PowerBackupUnit& generator) override;
  void onPowerAlert(PowerAlert alert, const PowerBackupUnit& unit) override;
  void onWellbeingScheduled(const WellbeingCheck& check) override;
  void onWellbeingOverdue(const WellbeingCheck& check) override;

  bool perform(ActionKind kind, const std::string& description, const std::string& incidentId) override;

private:
  void processRemoteCommand(const String& payload, uint32_t nowMs);
  void processSerialLine(const String& line, uint32_t nowMs);
  bool execute(const Command& cmd, const char* origin, uint32_t nowMs, String& outDetail);

  StatusSnapshot snapshot() const;
  void publishStatus(const char* reason);
  void printStatus() const;

  Config cfg_;
  EmergencyEngine engine_;
  MqttBus mqttBus_;
  Logger logger_;
  Notify notify_;
  ConfigStore configStore_;
  SerialLineReader serialReader_;

  uint32_t nextHeartbeatMs_ = 0;
};
