#pragma once

#include <Arduino.h>

#include <string>

#include "app/EmergencyCatalog.h"
#include "app/Incident.h"
#include "services/MqttMessages.h"

// Loop-side publisher. On ESP32 messages go through the RTOS queue to the
// network task; elsewhere they are published inline.
class MqttBus {
public:
  struct Stats {
    uint32_t pubDrops = 0;
    uint32_t cmdDrops = 0;
    uint32_t storeDrops = 0;
    uint32_t tickOverruns = 0;
    uint32_t storeDepth = 0;
    uint32_t cmdQueueDepth = 0;
    uint32_t pubQueueDepth = 0;
  };

  void begin();
  void update(uint32_t nowMs);

  void publishIncident(const char* event, const Incident& incident, const std::string& reason);
  void publishAlert(const Incident& incident, const AlertRecord& alert);
  void publishAction(const std::string& incidentId, ActionKind kind, const std::string& description, bool ok);
  void publishStatus(const StatusSnapshot& st, const char* reason);
  void publishAck(const char* cmd, bool ok, const char* detail);

  bool pollCommand(String& outPayload);

  Stats stats() const;

private:
  void send(const PublishMsg& msg);

  bool rtos_ = false;
};
