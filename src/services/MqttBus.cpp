#include "MqttBus.h"

#include <cstring>

#include "rtos/Queues.h"
#include "rtos/Tasks.h"
#include "services/MqttClient.h"

namespace {
MqttClient gClient;

void copyText(char* dst, size_t dstLen, const char* src) {
  if (!dst || dstLen == 0) return;
  dst[0] = '\0';
  if (!src) return;
  std::strncpy(dst, src, dstLen - 1);
  dst[dstLen - 1] = '\0';
}
} // namespace

void MqttBus::begin() {
  RtosTasks::attachMqtt(&gClient);
  rtos_ = RtosTasks::startIfReady();
  if (!rtos_) gClient.begin();
}

void MqttBus::update(uint32_t nowMs) {
  if (!rtos_) gClient.update(nowMs);
}

void MqttBus::send(const PublishMsg& msg) {
  if (rtos_) {
    RtosTasks::enqueuePublish(msg);
    return;
  }
  gClient.publish(msg);
}

void MqttBus::publishIncident(const char* event, const Incident& incident, const std::string& reason) {
  PublishMsg msg{};
  msg.kind = PublishKind::incident;
  msg.severity = incident.severity;
  msg.ts_ms = incident.triggered_at_ms;
  copyText(msg.state, sizeof(msg.state), event);
  copyText(msg.id, sizeof(msg.id), incident.id.c_str());
  copyText(msg.name, sizeof(msg.name), incident.type_id.c_str());
  copyText(msg.text, sizeof(msg.text), reason.c_str());
  send(msg);
}

void MqttBus::publishAlert(const Incident& incident, const AlertRecord& alert) {
  PublishMsg msg{};
  msg.kind = PublishKind::alert;
  msg.number = alert.escalation_level;
  msg.ts_ms = alert.sent_at_ms;
  copyText(msg.id, sizeof(msg.id), incident.id.c_str());
  copyText(msg.name, sizeof(msg.name), alert.channel_id.c_str());
  copyText(msg.text, sizeof(msg.text), alert.message.c_str());
  send(msg);
}

void MqttBus::publishAction(const std::string& incidentId, ActionKind kind, const std::string& description, bool ok) {
  PublishMsg msg{};
  msg.kind = PublishKind::action;
  msg.ok = ok;
  copyText(msg.id, sizeof(msg.id), incidentId.c_str());
  copyText(msg.name, sizeof(msg.name), toString(kind));
  copyText(msg.text, sizeof(msg.text), description.c_str());
  send(msg);
}

void MqttBus::publishStatus(const StatusSnapshot& st, const char* reason) {
  PublishMsg msg{};
  msg.kind = PublishKind::status;
  msg.st = st;
  copyText(msg.text, sizeof(msg.text), reason);
  send(msg);
}

void MqttBus::publishAck(const char* cmd, bool ok, const char* detail) {
  PublishMsg msg{};
  msg.kind = PublishKind::ack;
  msg.ok = ok;
  copyText(msg.name, sizeof(msg.name), cmd);
  copyText(msg.text, sizeof(msg.text), detail);
  send(msg);
}

bool MqttBus::pollCommand(String& outPayload) {
  outPayload = "";
  CmdMsg msg{};
  if (!RtosTasks::dequeueCommand(msg)) return false;
  outPayload = String(msg.payload);
  return true;
}

MqttBus::Stats MqttBus::stats() const {
  MqttBus::Stats out{};
  const auto s = RtosTasks::stats();
  out.pubDrops = s.pubDrops;
  out.cmdDrops = s.cmdDrops;
  out.storeDrops = s.storeDrops;
  out.tickOverruns = s.tickOverruns;
  out.storeDepth = s.storeDepth;
#if defined(ARDUINO_ARCH_ESP32)
  out.pubQueueDepth = RtosQueues::mqttPubQ ? (uint32_t)uxQueueMessagesWaiting(RtosQueues::mqttPubQ) : 0;
  out.cmdQueueDepth = RtosQueues::mqttCmdQ ? (uint32_t)uxQueueMessagesWaiting(RtosQueues::mqttCmdQ) : 0;
#endif
  return out;
}
