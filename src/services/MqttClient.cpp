#include "MqttClient.h"

#include <cstring>

#include "app/MqttConfig.h"

MqttClient* MqttClient::self_ = nullptr;

namespace {
bool reached(uint32_t nowMs, uint32_t targetMs) {
  return (int32_t)(nowMs - targetMs) >= 0;
}

void appendJsonString(String& out, const char* s) {
  out += '"';
  if (s) {
    for (const char* p = s; *p; ++p) {
      const char c = *p;
      if (c == '"' || c == '\\') {
        out += '\\';
        out += c;
      } else if (c == '\n' || c == '\r' || c == '\t') {
        out += ' ';
      } else {
        out += c;
      }
    }
  }
  out += '"';
}
} // namespace

MqttClient::MqttClient()
: mqtt_(wifiClient_) {}

void MqttClient::begin(CommandCallback cb) {
  cmdCb_ = cb;
  self_ = this;

  WiFi.mode(WIFI_STA);
  WiFi.setAutoReconnect(true);
  mqtt_.setServer(MQTT_BROKER, MQTT_PORT);
  mqtt_.setKeepAlive(MQTT_KEEPALIVE_S);
  mqtt_.setSocketTimeout(MQTT_SOCKET_TIMEOUT_S);
  mqtt_.setBufferSize(MQTT_BUFFER_SIZE);
  mqtt_.setCallback(onMqttMessage);
}

void MqttClient::connectWifi(uint32_t nowMs) {
  if (WiFi.status() == WL_CONNECTED) return;
  if (!reached(nowMs, nextWifiRetryMs_)) return;

  nextWifiRetryMs_ = nowMs + WIFI_RECONNECT_MS;

  if (strlen(WIFI_SSID) == 0) {
    return;
  }

#if APP_VERBOSE_LOG
  Serial.print("[MQTT] WiFi connecting to ");
  Serial.println(WIFI_SSID);
#endif
  WiFi.begin(WIFI_SSID, WIFI_PASSWORD);
}

void MqttClient::connectMqtt(uint32_t nowMs) {
  if (WiFi.status() != WL_CONNECTED) return;
  if (mqtt_.connected()) return;
  if (!reached(nowMs, nextMqttRetryMs_)) return;

  nextMqttRetryMs_ = nowMs + MQTT_RECONNECT_MS;

  const bool hasAuth = strlen(MQTT_USERNAME) > 0;
  bool connected = false;

  if (hasAuth) {
    connected = mqtt_.connect(
      MQTT_CLIENT_ID,
      MQTT_USERNAME,
      MQTT_PASSWORD,
      MQTT_TOPIC_STATUS,
      1,
      true,
      "{\"reason\":\"offline\"}"
    );
  } else {
    connected = mqtt_.connect(
      MQTT_CLIENT_ID,
      MQTT_TOPIC_STATUS,
      1,
      true,
      "{\"reason\":\"offline\"}"
    );
  }

  if (!connected) {
    Serial.print("[MQTT] connect failed rc=");
    Serial.println(mqtt_.state());
    return;
  }

  mqtt_.subscribe(MQTT_TOPIC_CMD);
#if APP_VERBOSE_LOG
  Serial.print("[MQTT] subscribed ");
  Serial.println(MQTT_TOPIC_CMD);
#endif

  lastConnected_ = true;
  mqtt_.publish(MQTT_TOPIC_STATUS, "{\"reason\":\"online\"}", true);
}

void MqttClient::update(uint32_t nowMs) {
  if (lastConnected_ && !mqtt_.connected()) {
    lastConnected_ = false;
    Serial.println("[MQTT] disconnected");
  }

  connectWifi(nowMs);
  connectMqtt(nowMs);

  if (mqtt_.connected()) {
    mqtt_.loop();
  }
}

bool MqttClient::ready() {
  return mqtt_.connected();
}

bool MqttClient::publish(const PublishMsg& msg) {
  switch (msg.kind) {
    case PublishKind::incident:
      return publishIncident(msg.state, msg.id, msg.name, msg.severity, msg.text, msg.ts_ms);
    case PublishKind::alert:
      return publishAlert(msg.id, msg.name, (uint8_t)msg.number, msg.text);
    case PublishKind::action:
      return publishAction(msg.id, msg.name, msg.ok, msg.text);
    case PublishKind::status:
      return publishStatus(msg.st, msg.text);
    case PublishKind::ack:
      return publishAck(msg.name, msg.ok, msg.text);
    default:
      return false;
  }
}

bool MqttClient::publishIncident(const char* event, const char* id, const char* type,
                                 uint8_t severity, const char* reason, uint32_t tsMs) {
  if (!ready()) return false;

  String payload = "{\"event\":";
  appendJsonString(payload, event);
  payload += ",\"id\":";
  appendJsonString(payload, id);
  payload += ",\"type\":";
  appendJsonString(payload, type);
  payload += ",\"severity\":";
  payload += String(severity);
  payload += ",\"reason\":";
  appendJsonString(payload, reason);
  payload += ",\"ts_ms\":";
  payload += String(tsMs);
  payload += "}";

  return mqtt_.publish(MQTT_TOPIC_INCIDENT, payload.c_str(), false);
}

bool MqttClient::publishAlert(const char* incidentId, const char* channel, uint8_t level, const char* message) {
  if (!ready()) return false;

  String payload = "{\"incident\":";
  appendJsonString(payload, incidentId);
  payload += ",\"channel\":";
  appendJsonString(payload, channel);
  payload += ",\"level\":";
  payload += String(level);
  payload += ",\"message\":";
  appendJsonString(payload, message);
  payload += "}";

  return mqtt_.publish(MQTT_TOPIC_ALERT, payload.c_str(), false);
}

bool MqttClient::publishAction(const char* incidentId, const char* kind, bool ok, const char* description) {
  if (!ready()) return false;

  String payload = "{\"incident\":";
  appendJsonString(payload, incidentId);
  payload += ",\"action\":";
  appendJsonString(payload, kind);
  payload += ",\"ok\":";
  payload += ok ? "true" : "false";
  payload += ",\"description\":";
  appendJsonString(payload, description);
  payload += "}";

  return mqtt_.publish(MQTT_TOPIC_ACTION, payload.c_str(), false);
}

bool MqttClient::publishStatus(const StatusSnapshot& st, const char* reason) {
  if (!ready()) return false;

  String payload = "{\"reason\":";
  appendJsonString(payload, reason ? reason : "unknown");
  payload += ",\"active\":";
  payload += String(st.incidents_active);
  payload += ",\"total\":";
  payload += String(st.incidents_total);
  payload += ",\"lockdown\":";
  payload += st.lockdown ? "true" : "false";
  payload += ",\"panic\":";
  payload += st.panic ? "true" : "false";
  payload += ",\"lights\":";
  payload += String(st.lights_active);
  payload += ",\"mains_lost\":";
  payload += st.mains_lost ? "true" : "false";
  payload += ",\"power\":\"";
  payload += st.power_optimal ? "optimal" : "degraded";
  payload += "\",\"gen_starts\":";
  payload += String(st.generator_starts);
  payload += ",\"sensors_online\":";
  payload += String(st.sensors_online);
  payload += ",\"wellbeing_pending\":";
  payload += String(st.wellbeing_pending);
  payload += ",\"routes_cleared\":";
  payload += String(st.routes_cleared);
  payload += ",\"actions_failed\":";
  payload += String(st.actions_failed);
  payload += ",\"uptime_ms\":";
  payload += String(millis());
  payload += "}";

  return mqtt_.publish(MQTT_TOPIC_STATUS, payload.c_str(), true);
}

bool MqttClient::publishAck(const char* cmd, bool ok, const char* detail) {
  if (!ready()) return false;

  String payload = "{\"cmd\":";
  appendJsonString(payload, cmd ? cmd : "");
  payload += ",\"ok\":";
  payload += ok ? "true" : "false";
  payload += ",\"detail\":";
  appendJsonString(payload, detail ? detail : "");
  payload += ",\"uptime_ms\":";
  payload += String(millis());
  payload += "}";

  return mqtt_.publish(MQTT_TOPIC_ACK, payload.c_str(), false);
}

bool MqttClient::publishMetrics(
  uint32_t pubDrops,
  uint32_t cmdDrops,
  uint32_t storeDrops,
  uint32_t tickOverruns,
  uint32_t pubQueueDepth,
  uint32_t cmdQueueDepth,
  uint32_t storeDepth
) {
  if (!ready()) return false;

  String payload = "{\"pub_drops\":";
  payload += String(pubDrops);
  payload += ",\"cmd_drops\":";
  payload += String(cmdDrops);
  payload += ",\"store_drops\":";
  payload += String(storeDrops);
  payload += ",\"overruns\":";
  payload += String(tickOverruns);
  payload += ",\"q_pub\":";
  payload += String(pubQueueDepth);
  payload += ",\"q_cmd\":";
  payload += String(cmdQueueDepth);
  payload += ",\"q_store\":";
  payload += String(storeDepth);
  payload += ",\"uptime_ms\":";
  payload += String(millis());
  payload += "}";

  return mqtt_.publish(MQTT_TOPIC_METRICS, payload.c_str(), false);
}

void MqttClient::onMqttMessage(char* topic, uint8_t* payload, unsigned int length) {
  if (!self_ || !self_->cmdCb_) return;

  String t = topic ? String(topic) : String("");
  String p;
  p.reserve(length);
  for (unsigned int i = 0; i < length; ++i) {
    p += (char)payload[i];
  }

  self_->cmdCb_(t, p);
}
