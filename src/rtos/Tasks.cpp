#include "rtos/Tasks.h"

#include <cstdio>
#include <cstring>

#include "app/MqttConfig.h"
#include "rtos/Queues.h"
#include "services/PublishStore.h"

#if defined(ARDUINO_ARCH_ESP32)
#include <Preferences.h>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#endif

namespace RtosTasks {

#if defined(ARDUINO_ARCH_ESP32)
static MqttClient* gMqtt = nullptr;

static TaskHandle_t hMqtt = nullptr;
static bool gStarted = false;

static volatile uint32_t gPubDrops = 0;
static volatile uint32_t gCmdDrops = 0;
static volatile uint32_t gTickOverruns = 0;
static volatile uint32_t gStoreDrops = 0;
static volatile uint32_t gStoreDepth = 0;

// NVS image of the offline ring: "h"/"t"/"c" plus one blob per slot.
class NvsStoreBackend : public PublishStore::Backend {
public:
  bool open() {
    ready_ = pref_.begin("ercmqv2", false);
    return ready_;
  }

  bool loadMeta(uint32_t& head, uint32_t& tail, uint32_t& count) override {
    if (!ready_) return false;
    head = pref_.getUInt("h", 0);
    tail = pref_.getUInt("t", 0);
    count = pref_.getUInt("c", 0);
    return true;
  }

  bool loadSlot(uint32_t idx, PublishMsg& out) override {
    if (!ready_) return false;
    char key[8];
    slotKey(idx, key, sizeof(key));
    if (pref_.getBytesLength(key) != sizeof(PublishMsg)) return false;
    return pref_.getBytes(key, &out, sizeof(PublishMsg)) == sizeof(PublishMsg);
  }

  void saveMeta(uint32_t head, uint32_t tail, uint32_t count) override {
    if (!ready_) return;
    pref_.putUInt("h", head);
    pref_.putUInt("t", tail);
    pref_.putUInt("c", count);
  }

  void saveSlot(uint32_t idx, const PublishMsg& msg) override {
    if (!ready_) return;
    char key[8];
    slotKey(idx, key, sizeof(key));
    pref_.putBytes(key, &msg, sizeof(PublishMsg));
  }

private:
  static void slotKey(uint32_t idx, char* out, size_t outLen) {
    std::snprintf(out, outLen, "m%02lu", (unsigned long)idx);
  }

  Preferences pref_;
  bool ready_ = false;
};

static NvsStoreBackend gNvs;
static PublishStore gStore(MQTT_STORE_CAP);

static void openStore() {
  if (gNvs.open()) {
    gStore.attachBackend(&gNvs);
  } else {
    Serial.println("[MQTT] store: NVS unavailable, RAM only");
  }
  const uint32_t restored = gStore.restore();
  if (restored > 0) {
    Serial.printf("[MQTT] store: %lu pending messages restored\n", (unsigned long)restored);
  }
}

static void keep(const PublishMsg& msg) {
  if (gStore.push(msg) == StoreResult::dropped) ++gStoreDrops;
}

static void onMqttCommand(const String&, const String& payloadRaw) {
  if (!RtosQueues::mqttCmdQ) return;
  CmdMsg msg{};
  payloadRaw.toCharArray(msg.payload, sizeof(msg.payload));
  if (xQueueSend(RtosQueues::mqttCmdQ, &msg, 0) != pdTRUE) {
    ++gCmdDrops;
  }
}

static void mqttTask(void*) {
  if (!gMqtt) vTaskDelete(nullptr);

  openStore();
  gMqtt->begin(onMqttCommand);

  const TickType_t period = pdMS_TO_TICKS(10);
  TickType_t last = xTaskGetTickCount();
  uint32_t nextMetricsMs = 0;

  for (;;) {
    const uint32_t nowMs = millis();
    gMqtt->update(nowMs);

    if (gMqtt->ready()) {
      PublishMsg msg{};
      uint32_t burst = 0;
      while (burst < MQTT_STORE_FLUSH_BURST && gStore.peek(msg)) {
        if (!gMqtt->publish(msg)) break;
        gStore.pop();
        ++burst;
      }
    }

    if (RtosQueues::mqttPubQ) {
      PublishMsg msg{};
      uint32_t burst = 0;
      while (burst < MQTT_PUB_DRAIN_BURST && xQueueReceive(RtosQueues::mqttPubQ, &msg, 0) == pdTRUE) {
        // Keep ordering: once anything is stored, new messages queue behind it.
        if (!gMqtt->ready() || !gStore.empty() || !gMqtt->publish(msg)) {
          keep(msg);
        }
        ++burst;
      }
    }

    if ((int32_t)(nowMs - nextMetricsMs) >= 0) {
      nextMetricsMs = nowMs + MQTT_METRICS_PERIOD_MS;
      gMqtt->publishMetrics(
        gPubDrops,
        gCmdDrops,
        gStoreDrops,
        gTickOverruns,
        RtosQueues::mqttPubQ ? (uint32_t)uxQueueMessagesWaiting(RtosQueues::mqttPubQ) : 0,
        RtosQueues::mqttCmdQ ? (uint32_t)uxQueueMessagesWaiting(RtosQueues::mqttCmdQ) : 0,
        gStore.size()
      );
    }

    gStoreDepth = gStore.size();

    const TickType_t nowTicks = xTaskGetTickCount();
    if ((nowTicks - last) > period) {
      ++gTickOverruns;
    }
    vTaskDelayUntil(&last, period);
  }
}
#endif

void attachMqtt(MqttClient* client) {
#if defined(ARDUINO_ARCH_ESP32)
  gMqtt = client;
#else
  (void)client;
#endif
}

bool startIfReady() {
#if defined(ARDUINO_ARCH_ESP32)
  if (gStarted) return true;
  if (!gMqtt) return false;
  if (!RtosQueues::init()) {
    Serial.println("[RTOS] queue allocation failed");
    return false;
  }

  if (xTaskCreatePinnedToCore(mqttTask, "Mqtt", 6144, nullptr, 1, &hMqtt, 0) != pdPASS) {
    Serial.println("[RTOS] mqtt task start failed");
    return false;
  }
  gStarted = true;
  return true;
#else
  return false;
#endif
}

bool started() {
#if defined(ARDUINO_ARCH_ESP32)
  return gStarted;
#else
  return false;
#endif
}

Stats stats() {
  Stats s{};
#if defined(ARDUINO_ARCH_ESP32)
  s.pubDrops = gPubDrops;
  s.cmdDrops = gCmdDrops;
  s.storeDrops = gStoreDrops;
  s.tickOverruns = gTickOverruns;
  s.storeDepth = gStoreDepth;
#endif
  return s;
}

bool enqueuePublish(const PublishMsg& msg) {
#if defined(ARDUINO_ARCH_ESP32)
  if (!RtosQueues::mqttPubQ) return false;
  if (xQueueSend(RtosQueues::mqttPubQ, &msg, 0) != pdTRUE) {
    ++gPubDrops;
    return false;
  }
  return true;
#else
  (void)msg;
  return false;
#endif
}

bool dequeueCommand(CmdMsg& out) {
#if defined(ARDUINO_ARCH_ESP32)
  if (!RtosQueues::mqttCmdQ) return false;
  return xQueueReceive(RtosQueues::mqttCmdQ, &out, 0) == pdTRUE;
#else
  (void)out;
  return false;
#endif
}

} // namespace RtosTasks
