#include "rtos/Queues.h"

#include "app/MqttConfig.h"

namespace RtosQueues {

#if defined(ARDUINO_ARCH_ESP32)
QueueHandle_t mqttPubQ = nullptr;
QueueHandle_t mqttCmdQ = nullptr;
#endif

bool init() {
#if defined(ARDUINO_ARCH_ESP32)
  if (!mqttPubQ) mqttPubQ = xQueueCreate(MQTT_PUB_QUEUE_LEN, sizeof(PublishMsg));
  if (!mqttCmdQ) mqttCmdQ = xQueueCreate(MQTT_CMD_QUEUE_LEN, sizeof(CmdMsg));
  return mqttPubQ && mqttCmdQ;
#else
  return false;
#endif
}

} // namespace RtosQueues
