#pragma once

#include <Arduino.h>

#include "services/MqttMessages.h"

#if defined(ARDUINO_ARCH_ESP32)
#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>
#endif

namespace RtosQueues {

#if defined(ARDUINO_ARCH_ESP32)
extern QueueHandle_t mqttPubQ;
extern QueueHandle_t mqttCmdQ;
#endif

bool init();

} // namespace RtosQueues
