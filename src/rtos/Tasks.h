#pragma once

#include <Arduino.h>

#include "rtos/Queues.h"
#include "services/MqttClient.h"

// Network side of the firmware. The engine never runs here; it only sees
// what loop() pulls from the command queue.
namespace RtosTasks {

struct Stats {
  uint32_t pubDrops = 0;
  uint32_t cmdDrops = 0;
  uint32_t storeDrops = 0;
  uint32_t tickOverruns = 0;
  uint32_t storeDepth = 0;
};

void attachMqtt(MqttClient* client);
bool startIfReady();
bool started();

Stats stats();

bool enqueuePublish(const PublishMsg& msg);
bool dequeueCommand(CmdMsg& out);

} // namespace RtosTasks
