#pragma once

#ifndef WIFI_SSID
#define WIFI_SSID ""
#endif

#ifndef WIFI_PASSWORD
#define WIFI_PASSWORD ""
#endif

#ifndef MQTT_BROKER
#define MQTT_BROKER "192.168.1.10"
#endif

#ifndef MQTT_PORT
#define MQTT_PORT 1883
#endif

#ifndef MQTT_USERNAME
#define MQTT_USERNAME ""
#endif

#ifndef MQTT_PASSWORD
#define MQTT_PASSWORD ""
#endif

#ifndef MQTT_CLIENT_ID
#define MQTT_CLIENT_ID "emergency-response-esp32"
#endif

#ifndef MQTT_KEEPALIVE_S
#define MQTT_KEEPALIVE_S 15
#endif

#ifndef MQTT_SOCKET_TIMEOUT_S
#define MQTT_SOCKET_TIMEOUT_S 1
#endif

#ifndef MQTT_BUFFER_SIZE
#define MQTT_BUFFER_SIZE 512
#endif

#ifndef WIFI_RECONNECT_MS
#define WIFI_RECONNECT_MS 5000
#endif

#ifndef MQTT_RECONNECT_MS
#define MQTT_RECONNECT_MS 3000
#endif

#ifndef MQTT_TOPIC_CMD
#define MQTT_TOPIC_CMD "erc/cmd"
#endif

#ifndef MQTT_TOPIC_INCIDENT
#define MQTT_TOPIC_INCIDENT "erc/incident"
#endif

#ifndef MQTT_TOPIC_ALERT
#define MQTT_TOPIC_ALERT "erc/alert"
#endif

#ifndef MQTT_TOPIC_ACTION
#define MQTT_TOPIC_ACTION "erc/action"
#endif

#ifndef MQTT_TOPIC_STATUS
#define MQTT_TOPIC_STATUS "erc/status"
#endif

#ifndef MQTT_TOPIC_ACK
#define MQTT_TOPIC_ACK "erc/ack"
#endif

#ifndef MQTT_TOPIC_METRICS
#define MQTT_TOPIC_METRICS "erc/metrics"
#endif

#ifndef MQTT_METRICS_PERIOD_MS
#define MQTT_METRICS_PERIOD_MS 10000
#endif

#ifndef MQTT_PUB_QUEUE_LEN
#define MQTT_PUB_QUEUE_LEN 48
#endif

#ifndef MQTT_CMD_QUEUE_LEN
#define MQTT_CMD_QUEUE_LEN 8
#endif

#ifndef MQTT_STORE_CAP
#define MQTT_STORE_CAP 32
#endif

#ifndef MQTT_STORE_FLUSH_BURST
#define MQTT_STORE_FLUSH_BURST 8
#endif

#ifndef MQTT_PUB_DRAIN_BURST
#define MQTT_PUB_DRAIN_BURST 8
#endif

#ifndef APP_VERBOSE_LOG
#define APP_VERBOSE_LOG 0
#endif
