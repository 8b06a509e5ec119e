#pragma once

#ifndef WIFI_SSID
#define WIFI_SSID ""
#endif

#ifndef WIFI_PASSWORD
#define WIFI_PASSWORD ""
#endif

#ifndef NTP_SERVER_1
#define NTP_SERVER_1 "pool.ntp.org"
#endif

#ifndef NTP_SERVER_2
#define NTP_SERVER_2 "time.google.com"
#endif

// Empty broker disables the telemetry mirror.
#ifndef MQTT_BROKER
#define MQTT_BROKER ""
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
#define MQTT_CLIENT_ID "locksentry-esp32"
#endif

#ifndef MQTT_KEEPALIVE_S
#define MQTT_KEEPALIVE_S 15
#endif

#ifndef MQTT_SOCKET_TIMEOUT_S
#define MQTT_SOCKET_TIMEOUT_S 1
#endif

#ifndef MQTT_BUFFER_SIZE
#define MQTT_BUFFER_SIZE 1024
#endif

#ifndef WIFI_RECONNECT_MS
#define WIFI_RECONNECT_MS 5000
#endif

#ifndef MQTT_RECONNECT_MS
#define MQTT_RECONNECT_MS 3000
#endif

#ifndef MQTT_TOPIC_STATUS
#define MQTT_TOPIC_STATUS "locksentry/status"
#endif

#ifndef MQTT_TOPIC_ACK
#define MQTT_TOPIC_ACK "locksentry/ack"
#endif
