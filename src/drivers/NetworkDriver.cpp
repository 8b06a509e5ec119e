#include "drivers/NetworkDriver.h"

#include <WiFi.h>
#include <time.h>

#include "app/MqttConfig.h"

namespace NetworkDriver {

namespace {
constexpr time_t kMinValidUnix = 1600000000;  // 2020-09-13
constexpr const char* kOfflinePayload = "{\"node\":\"locksentry\",\"reason\":\"offline\"}";
} // namespace

void initWifiSta() {
  WiFi.mode(WIFI_STA);
  WiFi.setAutoReconnect(true);
  WiFi.persistent(false);
}

void tryConnectWifi(uint32_t nowMs, uint32_t& nextRetryMs, uint32_t retryMs) {
  if (WiFi.status() == WL_CONNECTED) return;
  if ((int32_t)(nowMs - nextRetryMs) < 0) return;
  nextRetryMs = nowMs + retryMs;
  if (strlen(WIFI_SSID) == 0) return;
  WiFi.begin(WIFI_SSID, WIFI_PASSWORD);
}

bool wifiConnected() {
  return WiFi.status() == WL_CONNECTED;
}

void startTimeSync() {
  configTime(0, 0, NTP_SERVER_1, NTP_SERVER_2);
}

bool timeSynced() {
  return time(nullptr) > kMinValidUnix;
}

uint32_t unixTime() {
  return (uint32_t)time(nullptr);
}

void initMqtt(PubSubClient& mqtt) {
  mqtt.setServer(MQTT_BROKER, MQTT_PORT);
  mqtt.setKeepAlive(MQTT_KEEPALIVE_S);
  mqtt.setSocketTimeout(MQTT_SOCKET_TIMEOUT_S);
  mqtt.setBufferSize(MQTT_BUFFER_SIZE);
}

bool tryConnectMqtt(PubSubClient& mqtt, uint32_t nowMs, uint32_t& nextRetryMs, uint32_t retryMs) {
  if (strlen(MQTT_BROKER) == 0) return false;
  if (WiFi.status() != WL_CONNECTED) return false;
  if (mqtt.connected()) return false;
  if ((int32_t)(nowMs - nextRetryMs) < 0) return false;
  nextRetryMs = nowMs + retryMs;

  // PubSubClient skips the credentials when user is null.
  const char* user = strlen(MQTT_USERNAME) > 0 ? MQTT_USERNAME : nullptr;
  const char* pass = user ? MQTT_PASSWORD : nullptr;
  return mqtt.connect(MQTT_CLIENT_ID, user, pass, MQTT_TOPIC_STATUS, 1, true, kOfflinePayload);
}

} // namespace NetworkDriver
