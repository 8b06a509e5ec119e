#include "MqttClient.h"

#include <ArduinoJson.h>
#include <cstring>

#include "app/MqttConfig.h"
#include "drivers/NetworkDriver.h"
#include "services/Logger.h"

namespace {
constexpr const char* kTag = "MQTT";
} // namespace

MqttClient::MqttClient()
: mqtt_(wifiClient_) {}

void MqttClient::begin() {
  enabled_ = strlen(MQTT_BROKER) > 0;
  if (!enabled_) {
    Log::info(kTag, "no broker configured, telemetry off");
    return;
  }
  NetworkDriver::initMqtt(mqtt_);
}

void MqttClient::update(uint32_t nowMs) {
  if (!enabled_) return;

  if (lastConnected_ && !mqtt_.connected()) {
    lastConnected_ = false;
    Log::warn(kTag, "disconnected");
  }

  if (!mqtt_.connected()) {
    const bool attempted = (int32_t)(nowMs - nextMqttRetryMs_) >= 0 && NetworkDriver::wifiConnected();
    if (NetworkDriver::tryConnectMqtt(mqtt_, nowMs, nextMqttRetryMs_, MQTT_RECONNECT_MS)) {
      lastConnected_ = true;
      Log::info(kTag, "connected to %s:%d", MQTT_BROKER, MQTT_PORT);
      mqtt_.publish(MQTT_TOPIC_STATUS, "{\"node\":\"locksentry\",\"reason\":\"online\"}", true);
    } else if (attempted) {
#if APP_VERBOSE_LOG
      Log::debug(kTag, "connect failed rc=%d", mqtt_.state());
#endif
    }
  }

  if (mqtt_.connected()) {
    mqtt_.loop();
  }
}

bool MqttClient::ready() {
  return enabled_ && mqtt_.connected();
}

bool MqttClient::publishJson(const char* topic, const JsonDocument& doc, bool retained) {
  std::string payload;
  serializeJson(doc, payload);
  if (!mqtt_.publish(topic, payload.c_str(), retained)) {
    Log::warn(kTag, "publish to %s failed (%u bytes)", topic, (unsigned)payload.size());
    return false;
  }
  return true;
}

bool MqttClient::publishStatus(const std::vector<DeviceStatus>& snapshot, const Config& cfg,
                               const std::string& pendingMessageId, const char* reason) {
  if (!ready()) return false;

  DynamicJsonDocument doc(768 + 160 * snapshot.size());
  doc["node"] = "locksentry";
  doc["reason"] = reason ? reason : "unknown";

  int unlocked = 0;
  JsonArray devices = doc.createNestedArray("devices");
  for (const auto& st : snapshot) {
    JsonObject d = devices.createNestedObject();
    d["id"] = st.id;
    d["name"] = cfg.displayName(st.id);
    d["state"] = toString(st.state);
    if (st.state == LockState::unlocked) ++unlocked;
  }
  doc["unlocked"] = unlocked;
  if (pendingMessageId.empty()) {
    doc["pending_message"] = nullptr;
  } else {
    doc["pending_message"] = pendingMessageId;
  }
  doc["uptime_ms"] = (unsigned long)millis();

  return publishJson(MQTT_TOPIC_STATUS, doc, true);
}

bool MqttClient::publishAck(const std::string& user, const LockAllReport& report) {
  if (!ready()) return false;

  DynamicJsonDocument doc(512 + 64 * (report.locked.size() + report.failed.size()));
  doc["cmd"] = "lock_all";
  doc["user"] = user;
  doc["ok"] = report.failed.empty();
  doc["nothing_to_lock"] = report.nothing_to_lock;
  JsonArray locked = doc.createNestedArray("locked");
  for (const auto& n : report.locked) locked.add(n);
  JsonArray failed = doc.createNestedArray("failed");
  for (const auto& n : report.failed) failed.add(n);
  doc["uptime_ms"] = (unsigned long)millis();

  return publishJson(MQTT_TOPIC_ACK, doc, false);
}
