#pragma once

#include <Arduino.h>
#include <WiFi.h>
#include <PubSubClient.h>
#include <ArduinoJson.h>

#include <string>
#include <vector>

#include "app/Config.h"
#include "app/LockAllHandler.h"
#include "app/LockState.h"

// Optional telemetry mirror. Nothing here feeds back into lock decisions.
class MqttClient {
public:
  MqttClient();

  void begin();
  void update(uint32_t nowMs);

  bool ready();
  bool publishStatus(const std::vector<DeviceStatus>& snapshot, const Config& cfg,
                     const std::string& pendingMessageId, const char* reason);
  bool publishAck(const std::string& user, const LockAllReport& report);

private:
  WiFiClient wifiClient_;
  PubSubClient mqtt_;
  bool enabled_ = false;
  bool lastConnected_ = false;
  uint32_t nextMqttRetryMs_ = 0;

  bool publishJson(const char* topic, const JsonDocument& doc, bool retained);
};
