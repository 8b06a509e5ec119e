#pragma once

#include <Arduino.h>
#include <PubSubClient.h>

namespace NetworkDriver {

void initWifiSta();
void tryConnectWifi(uint32_t nowMs, uint32_t& nextRetryMs, uint32_t retryMs);
bool wifiConnected();

// Starts SNTP once WiFi is up. Signing needs wall-clock time.
void startTimeSync();
bool timeSynced();
uint32_t unixTime();

void initMqtt(PubSubClient& mqtt);
bool tryConnectMqtt(PubSubClient& mqtt, uint32_t nowMs, uint32_t& nextRetryMs, uint32_t retryMs);

} // namespace NetworkDriver
