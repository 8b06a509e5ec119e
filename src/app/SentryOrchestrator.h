#pragma once

#include <Arduino.h>

#include <memory>
#include <string>

#include "app/Config.h"
#include "app/ConsoleCommand.h"
#include "app/LockAllHandler.h"
#include "app/NotificationManager.h"
#include "app/PollLoop.h"
#include "drivers/EspHttpTransport.h"
#include "services/DeviceClient.h"
#include "services/MqttClient.h"
#include "services/SettingsStore.h"
#include "services/SignatureGenerator.h"
#include "services/TelegramChannel.h"

class SentryOrchestrator {
public:
  SentryOrchestrator();

  void begin();
  void tick(uint32_t nowMs);

private:
  // Everything that needs a loaded Config; built once in begin().
  struct Runtime {
    Runtime(HttpTransport& http, const Config& cfg, const SignatureGenerator& signer);

    TelegramChannel chat;
    DeviceClient client;
    NotificationManager notices;
    PollLoop poll;
    LockAllHandler lockAll;
  };

  SettingsStore settings_;
  Config cfg_;
  EspHttpTransport http_;
  SignatureGenerator signer_;
  MqttClient mqtt_;
  std::unique_ptr<Runtime> rt_;

  std::string consoleLine_;
  bool timeSyncStarted_ = false;
  bool timeSyncLogged_ = false;
  bool chatDisabled_ = false;
  uint32_t nextWifiRetryMs_ = 0;
  uint32_t nextChatRetryMs_ = 0;
  uint32_t nextUpdatesMs_ = 0;

  void pollConsole();
  void runConsole(const ConsoleCommand& cmd);
  void printHelp() const;
  void printSettings();

  void updateNetwork(uint32_t nowMs);
  void connectChat(uint32_t nowMs);
  void pollInteractions(uint32_t nowMs);
  void dispatch(const Interaction& in);
  void publishStatus(const char* reason);
};
