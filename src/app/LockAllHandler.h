#pragma once

#include <string>
#include <vector>

#include "app/Config.h"
#include "app/NotificationManager.h"
#include "services/ChatChannel.h"
#include "services/DeviceClient.h"

struct LockAllReport {
  bool nothing_to_lock = false;
  std::vector<std::string> locked;
  std::vector<std::string> failed;
};

class LockAllHandler {
public:
  LockAllHandler(const Config& cfg, DeviceClient& client, NotificationManager& notices, ChatChannel& chat);

  // False when the interaction is not a lock-all press.
  bool handle(const Interaction& in, LockAllReport& report);

  static std::string composeReply(const LockAllReport& report);

private:
  const Config& cfg_;
  DeviceClient& client_;
  NotificationManager& notices_;
  ChatChannel& chat_;
};
