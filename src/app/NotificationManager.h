#pragma once

#include <stdint.h>
#include <string>
#include <vector>

#include "app/Config.h"
#include "app/LockState.h"
#include "services/ChatChannel.h"

namespace Actions {
constexpr const char* kLockAll = "lock_all";
} // namespace Actions

struct PendingNotification {
  std::string message_id;
  uint32_t posted_at_ms = 0;
  std::vector<DeviceStatus> devices;
};

// Owns the single "devices unlocked" slot. Only touched from the main loop.
class NotificationManager {
public:
  NotificationManager(ChatChannel& chat, const Config& cfg);

  bool chatReady() const;
  bool hasPending() const { return hasPending_; }
  const PendingNotification& pending() const { return pending_; }

  // True while the previous notice is still in the chat.
  bool tryReuse();
  bool post(const std::vector<DeviceStatus>& unlocked, uint32_t nowMs);
  void disableAction(const std::string& messageId);

  ChatNotice buildNotice(const std::vector<DeviceStatus>& unlocked) const;

private:
  ChatChannel& chat_;
  const Config& cfg_;

  bool hasPending_ = false;
  PendingNotification pending_;

  void clear();
};
