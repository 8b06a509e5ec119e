#include "app/NotificationManager.h"

#include "services/Logger.h"

namespace {
constexpr const char* kTag = "NOTIFY";
constexpr const char* kActionLabel = "Lock all";
constexpr const char* kDoneLabel = "Lock all (done)";
} // namespace

NotificationManager::NotificationManager(ChatChannel& chat, const Config& cfg)
: chat_(chat), cfg_(cfg) {}

bool NotificationManager::chatReady() const {
  return chat_.ready();
}

void NotificationManager::clear() {
  hasPending_ = false;
  pending_ = PendingNotification{};
}

ChatNotice NotificationManager::buildNotice(const std::vector<DeviceStatus>& unlocked) const {
  ChatNotice n;
  n.title = "\xF0\x9F\x94\x93 Some smart locks are unlocked";
  n.description = "Press the button below to lock them remotely.";
  for (const auto& st : unlocked) {
    n.items.push_back(cfg_.displayName(st.id));
  }
  n.action_label = kActionLabel;
  n.action_id = Actions::kLockAll;
  return n;
}

bool NotificationManager::tryReuse() {
  if (!hasPending_) return false;

  const ChatStatus st = chat_.fetchMessage(pending_.message_id);
  switch (st) {
    case ChatStatus::ok:
      Log::info(kTag, "notice %s is still posted, not sending another", pending_.message_id.c_str());
      return true;
    case ChatStatus::not_found:
      Log::info(kTag, "notice %s is gone, slot cleared", pending_.message_id.c_str());
      clear();
      return false;
    default:
      // Unsure means keep it: a duplicate notice is worse than a late one.
      Log::warn(kTag, "could not check notice %s (%s), keeping it",
                pending_.message_id.c_str(), toString(st));
      return true;
  }
}

bool NotificationManager::post(const std::vector<DeviceStatus>& unlocked, uint32_t nowMs) {
  if (unlocked.empty()) return false;

  std::string messageId;
  const ChatStatus st = chat_.sendNotice(buildNotice(unlocked), messageId);
  if (st != ChatStatus::ok) {
    if (st == ChatStatus::forbidden) {
      Log::error(kTag, "no permission to post in chat %lld", (long long)cfg_.chat_id);
    } else {
      Log::error(kTag, "posting unlock notice failed (%s)", toString(st));
    }
    return false;
  }

  hasPending_ = true;
  pending_.message_id = messageId;
  pending_.posted_at_ms = nowMs;
  pending_.devices = unlocked;
  Log::info(kTag, "unlock notice %s posted for %u device(s)", messageId.c_str(), (unsigned)unlocked.size());
  return true;
}

void NotificationManager::disableAction(const std::string& messageId) {
  const bool isPending = hasPending_ && pending_.message_id == messageId;

  const ChatStatus st = chat_.disableAction(messageId, kDoneLabel);
  switch (st) {
    case ChatStatus::ok:
      // The slot stays until the probe finds the message deleted.
      Log::info(kTag, "action on %s disabled", messageId.c_str());
      break;
    case ChatStatus::not_found:
      Log::warn(kTag, "message %s to disable was not found", messageId.c_str());
      if (isPending) clear();
      break;
    case ChatStatus::forbidden:
      Log::error(kTag, "no permission to edit message %s", messageId.c_str());
      break;
    default:
      Log::error(kTag, "disabling action on %s failed (%s)", messageId.c_str(), toString(st));
      break;
  }
}
