#include "app/LockAllHandler.h"

#include "services/Logger.h"

namespace {

constexpr const char* kTag = "LOCK";

std::string join(const std::vector<std::string>& names) {
  std::string out;
  for (const auto& n : names) {
    if (!out.empty()) out += ", ";
    out += n;
  }
  return out;
}

} // namespace

LockAllHandler::LockAllHandler(const Config& cfg, DeviceClient& client, NotificationManager& notices, ChatChannel& chat)
: cfg_(cfg), client_(client), notices_(notices), chat_(chat) {}

std::string LockAllHandler::composeReply(const LockAllReport& report) {
  if (report.nothing_to_lock) {
    return "\xE2\x9C\x85 All devices were already locked.";
  }

  std::string reply;
  if (!report.locked.empty()) {
    reply += "\xE2\x9C\x85 Locked: " + join(report.locked);
  }
  if (!report.failed.empty()) {
    if (!reply.empty()) reply += "\n";
    reply += "\xE2\x9D\x8C Failed to lock: " + join(report.failed);
  }
  return reply;
}

bool LockAllHandler::handle(const Interaction& in, LockAllReport& report) {
  if (in.action_id != Actions::kLockAll) return false;

  // Must come first: the chat gives up on unanswered presses.
  const ChatStatus ack = chat_.acknowledge(in, "Checking locks...");
  if (ack != ChatStatus::ok) {
    Log::warn(kTag, "acknowledging press %s failed (%s)", in.id.c_str(), toString(ack));
  }

  Log::info(kTag, "lock all pressed by %s, re-checking devices", in.user_name.c_str());

  // The notice may be stale, so decide on fresh state.
  const std::vector<DeviceStatus> statuses = client_.getStatuses(cfg_.devices);
  std::vector<const DeviceConfig*> targets;
  for (size_t i = 0; i < statuses.size() && i < cfg_.devices.size(); ++i) {
    if (statuses[i].state == LockState::unlocked) targets.push_back(&cfg_.devices[i]);
  }

  report = LockAllReport{};
  if (targets.empty()) {
    report.nothing_to_lock = true;
  } else {
    for (const auto& outcome : client_.lockAll(targets)) {
      const std::string& name = outcome.device->name.empty() ? outcome.device->id : outcome.device->name;
      if (outcome.ok) {
        report.locked.push_back(name);
      } else {
        report.failed.push_back(name);
      }
    }
    if (!report.locked.empty()) {
      Log::info(kTag, "%s locked %s", in.user_name.c_str(), join(report.locked).c_str());
    }
    if (!report.failed.empty()) {
      Log::warn(kTag, "could not lock %s", join(report.failed).c_str());
    }
  }

  const ChatStatus replied = chat_.replyPrivately(in, composeReply(report));
  if (replied != ChatStatus::ok) {
    Log::error(kTag, "reply to %s failed (%s)", in.user_name.c_str(), toString(replied));
  }

  notices_.disableAction(in.message_id);
  return true;
}
