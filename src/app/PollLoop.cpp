#include "app/PollLoop.h"

#include <string>

#include "services/Logger.h"

namespace {

constexpr const char* kTag = "POLL";

bool reached(uint32_t nowMs, uint32_t targetMs) {
  return (int32_t)(nowMs - targetMs) >= 0;
}

} // namespace

PollLoop::PollLoop(const Config& cfg, DeviceClient& client, NotificationManager& notices)
: cfg_(cfg), client_(client), notices_(notices) {}

void PollLoop::start(uint32_t nowMs) {
  started_ = true;
  nextDueMs_ = nowMs;
  Log::info(kTag, "polling %u device(s) every %lus", (unsigned)cfg_.devices.size(),
            (unsigned long)cfg_.check_interval_s);
}

bool PollLoop::tick(uint32_t nowMs) {
  if (!started_) return false;
  if (!reached(nowMs, nextDueMs_)) return false;

  const uint32_t periodMs = cfg_.check_interval_s * 1000u;
  nextDueMs_ += periodMs;
  // A slow cycle must not cause a burst of catch-up cycles.
  if (reached(nowMs, nextDueMs_)) nextDueMs_ = nowMs + periodMs;

  runCycle(nowMs);
  return true;
}

uint32_t PollLoop::unlockedCount() const {
  uint32_t n = 0;
  for (const auto& st : snapshot_) {
    if (st.state == LockState::unlocked) ++n;
  }
  return n;
}

void PollLoop::runCycle(uint32_t nowMs) {
  snapshot_ = client_.getStatuses(cfg_.devices);

  // Unknown devices count as neither locked nor unlocked.
  std::vector<DeviceStatus> unlocked;
  for (const auto& st : snapshot_) {
    if (st.state == LockState::unlocked) unlocked.push_back(st);
  }

  if (!notices_.chatReady()) {
    Log::warn(kTag, "chat channel not ready, skipping this cycle");
    return;
  }

  // One live notice at a time, even if more locks opened since.
  if (notices_.tryReuse()) return;
  if (unlocked.empty()) return;

  std::string names;
  for (const auto& st : unlocked) {
    if (!names.empty()) names += ", ";
    names += cfg_.displayName(st.id);
  }
  Log::info(kTag, "unlocked: %s", names.c_str());

  notices_.post(unlocked, nowMs);
}
