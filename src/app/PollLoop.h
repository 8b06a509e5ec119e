#pragma once

#include <stdint.h>
#include <vector>

#include "app/Config.h"
#include "app/LockState.h"
#include "app/NotificationManager.h"
#include "services/DeviceClient.h"

class PollLoop {
public:
  PollLoop(const Config& cfg, DeviceClient& client, NotificationManager& notices);

  // Arms the timer; the first cycle is due right away.
  void start(uint32_t nowMs);
  bool started() const { return started_; }

  // Runs one cycle when the interval elapsed. Returns true if it ran.
  bool tick(uint32_t nowMs);
  void runCycle(uint32_t nowMs);

  const std::vector<DeviceStatus>& lastSnapshot() const { return snapshot_; }
  uint32_t unlockedCount() const;

private:
  const Config& cfg_;
  DeviceClient& client_;
  NotificationManager& notices_;

  bool started_ = false;
  uint32_t nextDueMs_ = 0;
  std::vector<DeviceStatus> snapshot_;
};
