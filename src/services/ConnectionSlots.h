#pragma once

#include <stdint.h>
#include <string>
#include <vector>

// Bookkeeping for a fixed set of keep-alive connections. Each slot remembers
// the host it is connected to. Not thread safe; the transport holds a lock
// around acquire() and release().
class ConnectionSlots {
public:
  explicit ConnectionSlots(size_t count);

  // Idle slot to use for host, or -1 when all are busy. Prefers a slot
  // already talking to host, then an unused one, then the least recently
  // used. sameHost tells the caller whether the open connection fits.
  int acquire(const std::string& host, bool& sameHost);

  // keepAlive false means the connection was closed; the host is forgotten.
  void release(int slot, bool keepAlive);

  size_t size() const { return slots_.size(); }
  const std::string& hostAt(size_t slot) const { return slots_[slot].host; }

  // "https://api.telegram.org/bot.../getMe" -> "api.telegram.org"
  static std::string hostOf(const std::string& url);

private:
  struct Slot {
    std::string host;
    bool busy = false;
    uint32_t lastUse = 0;
  };

  std::vector<Slot> slots_;
  uint32_t uses_ = 0;
};
