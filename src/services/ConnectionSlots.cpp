#include "services/ConnectionSlots.h"

ConnectionSlots::ConnectionSlots(size_t count)
: slots_(count) {}

std::string ConnectionSlots::hostOf(const std::string& url) {
  size_t start = url.find("://");
  start = start == std::string::npos ? 0 : start + 3;
  const size_t end = url.find_first_of("/?#", start);
  return url.substr(start, end == std::string::npos ? std::string::npos : end - start);
}

int ConnectionSlots::acquire(const std::string& host, bool& sameHost) {
  sameHost = false;
  int match = -1;
  int unused = -1;
  int oldest = -1;

  for (size_t i = 0; i < slots_.size(); ++i) {
    const Slot& s = slots_[i];
    if (s.busy) continue;
    if (s.host == host && !host.empty()) {
      match = (int)i;
      break;
    }
    if (s.host.empty()) {
      if (unused < 0) unused = (int)i;
    } else if (oldest < 0 || s.lastUse < slots_[oldest].lastUse) {
      oldest = (int)i;
    }
  }

  int pick = match >= 0 ? match : (unused >= 0 ? unused : oldest);
  if (pick < 0) return -1;

  Slot& s = slots_[pick];
  sameHost = match >= 0;
  s.busy = true;
  s.host = host;
  s.lastUse = ++uses_;
  return pick;
}

void ConnectionSlots::release(int slot, bool keepAlive) {
  if (slot < 0 || (size_t)slot >= slots_.size()) return;
  Slot& s = slots_[slot];
  s.busy = false;
  if (!keepAlive) s.host.clear();
}
