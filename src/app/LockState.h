#pragma once

#include <string>

enum class LockState { locked, unlocked, unknown };

static inline const char* toString(LockState s) {
  switch (s) {
    case LockState::locked:   return "locked";
    case LockState::unlocked: return "unlocked";
    case LockState::unknown:  return "unknown";
    default:                  return "unknown";
  }
}

// Derived per poll from the vendor response, never stored.
struct DeviceStatus {
  std::string id;
  LockState state = LockState::unknown;
};
