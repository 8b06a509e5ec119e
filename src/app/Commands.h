#pragma once

#include <stdint.h>
#include <string>

// Sesame cloud opcodes. Only the lock opcode is ever sent.
enum class CommandType : uint8_t {
  lock = 82
};

static inline const char* toString(CommandType t) {
  switch (t) {
    case CommandType::lock: return "lock";
    default:                return "unknown";
  }
}

// Built right before each send, never stored.
struct Command {
  CommandType type = CommandType::lock;
  std::string signature;
  std::string history;  // base64 of the history tag
};
