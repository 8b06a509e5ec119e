#pragma once

#include <stdint.h>
#include <string>

enum class ConsoleOp : uint8_t {
  none,
  help,
  show,
  set,
  clear,
  restart,
  invalid
};

static inline const char* toString(ConsoleOp op) {
  switch (op) {
    case ConsoleOp::none:    return "none";
    case ConsoleOp::help:    return "help";
    case ConsoleOp::show:    return "show";
    case ConsoleOp::set:     return "set";
    case ConsoleOp::clear:   return "clear";
    case ConsoleOp::restart: return "restart";
    case ConsoleOp::invalid: return "invalid";
    default:                 return "unknown";
  }
}

struct ConsoleCommand {
  ConsoleOp op = ConsoleOp::none;
  std::string key;    // canonical setting name for set/clear
  std::string value;  // rest of the line for set, spaces kept
  std::string error;  // why the line was rejected
};

// One line from the serial console:
//   set KEY value | clear KEY | show | restart | help
ConsoleCommand parseConsoleLine(const std::string& line);
