#include "app/ConsoleCommand.h"

#include <cctype>

#include "app/ConfigLoader.h"

namespace {

std::string upper(std::string s) {
  for (auto& c : s) c = (char)std::toupper(static_cast<unsigned char>(c));
  return s;
}

// Splits off the first space-separated word; rest keeps its inner spaces.
std::string nextWord(const std::string& s, std::string& rest) {
  const std::string t = ConfigLoader::trim(s);
  const size_t sp = t.find_first_of(" \t");
  if (sp == std::string::npos) {
    rest.clear();
    return t;
  }
  rest = ConfigLoader::trim(t.substr(sp + 1));
  return t.substr(0, sp);
}

ConsoleCommand reject(const std::string& why) {
  ConsoleCommand cmd;
  cmd.op = ConsoleOp::invalid;
  cmd.error = why;
  return cmd;
}

} // namespace

ConsoleCommand parseConsoleLine(const std::string& line) {
  ConsoleCommand cmd;
  std::string rest;
  const std::string verb = upper(nextWord(line, rest));

  if (verb.empty()) return cmd;

  if (verb == "HELP" || verb == "?") {
    cmd.op = ConsoleOp::help;
    return cmd;
  }
  if (verb == "SHOW") {
    cmd.op = ConsoleOp::show;
    return cmd;
  }
  if (verb == "RESTART" || verb == "REBOOT") {
    cmd.op = ConsoleOp::restart;
    return cmd;
  }

  if (verb != "SET" && verb != "CLEAR") {
    return reject("unknown command '" + verb + "'");
  }

  std::string value;
  const std::string key = upper(nextWord(rest, value));
  if (key.empty()) return reject(verb + " needs a setting name");

  const SettingSpec* spec = Settings::find(key);
  if (!spec) return reject("unknown setting '" + key + "'");

  cmd.key = spec->key;
  if (verb == "CLEAR") {
    if (!value.empty()) return reject("clear takes no value");
    cmd.op = ConsoleOp::clear;
    return cmd;
  }

  if (value.empty()) return reject("set " + cmd.key + " needs a value");
  cmd.op = ConsoleOp::set;
  cmd.value = value;
  return cmd;
}
