#pragma once

#include <stddef.h>
#include <stdint.h>
#include <map>
#include <string>
#include <vector>

#include "app/Config.h"

struct SettingSpec {
  const char* key;           // name used on the console and in build flags
  const char* nvs_key;       // NVS keys are limited to 15 chars
  const char* default_value;
  bool secret;
};

namespace Settings {

constexpr const char* kApiKey       = "SESAME_API_KEY";
constexpr const char* kApiBaseUrl   = "SESAME_API_BASE_URL";
constexpr const char* kDeviceIds    = "SESAME_DEVICE_IDS";
constexpr const char* kDeviceNames  = "SESAME_DEVICE_NAMES";
constexpr const char* kSecrets      = "SESAME_SECRETS";
constexpr const char* kHistoryTag   = "SESAME_HISTORY_TAG";
constexpr const char* kBotToken     = "TELEGRAM_BOT_TOKEN";
constexpr const char* kChatId       = "TELEGRAM_CHAT_ID";
constexpr const char* kIntervalSecs = "CHECK_INTERVAL_SECONDS";

const SettingSpec* all(size_t& count);
const SettingSpec* find(const std::string& key);

// Shows the first and last two chars only.
std::string mask(const std::string& value);

} // namespace Settings

class RawSettings {
public:
  // Every known key set to its build-flag default.
  static RawSettings defaults();

  void set(const std::string& key, const std::string& value);
  void erase(const std::string& key);
  std::string get(const std::string& key) const;

private:
  std::map<std::string, std::string> values_;
};

class ConfigLoader {
public:
  // On failure every problem is appended to errors and out is left untouched.
  static bool load(const RawSettings& raw, Config& out, std::vector<std::string>& errors);

  static std::vector<std::string> splitList(const std::string& s);
  static std::string trim(const std::string& s);
  static bool parseInt64Strict(const std::string& s, int64_t& out);
};
