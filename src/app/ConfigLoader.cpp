#include "app/ConfigLoader.h"

#include <cctype>
#include <set>

#include "app/SentryConfig.h"
#include "services/Logger.h"

namespace {

constexpr const char* kTag = "CFG";
constexpr uint32_t kMaxIntervalS = 86400;  // keeps interval * 1000 inside uint32_t

const SettingSpec kSpecs[] = {
  {Settings::kApiKey,       "api_key",   SESAME_API_KEY,         true},
  {Settings::kApiBaseUrl,   "api_base",  SESAME_API_BASE_URL,    false},
  {Settings::kDeviceIds,    "dev_ids",   SESAME_DEVICE_IDS,      false},
  {Settings::kDeviceNames,  "dev_names", SESAME_DEVICE_NAMES,    false},
  {Settings::kSecrets,      "secrets",   SESAME_SECRETS,         true},
  {Settings::kHistoryTag,   "hist_tag",  SESAME_HISTORY_TAG,     false},
  {Settings::kBotToken,     "bot_token", TELEGRAM_BOT_TOKEN,     true},
  {Settings::kChatId,       "chat_id",   TELEGRAM_CHAT_ID,       false},
  {Settings::kIntervalSecs, "interval",  CHECK_INTERVAL_SECONDS, false},
};

constexpr size_t kSpecCount = sizeof(kSpecs) / sizeof(kSpecs[0]);

// Keeps ASCII only; pasted keys often carry invisible unicode.
std::string asciiOnly(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    if (static_cast<unsigned char>(c) < 0x80) out += c;
  }
  return out;
}

bool isHexKey(const std::string& s) {
  if (s.size() != 32) return false;
  for (char c : s) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

bool parseUint32Strict(const std::string& s, uint32_t& out) {
  if (s.empty()) return false;
  uint64_t v = 0;
  for (char c : s) {
    if (c < '0' || c > '9') return false;
    v = (v * 10u) + (uint64_t)(c - '0');
    if (v > 0xFFFFFFFFull) return false;
  }
  out = (uint32_t)v;
  return true;
}

bool unset(const std::string& value, const char* placeholder) {
  if (value.empty()) return true;
  return placeholder && value.find(placeholder) != std::string::npos;
}

} // namespace

namespace Settings {

const SettingSpec* all(size_t& count) {
  count = kSpecCount;
  return kSpecs;
}

const SettingSpec* find(const std::string& key) {
  for (size_t i = 0; i < kSpecCount; ++i) {
    if (key == kSpecs[i].key) return &kSpecs[i];
  }
  return nullptr;
}

std::string mask(const std::string& value) {
  if (value.size() <= 4) return std::string(value.size(), '*');
  return value.substr(0, 2) + std::string(value.size() - 4, '*') + value.substr(value.size() - 2);
}

} // namespace Settings

RawSettings RawSettings::defaults() {
  RawSettings raw;
  for (size_t i = 0; i < kSpecCount; ++i) {
    raw.set(kSpecs[i].key, kSpecs[i].default_value);
  }
  return raw;
}

void RawSettings::set(const std::string& key, const std::string& value) {
  values_[key] = value;
}

void RawSettings::erase(const std::string& key) {
  values_.erase(key);
}

std::string RawSettings::get(const std::string& key) const {
  const auto it = values_.find(key);
  return it == values_.end() ? std::string() : it->second;
}

std::string ConfigLoader::trim(const std::string& s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

std::vector<std::string> ConfigLoader::splitList(const std::string& s) {
  std::vector<std::string> out;
  size_t start = 0;
  for (;;) {
    const size_t comma = s.find(',', start);
    if (comma == std::string::npos) {
      out.push_back(trim(s.substr(start)));
      break;
    }
    out.push_back(trim(s.substr(start, comma - start)));
    start = comma + 1;
  }
  return out;
}

bool ConfigLoader::parseInt64Strict(const std::string& s, int64_t& out) {
  size_t i = 0;
  bool negative = false;
  if (i < s.size() && (s[i] == '-' || s[i] == '+')) {
    negative = s[i] == '-';
    ++i;
  }
  if (i == s.size()) return false;

  uint64_t v = 0;
  for (; i < s.size(); ++i) {
    const char c = s[i];
    if (c < '0' || c > '9') return false;
    v = (v * 10u) + (uint64_t)(c - '0');
    if (v > 0x7FFFFFFFFFFFFFFFull) return false;
  }
  out = negative ? -(int64_t)v : (int64_t)v;
  return true;
}

bool ConfigLoader::load(const RawSettings& raw, Config& out, std::vector<std::string>& errors) {
  const size_t errorsBefore = errors.size();

  const std::string apiKey = trim(asciiOnly(raw.get(Settings::kApiKey)));
  const std::string idsRaw = trim(raw.get(Settings::kDeviceIds));
  const std::string namesRaw = trim(raw.get(Settings::kDeviceNames));
  const std::string secretsRaw = trim(raw.get(Settings::kSecrets));
  const std::string botToken = trim(raw.get(Settings::kBotToken));
  const std::string chatIdRaw = trim(raw.get(Settings::kChatId));
  const std::string intervalRaw = trim(raw.get(Settings::kIntervalSecs));

  if (unset(apiKey, "YOUR_SESAME_API_KEY")) {
    errors.push_back("SESAME_API_KEY is not set");
  }
  if (unset(idsRaw, "YOUR_SESAME_DEVICE_UUID")) {
    errors.push_back("SESAME_DEVICE_IDS is not set");
  }
  if (unset(secretsRaw, nullptr)) {
    errors.push_back("SESAME_SECRETS is not set; one secret per device is required");
  }
  if (unset(botToken, "YOUR_TELEGRAM_BOT_TOKEN")) {
    errors.push_back("TELEGRAM_BOT_TOKEN is not set");
  }
  if (unset(chatIdRaw, "YOUR_TELEGRAM_CHAT_ID")) {
    errors.push_back("TELEGRAM_CHAT_ID is not set");
  }
  if (errors.size() != errorsBefore) return false;

  int64_t chatId = 0;
  if (!parseInt64Strict(chatIdRaw, chatId)) {
    errors.push_back("TELEGRAM_CHAT_ID must be an integer, got '" + chatIdRaw + "'");
  }

  uint32_t interval = 0;
  if (!parseUint32Strict(intervalRaw, interval)) {
    errors.push_back("CHECK_INTERVAL_SECONDS must be an integer, got '" + intervalRaw + "'");
  } else if (interval == 0) {
    errors.push_back("CHECK_INTERVAL_SECONDS must be greater than 0");
  } else if (interval > kMaxIntervalS) {
    errors.push_back("CHECK_INTERVAL_SECONDS must be at most " + std::to_string(kMaxIntervalS));
  }

  const std::vector<std::string> ids = splitList(idsRaw);
  const std::vector<std::string> secrets = splitList(secretsRaw);
  const std::vector<std::string> names = namesRaw.empty() ? std::vector<std::string>() : splitList(namesRaw);

  if (ids.size() != secrets.size()) {
    errors.push_back("SESAME_DEVICE_IDS and SESAME_SECRETS counts do not match (" +
                     std::to_string(ids.size()) + " ids, " +
                     std::to_string(secrets.size()) + " secrets)");
  }

  std::set<std::string> seen;
  for (const auto& id : ids) {
    if (id.empty()) {
      errors.push_back("SESAME_DEVICE_IDS contains an empty entry");
    } else if (!seen.insert(id).second) {
      errors.push_back("SESAME_DEVICE_IDS lists '" + id + "' more than once");
    }
  }

  if (errors.size() != errorsBefore) return false;

  Config cfg;
  cfg.api_key = apiKey;
  cfg.bot_token = botToken;
  cfg.chat_id = chatId;
  cfg.check_interval_s = interval;

  std::string base = trim(raw.get(Settings::kApiBaseUrl));
  while (!base.empty() && base[base.size() - 1] == '/') base.erase(base.size() - 1);
  if (!base.empty()) cfg.api_base_url = base;

  const std::string tag = trim(raw.get(Settings::kHistoryTag));
  if (!tag.empty()) cfg.history_tag = tag;

  for (size_t i = 0; i < ids.size(); ++i) {
    DeviceConfig d;
    d.id = ids[i];
    d.name = (i < names.size() && !names[i].empty()) ? names[i] : ids[i];
    d.secret = secrets[i];
    if (!isHexKey(d.secret)) {
      Log::warn(kTag, "secret for %s is not 32 hex chars; locking it will fail", d.name.c_str());
    }
    cfg.devices.push_back(d);
  }

  out = cfg;
  Log::info(kTag, "config ok: %u device(s), poll every %lus",
            (unsigned)cfg.devices.size(), (unsigned long)cfg.check_interval_s);
  return true;
}
