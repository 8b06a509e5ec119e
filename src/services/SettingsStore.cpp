#include "services/SettingsStore.h"

#include "services/Logger.h"

namespace {
constexpr const char* kTag = "NVS";
constexpr const char* kNamespace = "lksentry";
} // namespace

bool SettingsStore::begin() {
  ready_ = pref_.begin(kNamespace, false);
  if (!ready_) {
    Log::warn(kTag, "settings storage unavailable; using build defaults only");
  }
  return ready_;
}

RawSettings SettingsStore::load() {
  RawSettings raw = RawSettings::defaults();
  if (!ready_) return raw;

  size_t count = 0;
  const SettingSpec* specs = Settings::all(count);
  for (size_t i = 0; i < count; ++i) {
    if (!pref_.isKey(specs[i].nvs_key)) continue;
    raw.set(specs[i].key, pref_.getString(specs[i].nvs_key, "").c_str());
#if APP_VERBOSE_LOG
    Log::debug(kTag, "%s overridden from storage", specs[i].key);
#endif
  }
  return raw;
}

bool SettingsStore::isStored(const SettingSpec& spec) {
  return ready_ && pref_.isKey(spec.nvs_key);
}

bool SettingsStore::put(const SettingSpec& spec, const std::string& value) {
  if (!ready_) return false;
  if (pref_.putString(spec.nvs_key, value.c_str()) != value.size()) {
    Log::error(kTag, "writing %s failed", spec.key);
    return false;
  }
  return true;
}

bool SettingsStore::remove(const SettingSpec& spec) {
  if (!ready_) return false;
  if (!pref_.isKey(spec.nvs_key)) return true;
  return pref_.remove(spec.nvs_key);
}
