#pragma once

#include <Preferences.h>
#include <string>

#include "app/ConfigLoader.h"

// Console overrides kept in NVS on top of the build-flag defaults.
class SettingsStore {
public:
  bool begin();
  bool ready() const { return ready_; }

  RawSettings load();
  bool isStored(const SettingSpec& spec);
  bool put(const SettingSpec& spec, const std::string& value);
  bool remove(const SettingSpec& spec);

private:
  Preferences pref_;
  bool ready_ = false;
};
