#pragma once

#include <stdint.h>
#include <string>
#include <vector>

struct DeviceConfig {
  std::string id;
  std::string name;
  std::string secret;
};

// Built once by ConfigLoader at boot, then only read.
struct Config {
  std::string api_key;
  std::string api_base_url = "https://app.candyhouse.co/api/sesame2";
  std::string history_tag = "LockSentry";
  std::vector<DeviceConfig> devices;

  std::string bot_token;
  int64_t chat_id = 0;

  uint32_t check_interval_s = 60;

  const DeviceConfig* find(const std::string& id) const {
    for (const auto& d : devices) {
      if (d.id == id) return &d;
    }
    return nullptr;
  }

  std::string displayName(const std::string& id) const {
    const DeviceConfig* d = find(id);
    return (d && !d->name.empty()) ? d->name : id;
  }
};
