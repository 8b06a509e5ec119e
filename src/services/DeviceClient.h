#pragma once

#include <string>
#include <vector>

#include "app/Commands.h"
#include "app/Config.h"
#include "app/LockState.h"
#include "services/HttpTransport.h"
#include "services/SignatureGenerator.h"

struct LockOutcome {
  const DeviceConfig* device = nullptr;
  bool ok = false;
};

// Sesame cloud client. Nothing here reports failure to the caller except as
// LockState::unknown or a false return; every failure is logged once.
class DeviceClient {
public:
  DeviceClient(HttpTransport& http, const Config& cfg, const SignatureGenerator& signer);

  DeviceStatus getStatus(const std::string& deviceId);
  bool sendLockCommand(const std::string& deviceId, const std::string& secretHex);

  // Fan-out helpers; results keep the order of the input.
  std::vector<DeviceStatus> getStatuses(const std::vector<DeviceConfig>& devices);
  std::vector<LockOutcome> lockAll(const std::vector<const DeviceConfig*>& devices);

  static bool parseLockState(const std::string& body, LockState& out);
  std::string encodeCommand(const Command& cmd) const;

private:
  HttpTransport& http_;
  const Config& cfg_;
  const SignatureGenerator& signer_;
  std::string historyB64_;
};
