#include "services/DeviceClient.h"

#include <ArduinoJson.h>
#include <mbedtls/base64.h>

#include "rtos/FanOut.h"
#include "services/Logger.h"

namespace {

constexpr const char* kTag = "SESAME";
constexpr const char* kStatusField = "CHSesame2Status";

std::string base64(const std::string& in) {
  std::vector<unsigned char> buf(4 * ((in.size() + 2) / 3) + 1);
  size_t olen = 0;
  if (mbedtls_base64_encode(buf.data(), buf.size(), &olen,
                            reinterpret_cast<const unsigned char*>(in.data()), in.size()) != 0) {
    return std::string();
  }
  return std::string(reinterpret_cast<const char*>(buf.data()), olen);
}

// Vendor error bodies can be whole HTML pages.
std::string clip(const std::string& body) {
  return body.size() > 160 ? body.substr(0, 160) + "..." : body;
}

} // namespace

DeviceClient::DeviceClient(HttpTransport& http, const Config& cfg, const SignatureGenerator& signer)
: http_(http), cfg_(cfg), signer_(signer), historyB64_(base64(cfg.history_tag)) {}

bool DeviceClient::parseLockState(const std::string& body, LockState& out) {
  StaticJsonDocument<64> filter;
  filter[kStatusField] = true;

  StaticJsonDocument<256> doc;
  const DeserializationError err = deserializeJson(doc, body, DeserializationOption::Filter(filter));
  if (err) return false;

  const char* state = doc[kStatusField];
  if (!state) return false;

  const std::string s(state);
  if (s == "locked") {
    out = LockState::locked;
    return true;
  }
  if (s == "unlocked") {
    out = LockState::unlocked;
    return true;
  }
  return false;
}

DeviceStatus DeviceClient::getStatus(const std::string& deviceId) {
  DeviceStatus st;
  st.id = deviceId;

  const HttpHeaders headers{{"x-api-key", cfg_.api_key}};
#if APP_VERBOSE_LOG
  Log::debug(kTag, "GET status %s", deviceId.c_str());
#endif
  const HttpResponse r = http_.get(cfg_.api_base_url + "/" + deviceId, headers);

  if (r.transportError()) {
    Log::error(kTag, "status %s: connection failed: %s", deviceId.c_str(), r.body.c_str());
    return st;
  }
  if (r.status != 200) {
    Log::error(kTag, "status %s: HTTP %d - %s", deviceId.c_str(), r.status, clip(r.body).c_str());
    return st;
  }
  if (!parseLockState(r.body, st.state)) {
    st.state = LockState::unknown;
    Log::error(kTag, "status %s: no usable %s in %s", deviceId.c_str(), kStatusField, clip(r.body).c_str());
    return st;
  }

#if APP_VERBOSE_LOG
  Log::debug(kTag, "status %s: %s", deviceId.c_str(), toString(st.state));
#endif
  return st;
}

std::string DeviceClient::encodeCommand(const Command& cmd) const {
  DynamicJsonDocument doc(JSON_OBJECT_SIZE(3) + cmd.history.size() + cmd.signature.size() + 16);
  doc["cmd"] = static_cast<int>(cmd.type);
  doc["history"] = cmd.history;
  doc["sign"] = cmd.signature;

  std::string out;
  serializeJson(doc, out);
  return out;
}

bool DeviceClient::sendLockCommand(const std::string& deviceId, const std::string& secretHex) {
  Command cmd;
  cmd.type = CommandType::lock;
  cmd.history = historyB64_;

  const SignError signErr = signer_.sign(secretHex, cmd.signature);
  if (signErr != SignError::none) {
    Log::error(kTag, "lock %s: cannot sign command (%s)", deviceId.c_str(), toString(signErr));
    return false;
  }

  Log::info(kTag, "lock %s: {cmd: %d, history: '%s', sign: '%.10s...'}",
            deviceId.c_str(), static_cast<int>(cmd.type), cmd.history.c_str(), cmd.signature.c_str());

  const HttpHeaders headers{
    {"x-api-key", cfg_.api_key},
    {"Content-Type", "application/json"},
  };
  const HttpResponse r = http_.post(cfg_.api_base_url + "/" + deviceId + "/cmd", headers, encodeCommand(cmd));

  if (r.transportError()) {
    Log::error(kTag, "lock %s: connection failed: %s", deviceId.c_str(), r.body.c_str());
    return false;
  }
  if (r.status != 200) {
    Log::error(kTag, "lock %s: HTTP %d - %s", deviceId.c_str(), r.status, clip(r.body).c_str());
    return false;
  }

  Log::info(kTag, "lock %s: accepted", deviceId.c_str());
  return true;
}

std::vector<DeviceStatus> DeviceClient::getStatuses(const std::vector<DeviceConfig>& devices) {
  std::vector<DeviceStatus> out(devices.size());
  std::vector<FanOut::Job> jobs;
  jobs.reserve(devices.size());
  for (size_t i = 0; i < devices.size(); ++i) {
    jobs.push_back([this, &devices, &out, i]() {
      out[i] = getStatus(devices[i].id);
    });
  }
  FanOut::run(jobs);
  return out;
}

std::vector<LockOutcome> DeviceClient::lockAll(const std::vector<const DeviceConfig*>& devices) {
  std::vector<LockOutcome> out(devices.size());
  std::vector<FanOut::Job> jobs;
  jobs.reserve(devices.size());
  for (size_t i = 0; i < devices.size(); ++i) {
    jobs.push_back([this, &devices, &out, i]() {
      out[i].device = devices[i];
      out[i].ok = sendLockCommand(devices[i]->id, devices[i]->secret);
    });
  }
  FanOut::run(jobs);
  return out;
}
