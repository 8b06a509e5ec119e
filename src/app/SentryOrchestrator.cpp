#include "app/SentryOrchestrator.h"

#include <vector>

#include "app/ConfigLoader.h"
#include "app/MqttConfig.h"
#include "app/SentryConfig.h"
#include "drivers/NetworkDriver.h"
#include "services/Logger.h"

namespace {

constexpr const char* kTag = "APP";
constexpr size_t kConsoleLineMax = 512;

void serialSink(LogLevel level, const char* tag, const char* msg) {
  Serial.printf("[%s] %s: %s\n", tag, toString(level), msg);
}

} // namespace

SentryOrchestrator::Runtime::Runtime(HttpTransport& http, const Config& cfg, const SignatureGenerator& signer)
: chat(http, cfg, TELEGRAM_API_BASE_URL),
  client(http, cfg, signer),
  notices(chat, cfg),
  poll(cfg, client, notices),
  lockAll(cfg, client, notices, chat) {}

SentryOrchestrator::SentryOrchestrator()
: http_(HTTPS_ROOT_CA), signer_(&NetworkDriver::unixTime) {}

void SentryOrchestrator::begin() {
  Log::setSink(serialSink);
  settings_.begin();

  std::vector<std::string> errors;
  if (!ConfigLoader::load(settings_.load(), cfg_, errors)) {
    for (const auto& e : errors) Log::error(kTag, "%s", e.c_str());
    Log::error(kTag, "not configured; set the values above on the console and restart (type 'help')");
    return;
  }

  rt_ = std::make_unique<Runtime>(http_, cfg_, signer_);
  NetworkDriver::initWifiSta();
  mqtt_.begin();
  Log::info(kTag, "watching %u device(s)", (unsigned)cfg_.devices.size());
}

void SentryOrchestrator::tick(uint32_t nowMs) {
  pollConsole();
  if (!rt_) return;

  updateNetwork(nowMs);
  mqtt_.update(nowMs);
  if (!NetworkDriver::wifiConnected() || chatDisabled_) return;

  if (!rt_->chat.ready()) {
    connectChat(nowMs);
    return;
  }

  if (!rt_->poll.started()) {
    // Signatures are only accepted inside the vendor's time window.
    if (!NetworkDriver::timeSynced()) return;
    rt_->poll.start(nowMs);
    nextUpdatesMs_ = nowMs;
  }

  pollInteractions(nowMs);
  if (rt_->poll.tick(nowMs)) publishStatus("poll");
}

void SentryOrchestrator::updateNetwork(uint32_t nowMs) {
  NetworkDriver::tryConnectWifi(nowMs, nextWifiRetryMs_, WIFI_RECONNECT_MS);
  if (!NetworkDriver::wifiConnected()) return;

  if (!timeSyncStarted_) {
    timeSyncStarted_ = true;
    Log::info(kTag, "wifi up, ip %s", WiFi.localIP().toString().c_str());
    NetworkDriver::startTimeSync();
  }
  if (!timeSyncLogged_ && NetworkDriver::timeSynced()) {
    timeSyncLogged_ = true;
    Log::info(kTag, "clock synced, unix %lu", (unsigned long)NetworkDriver::unixTime());
  }
}

void SentryOrchestrator::connectChat(uint32_t nowMs) {
  if ((int32_t)(nowMs - nextChatRetryMs_) < 0) return;
  nextChatRetryMs_ = nowMs + CHAT_RETRY_MS;

  const ChatStatus st = rt_->chat.connect();
  if (st == ChatStatus::unauthorized) {
    chatDisabled_ = true;
    Log::error(kTag, "stopping: fix TELEGRAM_BOT_TOKEN on the console and restart");
  }
}

void SentryOrchestrator::pollInteractions(uint32_t nowMs) {
  if ((int32_t)(nowMs - nextUpdatesMs_) < 0) return;
  nextUpdatesMs_ = nowMs + TELEGRAM_POLL_MS;

  std::vector<Interaction> presses;
  const ChatStatus st = rt_->chat.pollInteractions(presses);
  if (st == ChatStatus::unauthorized) {
    chatDisabled_ = true;
    Log::error(kTag, "bot token revoked, button presses stop; fix TELEGRAM_BOT_TOKEN on the console and restart");
    return;
  }
  for (const auto& in : presses) dispatch(in);
}

void SentryOrchestrator::dispatch(const Interaction& in) {
  if (in.action_id == kInertActionId) {
    rt_->chat.acknowledge(in, "Already handled");
    return;
  }
  if (in.action_id != Actions::kLockAll) {
    Log::warn(kTag, "unknown action '%s' from %s", in.action_id.c_str(), in.user_name.c_str());
    rt_->chat.acknowledge(in, "Unknown action");
    return;
  }

  LockAllReport report;
  if (rt_->lockAll.handle(in, report)) {
    mqtt_.publishAck(in.user_name, report);
  }
}

void SentryOrchestrator::publishStatus(const char* reason) {
  const std::string pending = rt_->notices.hasPending() ? rt_->notices.pending().message_id : std::string();
  mqtt_.publishStatus(rt_->poll.lastSnapshot(), cfg_, pending, reason);
}

void SentryOrchestrator::pollConsole() {
  while (Serial.available()) {
    const char c = (char)Serial.read();
    if (c == '\r') continue;
    if (c != '\n') {
      if (consoleLine_.size() < kConsoleLineMax) consoleLine_ += c;
      continue;
    }
    const ConsoleCommand cmd = parseConsoleLine(consoleLine_);
    consoleLine_.clear();
    runConsole(cmd);
  }
}

void SentryOrchestrator::runConsole(const ConsoleCommand& cmd) {
  switch (cmd.op) {
    case ConsoleOp::none:
      return;
    case ConsoleOp::help:
      printHelp();
      return;
    case ConsoleOp::show:
      printSettings();
      return;
    case ConsoleOp::restart:
      Serial.println("restarting");
      Serial.flush();
      ESP.restart();
      return;
    case ConsoleOp::invalid:
      Serial.print("error: ");
      Serial.println(cmd.error.c_str());
      return;
    case ConsoleOp::set:
    case ConsoleOp::clear:
      break;
  }

  const SettingSpec* spec = Settings::find(cmd.key);
  if (!spec) return;

  const bool ok = cmd.op == ConsoleOp::set ? settings_.put(*spec, cmd.value) : settings_.remove(*spec);
  if (!ok) {
    Serial.println("error: settings storage unavailable");
    return;
  }
  Serial.print(cmd.op == ConsoleOp::set ? "saved " : "cleared ");
  Serial.print(spec->key);
  Serial.println("; restart to apply");
}

void SentryOrchestrator::printHelp() const {
  Serial.println();
  Serial.println("=== LOCK SENTRY CONSOLE ===");
  Serial.println("set KEY value   store a setting");
  Serial.println("clear KEY       drop a stored setting (build default applies)");
  Serial.println("show            list settings, secrets masked");
  Serial.println("restart         reboot and load settings");
  Serial.println();
}

void SentryOrchestrator::printSettings() {
  const RawSettings raw = settings_.load();
  size_t count = 0;
  const SettingSpec* specs = Settings::all(count);
  for (size_t i = 0; i < count; ++i) {
    const std::string value = raw.get(specs[i].key);
    Serial.print(specs[i].key);
    Serial.print(" = ");
    Serial.print(specs[i].secret ? Settings::mask(value).c_str() : value.c_str());
    Serial.println(settings_.isStored(specs[i]) ? "  (stored)" : "");
  }
}
