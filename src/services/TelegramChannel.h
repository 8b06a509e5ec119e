#pragma once

#include <stdint.h>
#include <string>
#include <utility>
#include <vector>

#include <ArduinoJson.h>

#include "app/Config.h"
#include "services/ChatChannel.h"
#include "services/HttpTransport.h"

// Telegram Bot API over plain HTTPS calls. Button presses are pulled with
// getUpdates, so no inbound connection is needed.
class TelegramChannel : public ChatChannel {
public:
  TelegramChannel(HttpTransport& http, const Config& cfg, const std::string& apiBase);

  // getMe; unauthorized means the token is wrong and retrying is pointless.
  ChatStatus connect();
  bool ready() const override { return ready_; }
  const std::string& botName() const { return botName_; }

  ChatStatus sendNotice(const ChatNotice& notice, std::string& outMessageId) override;
  ChatStatus fetchMessage(const std::string& messageId) override;
  ChatStatus disableAction(const std::string& messageId, const std::string& label) override;

  ChatStatus acknowledge(const Interaction& in, const std::string& text) override;
  ChatStatus replyPrivately(const Interaction& in, const std::string& text) override;

  // Button presses since the last call. Presses from other chats are dropped.
  ChatStatus pollInteractions(std::vector<Interaction>& out);

  static std::string escapeHtml(const std::string& s);
  static std::string renderNotice(const ChatNotice& notice);
  static std::string keyboard(const std::string& label, const std::string& actionId);
  static ChatStatus classify(int httpStatus, const std::string& description);

private:
  HttpTransport& http_;
  const Config& cfg_;
  std::string apiBase_;

  bool ready_ = false;
  std::string botName_;
  long long nextUpdateId_ = 0;

  // message id -> markup last applied, newest last
  std::vector<std::pair<std::string, std::string>> markups_;
  // Latest notice; its markup is never evicted so the probe keeps working.
  std::string pinned_;

  ChatStatus call(const char* method, const JsonDocument& payload, JsonDocument& result, const JsonDocument& filter);
  ChatStatus editMarkup(const std::string& messageId, const std::string& markup);
  ChatStatus sendText(const std::string& chatId, const std::string& text, long long replyTo);

  void rememberMarkup(const std::string& messageId, const std::string& markup);
  const std::string* markupFor(const std::string& messageId) const;
};
