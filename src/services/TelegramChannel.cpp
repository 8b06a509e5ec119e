#include "services/TelegramChannel.h"

#include <stdlib.h>

#include "services/Logger.h"

namespace {

constexpr const char* kTag = "CHAT";
constexpr size_t kMarkupMemory = 8;
constexpr int kUpdateBatch = 10;

long long toId(const std::string& s) {
  if (s.empty()) return 0;
  char* end = nullptr;
  const long long v = strtoll(s.c_str(), &end, 10);
  return (end && *end == '\0') ? v : 0;
}

void statusFilter(JsonDocument& filter) {
  filter["ok"] = true;
  filter["description"] = true;
  filter["error_code"] = true;
}

} // namespace

TelegramChannel::TelegramChannel(HttpTransport& http, const Config& cfg, const std::string& apiBase)
: http_(http), cfg_(cfg), apiBase_(apiBase) {
  while (!apiBase_.empty() && apiBase_[apiBase_.size() - 1] == '/') apiBase_.erase(apiBase_.size() - 1);
}

std::string TelegramChannel::escapeHtml(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    switch (c) {
      case '&': out += "&amp;"; break;
      case '<': out += "&lt;"; break;
      case '>': out += "&gt;"; break;
      default:  out += c; break;
    }
  }
  return out;
}

std::string TelegramChannel::renderNotice(const ChatNotice& notice) {
  std::string text = "<b>" + escapeHtml(notice.title) + "</b>\n" + escapeHtml(notice.description);
  if (!notice.items.empty()) text += "\n";
  for (const auto& item : notice.items) {
    text += "\n\xE2\x80\xA2 <b>" + escapeHtml(item) + "</b>";
  }
  return text;
}

std::string TelegramChannel::keyboard(const std::string& label, const std::string& actionId) {
  DynamicJsonDocument doc(JSON_OBJECT_SIZE(1) + 2 * JSON_ARRAY_SIZE(1) + JSON_OBJECT_SIZE(2) +
                          label.size() + actionId.size() + 16);
  JsonObject button = doc.createNestedArray("inline_keyboard").createNestedArray().createNestedObject();
  button["text"] = label;
  button["callback_data"] = actionId;

  std::string out;
  serializeJson(doc, out);
  return out;
}

ChatStatus TelegramChannel::classify(int httpStatus, const std::string& description) {
  // Re-applying identical markup is how the existence probe succeeds.
  if (description.find("message is not modified") != std::string::npos) return ChatStatus::ok;
  if (httpStatus == 401) return ChatStatus::unauthorized;
  if (httpStatus == 403) return ChatStatus::forbidden;
  if (httpStatus == 404 || description.find("not found") != std::string::npos) return ChatStatus::not_found;
  if (httpStatus <= 0) return ChatStatus::transport_error;
  return ChatStatus::api_error;
}

ChatStatus TelegramChannel::call(const char* method, const JsonDocument& payload, JsonDocument& result,
                                 const JsonDocument& filter) {
  std::string body;
  serializeJson(payload, body);

  const HttpHeaders headers{{"Content-Type", "application/json"}};
  // The token is part of the URL; only the method name is ever logged.
  const HttpResponse r = http_.post(apiBase_ + "/bot" + cfg_.bot_token + "/" + method, headers, body);

  if (r.transportError()) {
    Log::warn(kTag, "%s: connection failed: %s", method, r.body.c_str());
    return ChatStatus::transport_error;
  }

  const DeserializationError err = deserializeJson(result, r.body, DeserializationOption::Filter(filter));
  if (err) {
    if (r.status == 401) {
      Log::error(kTag, "%s: bot token rejected (HTTP 401)", method);
      return ChatStatus::unauthorized;
    }
    Log::warn(kTag, "%s: HTTP %d with unreadable body (%s)", method, r.status, err.c_str());
    return ChatStatus::api_error;
  }
  if (r.status == 200 && result["ok"].as<bool>()) return ChatStatus::ok;

  const std::string description = result["description"] | "";
  const ChatStatus st = classify(r.status, description);
  switch (st) {
    case ChatStatus::unauthorized:
      // Also the path taken when the token is revoked while running.
      Log::error(kTag, "%s: bot token rejected (HTTP %d)", method, r.status);
      break;
    case ChatStatus::api_error:
      Log::warn(kTag, "%s: HTTP %d - %s", method, r.status, description.c_str());
      break;
    default:
#if APP_VERBOSE_LOG
      Log::debug(kTag, "%s: %s (%s)", method, toString(st), description.c_str());
#endif
      break;
  }
  return st;
}

ChatStatus TelegramChannel::connect() {
  DynamicJsonDocument payload(JSON_OBJECT_SIZE(0) + 8);
  payload.to<JsonObject>();

  StaticJsonDocument<192> filter;
  statusFilter(filter);
  filter["result"]["username"] = true;

  StaticJsonDocument<384> result;
  const ChatStatus st = call("getMe", payload, result, filter);
  if (st != ChatStatus::ok) {
    ready_ = false;
    if (st != ChatStatus::unauthorized) Log::warn(kTag, "cannot reach the bot API (%s)", toString(st));
    return st;
  }

  botName_ = result["result"]["username"] | "";
  ready_ = true;
  Log::info(kTag, "connected as @%s, chat %lld", botName_.c_str(), (long long)cfg_.chat_id);
  return st;
}

ChatStatus TelegramChannel::sendNotice(const ChatNotice& notice, std::string& outMessageId) {
  const std::string text = renderNotice(notice);
  const std::string markup = keyboard(notice.action_label, notice.action_id);

  DynamicJsonDocument payload(JSON_OBJECT_SIZE(5) + text.size() + markup.size() + 64);
  payload["chat_id"] = (long long)cfg_.chat_id;
  payload["text"] = text;
  payload["parse_mode"] = "HTML";
  payload["reply_markup"] = serialized(markup);

  StaticJsonDocument<256> filter;
  statusFilter(filter);
  filter["result"]["message_id"] = true;

  StaticJsonDocument<512> result;
  const ChatStatus st = call("sendMessage", payload, result, filter);
  if (st != ChatStatus::ok) return st;

  const long long id = result["result"]["message_id"] | 0LL;
  if (id <= 0) {
    Log::warn(kTag, "sendMessage: reply carried no message id");
    return ChatStatus::api_error;
  }

  outMessageId = std::to_string(id);
  pinned_ = outMessageId;
  rememberMarkup(outMessageId, markup);
#if APP_VERBOSE_LOG
  Log::debug(kTag, "notice posted as message %s", outMessageId.c_str());
#endif
  return st;
}

ChatStatus TelegramChannel::editMarkup(const std::string& messageId, const std::string& markup) {
  const long long id = toId(messageId);
  if (id <= 0) return ChatStatus::not_found;

  DynamicJsonDocument payload(JSON_OBJECT_SIZE(3) + markup.size() + 32);
  payload["chat_id"] = (long long)cfg_.chat_id;
  payload["message_id"] = id;
  payload["reply_markup"] = serialized(markup);

  StaticJsonDocument<128> filter;
  statusFilter(filter);

  StaticJsonDocument<512> result;
  return call("editMessageReplyMarkup", payload, result, filter);
}

ChatStatus TelegramChannel::fetchMessage(const std::string& messageId) {
  // No fetch-by-id in the Bot API; an edit to identical markup fails with
  // "not modified" while the message exists and "not found" once deleted.
  const std::string* markup = markupFor(messageId);
  if (!markup) {
    Log::warn(kTag, "no markup on record for message %s", messageId.c_str());
    return ChatStatus::api_error;
  }
  return editMarkup(messageId, *markup);
}

ChatStatus TelegramChannel::disableAction(const std::string& messageId, const std::string& label) {
  const std::string markup = keyboard(label, kInertActionId);
  const ChatStatus st = editMarkup(messageId, markup);
  if (st == ChatStatus::ok) rememberMarkup(messageId, markup);
  return st;
}

ChatStatus TelegramChannel::acknowledge(const Interaction& in, const std::string& text) {
  DynamicJsonDocument payload(JSON_OBJECT_SIZE(2) + in.id.size() + text.size() + 32);
  payload["callback_query_id"] = in.id;
  payload["text"] = text;

  StaticJsonDocument<128> filter;
  statusFilter(filter);

  StaticJsonDocument<512> result;
  return call("answerCallbackQuery", payload, result, filter);
}

ChatStatus TelegramChannel::sendText(const std::string& chatId, const std::string& text, long long replyTo) {
  DynamicJsonDocument payload(JSON_OBJECT_SIZE(4) + chatId.size() + text.size() + 64);
  payload["chat_id"] = chatId;
  payload["text"] = text;
  if (replyTo > 0) {
    payload["reply_to_message_id"] = replyTo;
    payload["allow_sending_without_reply"] = true;
  }

  StaticJsonDocument<128> filter;
  statusFilter(filter);

  StaticJsonDocument<512> result;
  return call("sendMessage", payload, result, filter);
}

ChatStatus TelegramChannel::replyPrivately(const Interaction& in, const std::string& text) {
  const ChatStatus st = sendText(in.user_id, text, 0);
  if (st != ChatStatus::forbidden && st != ChatStatus::not_found) return st;

  // Bots may only message users who started a conversation with them.
  Log::info(kTag, "cannot message %s directly, replying under the notice", in.user_name.c_str());
  const std::string chat = in.chat_id.empty() ? std::to_string((long long)cfg_.chat_id) : in.chat_id;
  return sendText(chat, in.user_name + ": " + text, toId(in.message_id));
}

ChatStatus TelegramChannel::pollInteractions(std::vector<Interaction>& out) {
  StaticJsonDocument<256> payload;
  payload["offset"] = nextUpdateId_;
  payload["timeout"] = 0;
  payload["limit"] = kUpdateBatch;
  payload.createNestedArray("allowed_updates").add("callback_query");

  StaticJsonDocument<768> filter;
  statusFilter(filter);
  filter["result"][0]["update_id"] = true;
  JsonObject q = filter["result"][0].createNestedObject("callback_query");
  q["id"] = true;
  q["data"] = true;
  JsonObject from = q.createNestedObject("from");
  from["id"] = true;
  from["username"] = true;
  from["first_name"] = true;
  JsonObject message = q.createNestedObject("message");
  message["message_id"] = true;
  message.createNestedObject("chat")["id"] = true;

  DynamicJsonDocument result(6144);
  const ChatStatus st = call("getUpdates", payload, result, filter);
  if (st != ChatStatus::ok) return st;

  for (JsonObject update : result["result"].as<JsonArray>()) {
    const long long updateId = update["update_id"] | 0LL;
    if (updateId >= nextUpdateId_) nextUpdateId_ = updateId + 1;

    JsonObject query = update["callback_query"];
    if (query.isNull()) continue;

    const long long chat = query["message"]["chat"]["id"] | 0LL;
    const long long messageId = query["message"]["message_id"] | 0LL;
    if (chat != (long long)cfg_.chat_id || messageId <= 0) {
      Log::warn(kTag, "ignoring press from chat %lld", chat);
      continue;
    }

    Interaction in;
    in.id = query["id"] | "";
    in.action_id = query["data"] | "";
    in.message_id = std::to_string(messageId);
    in.chat_id = std::to_string(chat);
    in.user_id = std::to_string(query["from"]["id"] | 0LL);

    const char* username = query["from"]["username"];
    const char* firstName = query["from"]["first_name"];
    if (username && *username) {
      in.user_name = std::string("@") + username;
    } else if (firstName && *firstName) {
      in.user_name = firstName;
    } else {
      in.user_name = in.user_id;
    }

#if APP_VERBOSE_LOG
    Log::debug(kTag, "press '%s' on message %s by %s", in.action_id.c_str(), in.message_id.c_str(),
               in.user_name.c_str());
#endif
    out.push_back(in);
  }
  return st;
}

void TelegramChannel::rememberMarkup(const std::string& messageId, const std::string& markup) {
  for (auto it = markups_.begin(); it != markups_.end(); ++it) {
    if (it->first == messageId) {
      markups_.erase(it);
      break;
    }
  }
  if (markups_.size() >= kMarkupMemory) {
    auto oldest = markups_.begin();
    if (oldest->first == pinned_) ++oldest;
    markups_.erase(oldest);
  }
  markups_.push_back(std::make_pair(messageId, markup));
}

const std::string* TelegramChannel::markupFor(const std::string& messageId) const {
  for (const auto& entry : markups_) {
    if (entry.first == messageId) return &entry.second;
  }
  return nullptr;
}
