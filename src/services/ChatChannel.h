#pragma once

#include <string>
#include <vector>

enum class ChatStatus {
  ok,
  not_found,
  forbidden,
  unauthorized,
  transport_error,
  api_error
};

static inline const char* toString(ChatStatus s) {
  switch (s) {
    case ChatStatus::ok:              return "ok";
    case ChatStatus::not_found:       return "not_found";
    case ChatStatus::forbidden:       return "forbidden";
    case ChatStatus::unauthorized:    return "unauthorized";
    case ChatStatus::transport_error: return "transport_error";
    case ChatStatus::api_error:       return "api_error";
    default:                          return "unknown";
  }
}

// Action id carried by a control after disableAction(); presses are no-ops.
constexpr const char* kInertActionId = "done";

// A message with exactly one action control.
struct ChatNotice {
  std::string title;
  std::string description;
  std::vector<std::string> items;
  std::string action_label;
  std::string action_id;
};

// A user pressed an action control.
struct Interaction {
  std::string id;
  std::string action_id;
  std::string message_id;
  std::string chat_id;
  std::string user_id;
  std::string user_name;
};

class ChatChannel {
public:
  virtual ~ChatChannel() = default;

  virtual bool ready() const = 0;

  virtual ChatStatus sendNotice(const ChatNotice& notice, std::string& outMessageId) = 0;
  // ok while the message exists, not_found once it was deleted.
  virtual ChatStatus fetchMessage(const std::string& messageId) = 0;
  virtual ChatStatus disableAction(const std::string& messageId, const std::string& label) = 0;

  virtual ChatStatus acknowledge(const Interaction& in, const std::string& text) = 0;
  virtual ChatStatus replyPrivately(const Interaction& in, const std::string& text) = 0;
};
