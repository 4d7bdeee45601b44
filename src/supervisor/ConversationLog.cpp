#include "ConversationLog.hpp"

namespace aic {
void ConversationLog::addUserMessage(const string& tool,
                                     const string& content) {
  add(ConversationMessage::USER, tool, content);
}

void ConversationLog::addAssistantMessage(const string& tool,
                                          const string& content) {
  add(ConversationMessage::ASSISTANT, tool, content);
}

void ConversationLog::add(ConversationMessage::Role role, const string& tool,
                          const string& content) {
  ConversationMessage message;
  message.role = role;
  message.tool = tool;
  message.content = content;
  message.timestamp = std::chrono::system_clock::now();
  messages.push_back(message);
  VLOG(2) << "Logged " << (role == ConversationMessage::USER ? "user" : "tool")
          << " message for " << tool << " (" << content.length() << " chars)";
}

bool ConversationLog::getLastResponse(const string& tool,
                                      ConversationMessage* out) const {
  for (auto it = messages.rbegin(); it != messages.rend(); ++it) {
    if (it->role != ConversationMessage::ASSISTANT) {
      continue;
    }
    if (!tool.empty() && it->tool != tool) {
      continue;
    }
    *out = *it;
    return true;
  }
  return false;
}

bool ConversationLog::removeLastMessage() {
  if (messages.empty()) {
    return false;
  }
  messages.pop_back();
  return true;
}

string ConversationLog::formatHistory(size_t previewLength) const {
  if (messages.empty()) {
    return "No messages in session.";
  }
  std::ostringstream ss;
  for (size_t a = 0; a < messages.size(); a++) {
    const auto& m = messages[a];
    if (a) {
      ss << "\n\n";
    }
    time_t t = std::chrono::system_clock::to_time_t(m.timestamp);
    struct tm local;
    localtime_r(&t, &local);
    char timeBuf[16];
    strftime(timeBuf, sizeof(timeBuf), "%H:%M:%S", &local);

    string preview = m.content;
    if (preview.length() > previewLength) {
      // Never cut a multibyte UTF-8 character in half
      size_t cut = previewLength;
      while (cut > 0 && (preview[cut] & 0xC0) == 0x80) {
        cut--;
      }
      preview = preview.substr(0, cut) + "...";
    }
    ss << "[" << (a + 1) << "] " << timeBuf << " - "
       << (m.role == ConversationMessage::USER ? string("You") : m.tool)
       << ":\n"
       << preview;
  }
  return ss.str();
}
}  // namespace aic
