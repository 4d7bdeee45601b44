#ifndef __AIC_CONVERSATION_LOG_HPP__
#define __AIC_CONVERSATION_LOG_HPP__

#include "Headers.hpp"

namespace aic {
struct ConversationMessage {
  enum Role { USER, ASSISTANT };

  Role role;
  /** @brief The tool the message was sent to or came from. */
  string tool;
  string content;
  std::chrono::system_clock::time_point timestamp;
};

/**
 * @brief Append-only record of everything said to and by the tools.
 */
class ConversationLog {
 public:
  // Longest content shown per entry by formatHistory()
  static constexpr size_t HISTORY_PREVIEW_LENGTH = 200;

  ConversationLog() {}

  void addUserMessage(const string& tool, const string& content);
  void addAssistantMessage(const string& tool, const string& content);

  /**
   * @brief Finds the newest assistant message, from `tool` or from any tool
   * if `tool` is empty.
   * @return false if there is none.
   */
  bool getLastResponse(const string& tool, ConversationMessage* out) const;

  /** @brief Rolls back the newest message.  Returns false if empty. */
  bool removeLastMessage();

  void clear() { messages.clear(); }

  const vector<ConversationMessage>& getMessages() const { return messages; }
  size_t size() const { return messages.size(); }
  bool empty() const { return messages.empty(); }

  /**
   * @brief Numbered, timestamped listing with each message cut to
   * `previewLength` characters.
   */
  string formatHistory(size_t previewLength = HISTORY_PREVIEW_LENGTH) const;

 protected:
  void add(ConversationMessage::Role role, const string& tool,
           const string& content);

  vector<ConversationMessage> messages;
};
}  // namespace aic

#endif  // __AIC_CONVERSATION_LOG_HPP__
