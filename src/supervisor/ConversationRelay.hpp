#ifndef __AIC_CONVERSATION_RELAY_HPP__
#define __AIC_CONVERSATION_RELAY_HPP__

#include "ConversationLog.hpp"
#include "EventLoop.hpp"
#include "Headers.hpp"
#include "ProcessSupervisor.hpp"

namespace aic {
/**
 * @brief A resolved forward: who wrote it, who gets it, and what is sent.
 */
struct ForwardPlan {
  string fromTool;
  string toTool;
  string envelope;
};

/**
 * @brief Sends messages to tools and passes one tool's answer to another.
 */
class ConversationRelay {
 public:
  ConversationRelay(shared_ptr<EventLoop> _loop,
                    shared_ptr<ProcessSupervisor> _supervisor,
                    shared_ptr<ConversationLog> _log);

  /**
   * @brief Sends `prompt` to `tool` and waits for the response.
   *
   * The exchange is logged only if it succeeds; on failure the user message
   * is rolled back before the error propagates.
   * @throws ConfigurationError for an unknown tool, NotReadyError,
   * ProcessExitedError or ChannelIOError from the send.
   */
  string ask(const string& tool, const string& prompt);

  /**
   * @brief Works out a forward without touching any process.
   *
   * An empty `fromTool` means the newest response of any tool.  An empty
   * `toTool` means the first registered tool other than the source.
   * @throws NothingToForwardError if there is no response to forward.
   */
  ForwardPlan planForward(const string& fromTool, const string& toTool,
                          const string& extraMessage) const;

  /** @brief Asks the target tool to review the source tool's last answer. */
  string forward(const string& fromTool, const string& toTool,
                 const string& extraMessage = "");

  static string buildEnvelope(const string& fromDisplayName,
                              const string& content,
                              const string& extraMessage);

 protected:
  shared_ptr<EventLoop> loop;
  shared_ptr<ProcessSupervisor> supervisor;
  shared_ptr<ConversationLog> log;
};
}  // namespace aic

#endif  // __AIC_CONVERSATION_RELAY_HPP__
