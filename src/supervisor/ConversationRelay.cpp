#include "ConversationRelay.hpp"

#include "SupervisorErrors.hpp"

namespace aic {
ConversationRelay::ConversationRelay(shared_ptr<EventLoop> _loop,
                                     shared_ptr<ProcessSupervisor> _supervisor,
                                     shared_ptr<ConversationLog> _log)
    : loop(_loop), supervisor(_supervisor), log(_log) {}

string ConversationRelay::ask(const string& tool, const string& prompt) {
  auto process = supervisor->getProcess(tool);
  log->addUserMessage(tool, prompt);
  try {
    auto pending = process->send(prompt);
    string response = loop->waitFor(pending);
    log->addAssistantMessage(tool, response);
    return response;
  } catch (const SupervisorException& ex) {
    LOG(WARNING) << "Exchange with " << process->getDisplayName()
                 << " failed: " << ex.what();
    log->removeLastMessage();
    throw;
  }
}

ForwardPlan ConversationRelay::planForward(const string& fromTool,
                                           const string& toTool,
                                           const string& extraMessage) const {
  if (!fromTool.empty()) {
    supervisor->getProcess(fromTool);
  }
  ConversationMessage last;
  if (!log->getLastResponse(fromTool, &last)) {
    if (fromTool.empty()) {
      throw NothingToForwardError("No response to forward yet");
    }
    string name = supervisor->getProcess(fromTool)->getDisplayName();
    throw NothingToForwardError("No response from " + name + " to forward");
  }

  ForwardPlan plan;
  plan.fromTool = last.tool;
  plan.toTool = toTool;
  if (plan.toTool.empty()) {
    for (const auto& name : supervisor->getToolNames()) {
      if (name != plan.fromTool) {
        plan.toTool = name;
        break;
      }
    }
    if (plan.toTool.empty()) {
      throw ConfigurationError("No other tool to forward " + plan.fromTool +
                               "'s response to");
    }
  }
  supervisor->getProcess(plan.toTool);

  string fromDisplayName = supervisor->hasTool(plan.fromTool)
                               ? supervisor->getProcess(plan.fromTool)
                                     ->getDisplayName()
                               : plan.fromTool;
  plan.envelope = buildEnvelope(fromDisplayName, last.content, extraMessage);
  return plan;
}

string ConversationRelay::forward(const string& fromTool,
                                  const string& toTool,
                                  const string& extraMessage) {
  ForwardPlan plan = planForward(fromTool, toTool, extraMessage);
  LOG(INFO) << "Forwarding " << plan.fromTool << "'s response to "
            << plan.toTool;
  return ask(plan.toTool, plan.envelope);
}

string ConversationRelay::buildEnvelope(const string& fromDisplayName,
                                        const string& content,
                                        const string& extraMessage) {
  string envelope = "Another AI assistant (" + fromDisplayName +
                    ") provided this response. Please review and share "
                    "your thoughts:\n\n---\n" +
                    content + "\n---";
  if (!extraMessage.empty()) {
    envelope += "\n\nAdditional context: " + extraMessage;
  }
  return envelope;
}
}  // namespace aic
