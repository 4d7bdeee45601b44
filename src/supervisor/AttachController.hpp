#ifndef __AIC_ATTACH_CONTROLLER_HPP__
#define __AIC_ATTACH_CONTROLLER_HPP__

#include "Console.hpp"
#include "ConversationLog.hpp"
#include "EventLoop.hpp"
#include "Headers.hpp"
#include "ProcessSupervisor.hpp"

namespace aic {
/**
 * @brief How an attach session ended.
 */
struct AttachResult {
  enum Outcome { DETACHED, PROCESS_EXITED };

  Outcome outcome;
  /** @brief True if the capture was stored as an assistant message. */
  bool captureSaved;
  /** @brief Exit code when the tool died while attached, else -1. */
  int exitCode;
};

/**
 * @brief Hands the real terminal to one tool until the user detaches.
 *
 * While attached, keystrokes go straight to the tool's pty (except the
 * detach key, which is never forwarded) and the tool's output is both drawn
 * on the terminal and captured.  Only one attach can run at a time.
 */
class AttachController {
 public:
  // How often the real terminal's size is compared with the pty's
  static constexpr int64_t RESIZE_POLL_MS = 100;

  AttachController(shared_ptr<EventLoop> _loop,
                   shared_ptr<ProcessSupervisor> _supervisor,
                   shared_ptr<Console> _console,
                   shared_ptr<ConversationLog> _log);

  /**
   * @brief Starts `tool` if needed, makes it active and interactive, and
   * pumps the event loop until detach or exit.
   * @throws TerminalBusyError if an attach is already running.
   * @throws ConfigurationError for an unknown tool.
   */
  AttachResult attach(const string& tool);

  bool isAttached() const { return !attachedTool.empty(); }
  const string& getAttachedTool() const { return attachedTool; }

  /** @brief Raw bytes the tool printed during the most recent attach. */
  const string& getLastCapture() const { return capture; }

 protected:
  void onConsoleInput(ManagedProcess* process);
  void pollTerminalSize(ManagedProcess* process);

  shared_ptr<EventLoop> loop;
  shared_ptr<ProcessSupervisor> supervisor;
  shared_ptr<Console> console;
  shared_ptr<ConversationLog> log;

  string attachedTool;
  string capture;
  bool detachRequested;
  bool processExited;
  /** @brief A failure while forwarding input, rethrown once detached. */
  std::exception_ptr inputError;
  int exitCode;
  TerminalSize lastSize;
  EventLoop::TimerId resizeTimer;
};
}  // namespace aic

#endif  // __AIC_ATTACH_CONTROLLER_HPP__
