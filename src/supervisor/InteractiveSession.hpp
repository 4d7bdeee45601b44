#ifndef __AIC_INTERACTIVE_SESSION_HPP__
#define __AIC_INTERACTIVE_SESSION_HPP__

#include "AttachController.hpp"
#include "Console.hpp"
#include "ConversationLog.hpp"
#include "ConversationRelay.hpp"
#include "EventLoop.hpp"
#include "Headers.hpp"
#include "ProcessSupervisor.hpp"
#include "SessionStore.hpp"

namespace aic {
/**
 * @brief The line-oriented prompt the user talks to between attaches.
 *
 * Plain lines go to the active tool.  Lines starting with `//` are
 * commands: `//<tool>`, `//i`, `//forward [msg]`, `//history`, `//status`,
 * `//clear`, `//help` and `//quit`.
 */
class InteractiveSession {
 public:
  InteractiveSession(shared_ptr<EventLoop> _loop,
                     shared_ptr<ProcessSupervisor> _supervisor,
                     shared_ptr<ConversationRelay> _relay,
                     shared_ptr<AttachController> _attachController,
                     shared_ptr<ConversationLog> _log,
                     shared_ptr<Console> _console,
                     shared_ptr<SessionStore> _store);
  virtual ~InteractiveSession();

  /**
   * @brief Reads and handles lines until the user quits or input ends, then
   * stops every tool.
   * @return The process exit status.
   */
  int run();

  /**
   * @brief Handles one input line.
   * @return false once the user asked to quit.
   */
  bool handleLine(const string& line);

  /** @brief Removes terminal focus in/out reports from a line. */
  static string stripFocusSequences(const string& line);

  /** @brief Persists the session flags and the active tool. */
  void saveState();

 protected:
  bool handleCommand(const string& command, const string& argument);
  void askActive(const string& prompt);
  void forwardLastResponse(const string& extraMessage);
  void attachActive();
  void printStatus();
  void printHelp();
  void printBanner();
  void print(const string& text);

  void watchInput();
  void unwatchInput();
  void onInput();

  /** @brief The active tool, falling back to the first registered one. */
  string currentTool();

  shared_ptr<EventLoop> loop;
  shared_ptr<ProcessSupervisor> supervisor;
  shared_ptr<ConversationRelay> relay;
  shared_ptr<AttachController> attachController;
  shared_ptr<ConversationLog> log;
  shared_ptr<Console> console;
  shared_ptr<SessionStore> store;

  /** @brief Bytes read from the console that do not yet end in a newline. */
  string partialLine;
  deque<string> pendingLines;
  bool inputClosed;
  bool quitRequested;
};
}  // namespace aic

#endif  // __AIC_INTERACTIVE_SESSION_HPP__
