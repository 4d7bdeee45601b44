#ifndef __AIC_FORK_PTY_CHANNEL_HPP__
#define __AIC_FORK_PTY_CHANNEL_HPP__

#include "EventLoop.hpp"
#include "Headers.hpp"
#include "PtyChannel.hpp"

namespace aic {
/**
 * @brief PtyChannel that forks the tool with `forkpty` and watches the master
 * fd on the event loop.
 */
class ForkPtyChannel : public PtyChannel {
 public:
  // How long a tool gets to exit after SIGTERM before it is SIGKILLed
  static constexpr int64_t KILL_GRACE_MS = 1000;
  // How often a terminated child is checked for while it winds down
  static constexpr int64_t REAP_POLL_MS = 50;

  explicit ForkPtyChannel(shared_ptr<EventLoop> _loop);
  virtual ~ForkPtyChannel();

  virtual void spawn(const string& command, const vector<string>& args,
                     const string& cwd, const TerminalSize& size);
  virtual void write(const string& data);
  virtual void resize(const TerminalSize& size);
  virtual int kill();
  virtual bool isRunning() const { return running; }

  pid_t getPid() const { return childPid; }
  /** @brief Input accepted by `write()` that the child has not taken yet. */
  size_t getPendingInput() const { return pendingInput.length(); }

  /**
   * @brief Resolves `command` the way execvp would.
   * @return The absolute path, or an empty string if nothing executable
   * matches.
   */
  static string findExecutable(const string& command);

  /**
   * @brief Polls `pid` from `loop` until it is reaped, sending SIGKILL once
   * `killDeadlineMs` passes.
   */
  static void reapInBackground(EventLoop* loop, pid_t pid,
                               int64_t killDeadlineMs);

 protected:
  void handleReadable();
  /** @brief Writes queued input until the pty is full or the queue empty. */
  void flushInput();
  /** @brief Collects the child's status.  Returns true once it is reaped. */
  bool reap(bool block);
  void closeMaster();
  static int exitCodeFromStatus(int status);

  shared_ptr<EventLoop> loop;
  /** @brief Master side of the pty, -1 when closed. */
  int masterFd;
  pid_t childPid;
  bool running;
  int exitCode;
  string pendingInput;
};
}  // namespace aic

#endif  // __AIC_FORK_PTY_CHANNEL_HPP__
