#ifndef __AIC_PTY_CHANNEL_HPP__
#define __AIC_PTY_CHANNEL_HPP__

#include "Headers.hpp"
#include "TerminalSize.hpp"

namespace aic {
/**
 * @brief One child program behind a pseudo-terminal.
 *
 * Output and exit are pushed to the handlers from the event loop.  The exit
 * handler runs at most once per spawn, and never for a `kill()` the owner
 * asked for.
 */
class PtyChannel {
 public:
  typedef std::function<void(const string&)> DataHandler;
  typedef std::function<void(int)> ExitHandler;

  virtual ~PtyChannel() {}

  void setHandlers(DataHandler _dataHandler, ExitHandler _exitHandler) {
    dataHandler = _dataHandler;
    exitHandler = _exitHandler;
  }

  /**
   * @brief Launches `command` with `args` in `cwd` (empty = inherit).
   * @throws StartupFailure if the executable cannot be found or launched.
   */
  virtual void spawn(const string& command, const vector<string>& args,
                     const string& cwd, const TerminalSize& size) = 0;
  /**
   * @brief Queues raw bytes for the child's input without blocking.  Whatever
   * the child does not take right away is sent as it reads.
   * @throws ChannelIOError if the channel is dead or the write fails.
   */
  virtual void write(const string& data) = 0;
  /** @brief Propagates a new window size to the child. */
  virtual void resize(const TerminalSize& size) = 0;
  /**
   * @brief Terminates the child (TERM, then KILL after a grace period)
   * without blocking.  The channel is dead once this returns.
   * @return The child's exit code, or -1 if it is still being reaped.
   */
  virtual int kill() = 0;
  virtual bool isRunning() const = 0;

 protected:
  DataHandler dataHandler;
  ExitHandler exitHandler;
};

/** @brief Creates a fresh, unspawned channel for each (re)start. */
typedef std::function<shared_ptr<PtyChannel>()> PtyChannelFactory;
}  // namespace aic

#endif  // __AIC_PTY_CHANNEL_HPP__
