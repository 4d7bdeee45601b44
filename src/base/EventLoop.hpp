#ifndef __AIC_EVENT_LOOP__
#define __AIC_EVENT_LOOP__

#include "Deferred.hpp"
#include "Headers.hpp"

namespace aic {
/**
 * @brief Single-threaded select() loop driving every pty and the console.
 *
 * All pty output, console input, idle timers and startup timers are
 * dispatched from here, in the order the kernel reports them.  Callbacks may
 * add or remove watches and timers (including their own) while running.
 */
class EventLoop {
 public:
  typedef std::function<void()> Callback;
  typedef int64_t TimerId;

  static constexpr TimerId INVALID_TIMER = 0;

  EventLoop();

  /** @brief Calls `onReadable` every time `fd` has data (or hangs up). */
  void watchFd(int fd, Callback onReadable);
  void unwatchFd(int fd);
  bool isWatching(int fd) const { return watchers.find(fd) != watchers.end(); }

  /** @brief Calls `onWritable` every time `fd` can take more data. */
  void watchFdWritable(int fd, Callback onWritable);
  void unwatchFdWritable(int fd);
  bool isWatchingWritable(int fd) const {
    return writeWatchers.find(fd) != writeWatchers.end();
  }

  /** @brief Schedules a one-shot callback `delayMs` from now. */
  TimerId addTimer(int64_t delayMs, Callback callback);
  /** @brief Cancels a timer.  Returns false if it already fired. */
  bool cancelTimer(TimerId id);
  bool hasTimer(TimerId id) const { return timers.find(id) != timers.end(); }

  /** @brief Runs `callback` on the next loop iteration. */
  void post(Callback callback);

  /**
   * @brief Waits at most `maxWaitMs` for fd activity, then dispatches ready
   * fds, posted callbacks and expired timers.
   */
  void runOnce(int64_t maxWaitMs);

  /**
   * @brief Keeps iterating until `done()` returns true.
   * @return false if `timeoutMs` (when non-negative) elapsed first.
   * @throws std::logic_error when nothing is left that could wake the loop.
   */
  bool runUntil(const std::function<bool()>& done, int64_t timeoutMs = -1);

  /**
   * @brief Suspends the caller until the deferred settles, servicing all other
   * events meanwhile, then returns its value or rethrows its rejection.
   */
  template <typename T>
  const T& waitFor(const shared_ptr<Deferred<T>>& deferred) {
    runUntil([deferred]() { return deferred->isSettled(); });
    return deferred->get();
  }

  int numWatchedFds() const { return int(watchers.size()); }
  int numWriteWatches() const { return int(writeWatchers.size()); }
  int numTimers() const { return int(timers.size()); }

  /** @brief Milliseconds on the monotonic clock. */
  static int64_t nowMs();

 protected:
  struct Timer {
    int64_t deadline;
    Callback callback;
  };

  void runPosted();
  void fireExpiredTimers();
  /** @brief Runs the callbacks in `callbacks` whose fd is set in `ready`. */
  void dispatchReady(const map<int, Callback>& callbacks, fd_set* ready);

  /** @brief Read watches keyed by fd. */
  map<int, Callback> watchers;
  /** @brief Write watches keyed by fd. */
  map<int, Callback> writeWatchers;
  /** @brief Pending timers keyed by id (ids are increasing). */
  map<TimerId, Timer> timers;
  /** @brief Callbacks queued by `post()`. */
  deque<Callback> posted;
  TimerId nextTimerId;
};
}  // namespace aic

#endif  // __AIC_EVENT_LOOP__
