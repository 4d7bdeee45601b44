#include "EventLoop.hpp"

namespace aic {
// Upper bound on a single select() so runUntil() re-checks its predicate.
#define MAX_SELECT_WAIT_MS (100)

EventLoop::EventLoop() : nextTimerId(1) {}

int64_t EventLoop::nowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now().time_since_epoch())
      .count();
}

void EventLoop::watchFd(int fd, Callback onReadable) {
  if (fd < 0 || fd >= FD_SETSIZE) {
    throw std::runtime_error("Cannot watch invalid fd " + to_string(fd));
  }
  VLOG(3) << "Watching fd " << fd;
  watchers[fd] = onReadable;
}

void EventLoop::unwatchFd(int fd) {
  VLOG(3) << "Unwatching fd " << fd;
  watchers.erase(fd);
}

void EventLoop::watchFdWritable(int fd, Callback onWritable) {
  if (fd < 0 || fd >= FD_SETSIZE) {
    throw std::runtime_error("Cannot watch invalid fd " + to_string(fd));
  }
  VLOG(3) << "Waiting for fd " << fd << " to become writable";
  writeWatchers[fd] = onWritable;
}

void EventLoop::unwatchFdWritable(int fd) { writeWatchers.erase(fd); }

EventLoop::TimerId EventLoop::addTimer(int64_t delayMs, Callback callback) {
  TimerId id = nextTimerId++;
  Timer t;
  t.deadline = nowMs() + max(delayMs, int64_t(0));
  t.callback = callback;
  timers.insert(make_pair(id, t));
  return id;
}

bool EventLoop::cancelTimer(TimerId id) { return timers.erase(id) > 0; }

void EventLoop::post(Callback callback) { posted.push_back(callback); }

void EventLoop::runPosted() {
  deque<Callback> current;
  current.swap(posted);
  for (auto& it : current) {
    it();
  }
}

void EventLoop::fireExpiredTimers() {
  int64_t now = nowMs();
  vector<pair<int64_t, TimerId>> expired;
  for (auto& it : timers) {
    if (it.second.deadline <= now) {
      expired.push_back(make_pair(it.second.deadline, it.first));
    }
  }
  // Earliest deadline first, ties broken by creation order
  sort(expired.begin(), expired.end());
  for (auto& it : expired) {
    auto timerIt = timers.find(it.second);
    if (timerIt == timers.end()) {
      // Cancelled by an earlier callback in this batch
      continue;
    }
    Callback callback = timerIt->second.callback;
    timers.erase(timerIt);
    callback();
  }
}

void EventLoop::runOnce(int64_t maxWaitMs) {
  runPosted();

  int64_t waitMs = max(maxWaitMs, int64_t(0));
  if (!posted.empty()) {
    waitMs = 0;
  }
  int64_t now = nowMs();
  for (auto& it : timers) {
    waitMs = min(waitMs, max(it.second.deadline - now, int64_t(0)));
  }

  fd_set rfd, wfd;
  FD_ZERO(&rfd);
  FD_ZERO(&wfd);
  int maxfd = -1;
  for (auto& it : watchers) {
    FD_SET(it.first, &rfd);
    maxfd = max(maxfd, it.first);
  }
  for (auto& it : writeWatchers) {
    FD_SET(it.first, &wfd);
    maxfd = max(maxfd, it.first);
  }
  timeval tv;
  tv.tv_sec = waitMs / 1000;
  tv.tv_usec = (waitMs % 1000) * 1000;
  int rc = select(maxfd + 1, &rfd, &wfd, NULL, &tv);
  if (rc < 0) {
    if (GetErrno() == EINTR) {
      // A signal (e.g. SIGWINCH) woke us up; timers may still be due
      fireExpiredTimers();
      return;
    }
    STERROR << "select() failed: " << strerror(GetErrno());
    throw std::runtime_error("Event loop select failed");
  }

  if (rc > 0) {
    // Reads before writes
    dispatchReady(watchers, &rfd);
    dispatchReady(writeWatchers, &wfd);
  }

  fireExpiredTimers();
}

void EventLoop::dispatchReady(const map<int, Callback>& callbacks,
                              fd_set* ready) {
  vector<int> fds;
  for (auto& it : callbacks) {
    if (FD_ISSET(it.first, ready)) {
      fds.push_back(it.first);
    }
  }
  for (int fd : fds) {
    auto it = callbacks.find(fd);
    if (it == callbacks.end()) {
      // Removed by a callback earlier in this batch
      continue;
    }
    Callback callback = it->second;
    callback();
  }
}

bool EventLoop::runUntil(const std::function<bool()>& done,
                         int64_t timeoutMs) {
  int64_t start = nowMs();
  while (!done()) {
    int64_t waitMs = MAX_SELECT_WAIT_MS;
    if (timeoutMs >= 0) {
      int64_t remaining = timeoutMs - (nowMs() - start);
      if (remaining <= 0) {
        return false;
      }
      waitMs = min(waitMs, remaining);
    }
    if (watchers.empty() && writeWatchers.empty() && timers.empty() &&
        posted.empty() && timeoutMs < 0) {
      throw std::logic_error(
          "Event loop has nothing left to wait on but the caller is still "
          "waiting");
    }
    runOnce(waitMs);
  }
  return true;
}
}  // namespace aic
