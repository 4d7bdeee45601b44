#include "ForkPtyChannel.hpp"

#include "RawFdUtils.hpp"
#include "SupervisorErrors.hpp"

namespace aic {
#define BUF_SIZE (16 * 1024)

ForkPtyChannel::ForkPtyChannel(shared_ptr<EventLoop> _loop)
    : loop(_loop), masterFd(-1), childPid(-1), running(false), exitCode(-1) {}

ForkPtyChannel::~ForkPtyChannel() {
  if (running) {
    kill();
  }
  closeMaster();
}

string ForkPtyChannel::findExecutable(const string& command) {
  if (command.empty()) {
    return string();
  }
  if (command.find('/') != string::npos) {
    if (::access(command.c_str(), X_OK) == 0 && !fs::is_directory(command)) {
      return command;
    }
    return string();
  }
  const char* pathEnv = ::getenv("PATH");
  string path = pathEnv ? string(pathEnv) : string("/usr/bin:/bin");
  for (auto& dir : split(path, ':')) {
    if (dir.empty()) {
      dir = ".";
    }
    string candidate = dir + "/" + command;
    if (::access(candidate.c_str(), X_OK) == 0 &&
        !fs::is_directory(candidate)) {
      return candidate;
    }
  }
  return string();
}

void ForkPtyChannel::spawn(const string& command, const vector<string>& args,
                           const string& cwd, const TerminalSize& size) {
  if (running) {
    throw StartupFailure("Channel for " + command + " is already running");
  }
  string executable = findExecutable(command);
  if (executable.empty()) {
    throw StartupFailure("Cannot find executable '" + command +
                         "' (check the tool's command setting and PATH)");
  }
  if (!cwd.empty() && !fs::is_directory(cwd)) {
    throw StartupFailure("Working directory does not exist: " + cwd);
  }

  // Build argv before forking so the child only has to exec
  vector<char*> argv;
  argv.push_back(const_cast<char*>(command.c_str()));
  for (auto& it : args) {
    argv.push_back(const_cast<char*>(it.c_str()));
  }
  argv.push_back(NULL);

  winsize win = size.toWinsize();
  pid_t pid = forkpty(&masterFd, NULL, NULL, &win);
  switch (pid) {
    case -1:
      throw StartupFailure(string("forkpty failed: ") + strerror(GetErrno()));
    case 0: {
      // child
      if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
        fprintf(stderr, "aic: cannot chdir to %s: %s\r\n", cwd.c_str(),
                strerror(errno));
        _exit(127);
      }
      setenv("TERM", "xterm-256color", 1);
      setenv("AIC_VERSION", AIC_VERSION, 1);
      // The tool may rely on the default SIGCHLD/SIGINT/SIGPIPE dispositions
      // even if aic changed its own.
      signal(SIGCHLD, SIG_DFL);
      signal(SIGINT, SIG_DFL);
      signal(SIGPIPE, SIG_DFL);
      execv(executable.c_str(), &argv[0]);
      fprintf(stderr, "aic: cannot exec %s: %s\r\n", executable.c_str(),
              strerror(errno));
      _exit(127);
    }
    default: {
      // parent
      childPid = pid;
      running = true;
      exitCode = -1;
      VLOG(1) << "pty opened " << masterFd << " for " << executable
              << " (pid " << childPid << ")";
      RawFdUtils::setNonBlocking(masterFd);
      loop->watchFd(masterFd, [this]() { handleReadable(); });
      break;
    }
  }
}

void ForkPtyChannel::handleReadable() {
  string chunk;
  ssize_t rc;
  try {
    rc = RawFdUtils::readAvailable(masterFd, &chunk, BUF_SIZE);
  } catch (const ChannelIOError& ex) {
    STERROR << "Error reading pty for pid " << childPid << ": " << ex.what();
    rc = 0;
  }
  if (rc < 0) {
    // Spurious wakeup
    return;
  }
  if (rc > 0) {
    VLOG(4) << "Read " << rc << " bytes from pid " << childPid;
    if (dataHandler) {
      DataHandler handler = dataHandler;
      handler(chunk);
    }
    return;
  }

  LOG(INFO) << "Terminal session ended for pid " << childPid;
  closeMaster();
  reap(true);
  if (exitHandler) {
    // The handler may tear down our owner, so nothing touches `this` after it
    ExitHandler handler = exitHandler;
    int code = exitCode;
    handler(code);
  }
}

bool ForkPtyChannel::reap(bool block) {
  if (!running) {
    return true;
  }
  int status = 0;
  pid_t rc;
  do {
    rc = waitpid(childPid, &status, block ? 0 : WNOHANG);
  } while (rc < 0 && GetErrno() == EINTR);
  if (rc == 0) {
    return false;
  }
  running = false;
  if (rc < 0) {
    LOG(WARNING) << "waitpid failed for pid " << childPid << ": "
                 << strerror(GetErrno());
    exitCode = -1;
  } else {
    exitCode = exitCodeFromStatus(status);
  }
  VLOG(1) << "Reaped pid " << childPid << " with exit code " << exitCode;
  return true;
}

int ForkPtyChannel::exitCodeFromStatus(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

void ForkPtyChannel::write(const string& data) {
  if (!running || masterFd < 0) {
    throw ChannelIOError("Cannot write to a terminal whose process is gone");
  }
  pendingInput += data;
  flushInput();
}

void ForkPtyChannel::flushInput() {
  try {
    while (!pendingInput.empty()) {
      ssize_t rc = RawFdUtils::writeAvailable(masterFd, pendingInput.data(),
                                              pendingInput.length());
      if (rc < 0) {
        break;
      }
      pendingInput.erase(0, rc);
    }
  } catch (const ChannelIOError&) {
    pendingInput.clear();
    loop->unwatchFdWritable(masterFd);
    throw;
  }

  if (pendingInput.empty()) {
    loop->unwatchFdWritable(masterFd);
  } else if (!loop->isWatchingWritable(masterFd)) {
    // The tool reads its input slower than we send it
    VLOG(3) << pendingInput.length() << " bytes queued for pid " << childPid;
    loop->watchFdWritable(masterFd, [this]() {
      try {
        flushInput();
      } catch (const ChannelIOError& ex) {
        // The read side notices the hangup and reports the exit
        LOG(WARNING) << "Dropped unsent input for pid " << childPid << ": "
                     << ex.what();
      }
    });
  }
}

void ForkPtyChannel::resize(const TerminalSize& size) {
  if (masterFd < 0) {
    return;
  }
  winsize win = size.toWinsize();
  if (ioctl(masterFd, TIOCSWINSZ, &win) != 0) {
    LOG(WARNING) << "Could not resize pty " << masterFd << ": "
                 << strerror(GetErrno());
  }
}

int ForkPtyChannel::kill() {
  if (!running) {
    closeMaster();
    return exitCode;
  }
  LOG(INFO) << "Terminating pid " << childPid;
  ::kill(childPid, SIGTERM);
  closeMaster();
  if (!reap(false)) {
    // Still winding down: the loop escalates and reaps it from here on
    running = false;
    exitCode = -1;
    reapInBackground(loop.get(), childPid,
                     EventLoop::nowMs() + KILL_GRACE_MS);
  }
  return exitCode;
}

void ForkPtyChannel::reapInBackground(EventLoop* loop, pid_t pid,
                                      int64_t killDeadlineMs) {
  loop->addTimer(REAP_POLL_MS, [loop, pid, killDeadlineMs]() {
    int status = 0;
    pid_t rc = waitpid(pid, &status, WNOHANG);
    if (rc < 0 && GetErrno() == EINTR) {
      rc = 0;
    }
    if (rc == 0) {
      int64_t nextDeadline = killDeadlineMs;
      if (EventLoop::nowMs() >= killDeadlineMs) {
        LOG(WARNING) << "pid " << pid << " ignored SIGTERM, killing";
        ::kill(pid, SIGKILL);
        nextDeadline = std::numeric_limits<int64_t>::max();
      }
      reapInBackground(loop, pid, nextDeadline);
      return;
    }
    if (rc < 0) {
      LOG(WARNING) << "waitpid failed for pid " << pid << ": "
                   << strerror(GetErrno());
      return;
    }
    VLOG(1) << "Reaped pid " << pid << " with exit code "
            << exitCodeFromStatus(status);
  });
}

void ForkPtyChannel::closeMaster() {
  if (masterFd < 0) {
    return;
  }
  loop->unwatchFd(masterFd);
  loop->unwatchFdWritable(masterFd);
  ::close(masterFd);
  masterFd = -1;
  pendingInput.clear();
}
}  // namespace aic
