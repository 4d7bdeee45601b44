#include "ManagedProcess.hpp"

#include "SupervisorErrors.hpp"

namespace aic {
string stateToString(ProcessState state) {
  switch (state) {
    case ProcessState::STARTING:
      return "Starting";
    case ProcessState::READY:
      return "Ready";
    case ProcessState::BUSY:
      return "Busy";
    case ProcessState::INTERACTIVE:
      return "Interactive";
    case ProcessState::DEAD:
      return "Dead";
  }
  return "Unknown";
}

ManagedProcess::ManagedProcess(const LaunchSpec& _spec,
                               shared_ptr<EventLoop> _loop,
                               PtyChannelFactory _channelFactory,
                               shared_ptr<SanitizerRegistry> _sanitizers)
    : spec(_spec),
      loop(_loop),
      channelFactory(_channelFactory),
      sanitizers(_sanitizers),
      state(ProcessState::DEAD),
      sessionContinuation(false),
      stoppedByRequest(false),
      lastExitCode(-1),
      launchCount(0),
      idleTimer(EventLoop::INVALID_TIMER),
      startupTimer(EventLoop::INVALID_TIMER),
      graceTimer(EventLoop::INVALID_TIMER),
      nextSubscriptionId(1) {
  spec.validate();
  if (!spec.promptPattern.empty()) {
    promptRegex.reset(new std::regex(spec.promptPattern));
  }
}

ManagedProcess::~ManagedProcess() {
  cancelTimers();
  listeners.clear();
  if (channel) {
    channel->setHandlers(nullptr, nullptr);
    if (channel->isRunning()) {
      channel->kill();
    }
  }
  string reason = spec.displayName + " was shut down";
  if (startup) {
    startup->reject(make_exception_ptr(StartupFailure(reason)));
  }
  if (pendingResponse) {
    pendingResponse->reject(
        make_exception_ptr(ProcessExitedError(reason, lastExitCode)));
  }
}

shared_ptr<Deferred<bool>> ManagedProcess::start(const TerminalSize& size) {
  if (state == ProcessState::STARTING) {
    return startup;
  }
  if (state != ProcessState::DEAD) {
    auto running = make_shared<Deferred<bool>>();
    running->resolve(true);
    return running;
  }

  if (channel) {
    // We may be inside the old channel's exit callback; let it unwind first
    auto old = channel;
    old->setHandlers(nullptr, nullptr);
    loop->post([old]() { VLOG(3) << "Released old channel"; });
    channel.reset();
  }
  channel = channelFactory();
  channel->setHandlers([this](const string& chunk) { onData(chunk); },
                       [this](int exitCode) { onExit(exitCode); });

  outputBuffer.clear();
  responseBuffer.clear();
  pendingCommand.clear();
  stoppedByRequest = false;
  lastExitCode = -1;
  startup = make_shared<Deferred<bool>>();

  vector<string> args = spec.buildArgs(sessionContinuation);
  LOG(INFO) << "Launching " << spec.displayName << " (" << spec.command
            << (sessionContinuation ? ", resuming session" : "") << ") at "
            << size;
  setState(ProcessState::STARTING);
  try {
    channel->spawn(spec.command, args, spec.cwd, size);
  } catch (const StartupFailure& sf) {
    LOG(ERROR) << "Could not launch " << spec.displayName << ": " << sf.what();
    setState(ProcessState::DEAD);
    startup->reject(std::current_exception());
    throw;
  }
  launchCount++;

  startupTimer = loop->addTimer(spec.startupTimeoutMs,
                                [this]() { onStartupTimeout(); });
  if (!promptRegex) {
    graceTimer = loop->addTimer(spec.startupGraceMs, [this]() {
      graceTimer = EventLoop::INVALID_TIMER;
      markReady();
    });
  }
  return startup;
}

shared_ptr<Deferred<string>> ManagedProcess::send(const string& command) {
  if (state != ProcessState::READY) {
    throw NotReadyError(spec.displayName + " is " + stateToString(state) +
                        " and cannot take a new message");
  }
  try {
    channel->write(command + spec.lineTerminator);
  } catch (const ChannelIOError& ex) {
    LOG(ERROR) << "Write to " << spec.displayName << " failed: " << ex.what();
    failChannel();
    throw;
  }
  pendingCommand = command;
  responseBuffer.clear();
  pendingResponse = make_shared<Deferred<string>>();
  setState(ProcessState::BUSY);
  // A tool that prints nothing at all still completes after one window
  armIdleTimer();
  return pendingResponse;
}

void ManagedProcess::enterInteractive() {
  if (state != ProcessState::READY) {
    throw NotReadyError(spec.displayName + " is " + stateToString(state) +
                        " and cannot be attached");
  }
  setState(ProcessState::INTERACTIVE);
}

void ManagedProcess::exitInteractive() {
  if (state != ProcessState::INTERACTIVE) {
    return;
  }
  sessionContinuation = true;
  setState(ProcessState::READY);
}

void ManagedProcess::writeRaw(const string& data) {
  if (state != ProcessState::INTERACTIVE) {
    throw NotReadyError(spec.displayName + " is not attached");
  }
  try {
    channel->write(data);
  } catch (const ChannelIOError& ex) {
    LOG(ERROR) << "Write to " << spec.displayName << " failed: " << ex.what();
    failChannel();
    throw;
  }
}

void ManagedProcess::resize(const TerminalSize& size) {
  if (channel && isRunning()) {
    VLOG(2) << "Resizing " << spec.name << " to " << size;
    channel->resize(size);
  }
}

int ManagedProcess::stop() {
  if (state == ProcessState::DEAD) {
    return lastExitCode;
  }
  LOG(INFO) << "Stopping " << spec.displayName;
  stoppedByRequest = true;
  int exitCode = channel->kill();
  onExit(exitCode);
  return exitCode;
}

ManagedProcess::SubscriptionId ManagedProcess::subscribe(Listener listener) {
  SubscriptionId id = nextSubscriptionId++;
  listeners[id] = listener;
  return id;
}

void ManagedProcess::unsubscribe(SubscriptionId id) { listeners.erase(id); }

string ManagedProcess::stripEcho(const string& response,
                                 const string& command) {
  // The pty echoes the command back one line at a time
  size_t pos = 0;
  for (const auto& commandLine : split(command, '\n')) {
    if (pos >= response.length()) {
      break;
    }
    size_t eol = response.find('\n', pos);
    string line = response.substr(
        pos, eol == string::npos ? string::npos : eol - pos);
    if (trim(AnsiSanitizer::stripEscapes(line)) != trim(commandLine)) {
      break;
    }
    pos = (eol == string::npos) ? response.length() : eol + 1;
  }
  return response.substr(pos);
}

void ManagedProcess::onData(const string& chunk) {
  outputBuffer += chunk;
  ProcessEvent event;
  event.type = ProcessEvent::DATA;
  event.data = chunk;
  event.exitCode = 0;
  emit(event);

  switch (state) {
    case ProcessState::STARTING:
      checkReady();
      break;
    case ProcessState::BUSY:
      responseBuffer += chunk;
      armIdleTimer();
      break;
    default:
      break;
  }
}

void ManagedProcess::onExit(int exitCode) {
  if (state == ProcessState::DEAD) {
    return;
  }
  lastExitCode = exitCode;
  cancelTimers();
  responseBuffer.clear();
  pendingCommand.clear();
  setState(ProcessState::DEAD);

  string reason = exitCode >= 0 ? "exit code " + to_string(exitCode)
                                : string("an unknown exit status");
  if (stoppedByRequest) {
    LOG(INFO) << spec.displayName << " stopped";
  } else if (exitCode == 0) {
    LOG(INFO) << spec.displayName << " exited cleanly";
  } else {
    LOG(WARNING) << spec.displayName << " failed with " << reason;
  }

  if (startup && !startup->isSettled()) {
    startup->reject(make_exception_ptr(StartupFailure(
        spec.displayName + " exited during startup with " + reason)));
  }
  if (pendingResponse) {
    auto pending = pendingResponse;
    pendingResponse.reset();
    pending->reject(make_exception_ptr(ProcessExitedError(
        spec.displayName + " exited with " + reason + " while responding",
        exitCode)));
  }

  ProcessEvent event;
  event.type = ProcessEvent::EXIT;
  event.exitCode = exitCode;
  emit(event);
  listeners.clear();
}

void ManagedProcess::checkReady() {
  if (!promptRegex) {
    return;
  }
  string screen = AnsiSanitizer::resolveCarriageReturns(
      AnsiSanitizer::stripEscapes(outputBuffer));
  for (const auto& line : split(screen, '\n')) {
    if (std::regex_search(line, *promptRegex)) {
      VLOG(1) << spec.name << " showed its prompt";
      markReady();
      return;
    }
  }
}

void ManagedProcess::markReady() {
  if (state != ProcessState::STARTING) {
    return;
  }
  cancelTimers();
  setState(ProcessState::READY);
  startup->resolve(true);
}

void ManagedProcess::onStartupTimeout() {
  startupTimer = EventLoop::INVALID_TIMER;
  if (state != ProcessState::STARTING) {
    return;
  }
  LOG(ERROR) << spec.displayName << " did not become ready within "
             << spec.startupTimeoutMs << " ms";
  startup->reject(make_exception_ptr(
      StartupFailure(spec.displayName + " did not become ready within " +
                     to_string(spec.startupTimeoutMs) + " ms")));
  failChannel();
}

void ManagedProcess::armIdleTimer() {
  if (idleTimer != EventLoop::INVALID_TIMER) {
    loop->cancelTimer(idleTimer);
  }
  idleTimer = loop->addTimer(spec.responseTimeoutMs, [this]() {
    idleTimer = EventLoop::INVALID_TIMER;
    completeResponse();
  });
  VLOG(4) << "Idle timer for " << spec.name << " re-armed";
}

void ManagedProcess::completeResponse() {
  if (state != ProcessState::BUSY) {
    return;
  }
  string raw = stripEcho(responseBuffer, pendingCommand);
  lastResponse = sanitizers->sanitize(spec.name, raw);
  responseBuffer.clear();
  pendingCommand.clear();
  sessionContinuation = true;
  auto pending = pendingResponse;
  pendingResponse.reset();
  VLOG(1) << spec.name << " finished responding (" << lastResponse.length()
          << " chars)";
  setState(ProcessState::READY);
  pending->resolve(lastResponse);
}

void ManagedProcess::failChannel() {
  if (state == ProcessState::DEAD) {
    return;
  }
  int exitCode = channel ? channel->kill() : -1;
  onExit(exitCode);
}

void ManagedProcess::cancelTimers() {
  for (auto* timer : {&idleTimer, &startupTimer, &graceTimer}) {
    if (*timer != EventLoop::INVALID_TIMER) {
      loop->cancelTimer(*timer);
      *timer = EventLoop::INVALID_TIMER;
    }
  }
}

void ManagedProcess::setState(ProcessState newState) {
  if (state == newState) {
    return;
  }
  VLOG(1) << spec.name << ": " << stateToString(state) << " -> "
          << stateToString(newState);
  state = newState;
}

void ManagedProcess::emit(const ProcessEvent& event) {
  // Listeners may unsubscribe themselves or each other
  auto snapshot = listeners;
  for (auto& it : snapshot) {
    if (listeners.find(it.first) == listeners.end()) {
      continue;
    }
    it.second(event);
  }
}
}  // namespace aic
