#include "AttachController.hpp"

#include "RawFdUtils.hpp"
#include "SupervisorErrors.hpp"

namespace aic {
#define INPUT_BUF_SIZE (4096)

AttachController::AttachController(shared_ptr<EventLoop> _loop,
                                   shared_ptr<ProcessSupervisor> _supervisor,
                                   shared_ptr<Console> _console,
                                   shared_ptr<ConversationLog> _log)
    : loop(_loop),
      supervisor(_supervisor),
      console(_console),
      log(_log),
      detachRequested(false),
      processExited(false),
      exitCode(-1),
      resizeTimer(EventLoop::INVALID_TIMER) {}

AttachResult AttachController::attach(const string& tool) {
  if (isAttached()) {
    throw TerminalBusyError("Already attached to " + attachedTool);
  }
  auto process = supervisor->startOne(tool);
  ManagedProcess* p = process.get();

  unique_ptr<ConsoleRawModeGuard> rawMode(
      new ConsoleRawModeGuard(console, tool));
  supervisor->setActive(tool);
  p->enterInteractive();

  attachedTool = tool;
  capture.clear();
  detachRequested = false;
  processExited = false;
  inputError = nullptr;
  exitCode = -1;
  LOG(INFO) << "Attached to " << p->getDisplayName();

  ManagedProcess::SubscriptionId subscription =
      p->subscribe([this](const ProcessEvent& event) {
        if (event.type == ProcessEvent::EXIT) {
          processExited = true;
          exitCode = event.exitCode;
          return;
        }
        capture += event.data;
        try {
          console->write(event.data);
        } catch (const ChannelIOError& ex) {
          LOG(WARNING) << "Could not draw tool output: " << ex.what();
        }
      });

  lastSize = console->getTerminalSize();
  if (!p->getSpec().hasFixedSize()) {
    p->resize(lastSize);
  }
  loop->watchFd(console->getInputFd(), [this, p]() { onConsoleInput(p); });
  resizeTimer = loop->addTimer(RESIZE_POLL_MS,
                               [this, p]() { pollTerminalSize(p); });

  auto release = [&]() {
    loop->unwatchFd(console->getInputFd());
    if (resizeTimer != EventLoop::INVALID_TIMER) {
      loop->cancelTimer(resizeTimer);
      resizeTimer = EventLoop::INVALID_TIMER;
    }
    p->unsubscribe(subscription);
    rawMode.reset();
    attachedTool.clear();
  };

  try {
    loop->runUntil([this, p]() {
      return detachRequested || processExited || inputError ||
             p->getState() != ProcessState::INTERACTIVE;
    });
  } catch (const std::exception& ex) {
    LOG(ERROR) << "Attach to " << tool << " aborted: " << ex.what();
    p->exitInteractive();
    release();
    throw;
  }
  release();

  AttachResult result;
  result.captureSaved = false;
  result.exitCode = -1;
  if (processExited || !p->isRunning()) {
    LOG(INFO) << p->getDisplayName() << " exited while attached";
    result.outcome = AttachResult::PROCESS_EXITED;
    result.exitCode = processExited ? exitCode : p->getLastExitCode();
  } else {
    p->exitInteractive();
    LOG(INFO) << "Detached from " << p->getDisplayName() << " after "
              << capture.length() << " bytes";
    result.outcome = AttachResult::DETACHED;
    string clean = supervisor->getSanitizers()->sanitize(tool, capture);
    if (clean.length() > size_t(MIN_MEANINGFUL_CAPTURE_LENGTH)) {
      log->addAssistantMessage(tool, clean);
      result.captureSaved = true;
    } else {
      VLOG(1) << "Capture too short to keep (" << clean.length() << " chars)";
    }
  }
  if (inputError) {
    std::rethrow_exception(inputError);
  }
  return result;
}

void AttachController::onConsoleInput(ManagedProcess* process) {
  string chunk;
  ssize_t rc;
  try {
    rc = RawFdUtils::readAvailable(console->getInputFd(), &chunk,
                                   INPUT_BUF_SIZE);
  } catch (const ChannelIOError&) {
    inputError = std::current_exception();
    return;
  }
  if (rc < 0) {
    return;
  }
  if (rc == 0) {
    LOG(INFO) << "Console input closed, detaching";
    detachRequested = true;
    return;
  }

  // Everything from the detach key on stays with us
  size_t detachPos = chunk.find(DETACH_KEY);
  string forward = chunk.substr(0, detachPos);
  if (!forward.empty()) {
    try {
      process->writeRaw(forward);
    } catch (const SupervisorException& ex) {
      LOG(ERROR) << "Could not forward input to " << process->getName()
                 << ": " << ex.what();
      inputError = std::current_exception();
      return;
    }
  }
  if (detachPos != string::npos) {
    VLOG(1) << "Detach key pressed";
    detachRequested = true;
  }
}

void AttachController::pollTerminalSize(ManagedProcess* process) {
  resizeTimer = EventLoop::INVALID_TIMER;
  TerminalSize size = console->getTerminalSize();
  if (size != lastSize) {
    VLOG(1) << "Terminal resized to " << size;
    lastSize = size;
    if (!process->getSpec().hasFixedSize()) {
      process->resize(size);
    }
  }
  resizeTimer = loop->addTimer(
      RESIZE_POLL_MS, [this, process]() { pollTerminalSize(process); });
}
}  // namespace aic
