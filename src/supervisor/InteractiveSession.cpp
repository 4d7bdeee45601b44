#include "InteractiveSession.hpp"

#include "RawFdUtils.hpp"
#include "SupervisorErrors.hpp"

namespace aic {
#define LINE_BUF_SIZE (4096)

InteractiveSession::InteractiveSession(
    shared_ptr<EventLoop> _loop, shared_ptr<ProcessSupervisor> _supervisor,
    shared_ptr<ConversationRelay> _relay,
    shared_ptr<AttachController> _attachController,
    shared_ptr<ConversationLog> _log, shared_ptr<Console> _console,
    shared_ptr<SessionStore> _store)
    : loop(_loop),
      supervisor(_supervisor),
      relay(_relay),
      attachController(_attachController),
      log(_log),
      console(_console),
      store(_store),
      inputClosed(false),
      quitRequested(false) {
  supervisor->setDisplaySink([this](const string&, const string& data) {
    try {
      console->write(data);
    } catch (const ChannelIOError& ex) {
      LOG(WARNING) << "Could not draw tool output: " << ex.what();
    }
  });
  supervisor->setExitNotifier([this](const string& tool, int exitCode,
                                     bool clean) {
    if (!supervisor->hasTool(tool)) {
      return;
    }
    string name = supervisor->getProcess(tool)->getDisplayName();
    if (clean) {
      print(name + " exited");
    } else {
      print(name + " failed with exit code " + to_string(exitCode));
    }
  });
}

InteractiveSession::~InteractiveSession() {
  unwatchInput();
  supervisor->setDisplaySink(nullptr);
  supervisor->setExitNotifier(nullptr);
}

int InteractiveSession::run() {
  printBanner();
  watchInput();
  while (!quitRequested && !(inputClosed && pendingLines.empty())) {
    if (pendingLines.empty()) {
      console->write("\n" + currentTool() + " > ");
    }
    loop->runUntil([this]() {
      return quitRequested || inputClosed || !pendingLines.empty();
    });
    if (pendingLines.empty()) {
      continue;
    }
    string line = pendingLines.front();
    pendingLines.pop_front();

    // Nested waits (ask, attach) must not consume the user's next lines
    unwatchInput();
    if (!handleLine(line)) {
      quitRequested = true;
    } else if (!inputClosed) {
      watchInput();
    }
  }
  unwatchInput();

  saveState();
  supervisor->stopAll();
  print("Goodbye!");
  return 0;
}

bool InteractiveSession::handleLine(const string& rawLine) {
  string line = trim(stripFocusSequences(rawLine));
  if (line.empty()) {
    return true;
  }
  try {
    if (line.rfind("//", 0) == 0) {
      string body = line.substr(2);
      size_t space = body.find_first_of(" \t");
      string command = body.substr(0, space);
      string argument =
          (space == string::npos) ? string() : trim(body.substr(space));
      return handleCommand(command, argument);
    }
    askActive(line);
  } catch (const SupervisorException& ex) {
    print("Error: " + string(ex.what()));
  }
  return true;
}

bool InteractiveSession::handleCommand(const string& command,
                                       const string& argument) {
  if (command == "quit" || command == "exit" || command == "cya") {
    return false;
  }
  if (command == "i" || command == "interactive" || command == "shell") {
    attachActive();
  } else if (command == "forward") {
    forwardLastResponse(argument);
  } else if (command == "history") {
    print(log->formatHistory());
  } else if (command == "status") {
    printStatus();
  } else if (command == "clear") {
    supervisor->resetAll();
    log->clear();
    saveState();
    print("Session cleared.");
  } else if (command == "help") {
    printHelp();
  } else if (supervisor->hasTool(command)) {
    supervisor->setActive(command);
    print("Switched to " + supervisor->getProcess(command)->getDisplayName());
    saveState();
  } else {
    print("Unknown command: //" + command + " (try //help)");
  }
  return true;
}

void InteractiveSession::askActive(const string& prompt) {
  string tool = currentTool();
  auto process = supervisor->getProcess(tool);
  if (!process->isRunning()) {
    print("Starting " + process->getDisplayName() + "...");
  }
  supervisor->startOne(tool);
  supervisor->setActive(tool);
  string response = relay->ask(tool, prompt);
  print("\n[" + process->getDisplayName() + " responded, " +
        to_string(response.length()) + " chars captured]");
  saveState();
}

void InteractiveSession::forwardLastResponse(const string& extraMessage) {
  ForwardPlan plan = relay->planForward("", "", extraMessage);
  auto from = supervisor->getProcess(plan.fromTool);
  auto to = supervisor->getProcess(plan.toTool);
  print("Forwarding " + from->getDisplayName() + "'s response to " +
        to->getDisplayName() + "...");
  supervisor->startOne(plan.toTool);
  supervisor->setActive(plan.toTool);
  string response = relay->forward(plan.fromTool, plan.toTool, extraMessage);
  print("\n[" + to->getDisplayName() + " responded, " +
        to_string(response.length()) + " chars captured]");
  saveState();
}

void InteractiveSession::attachActive() {
  string tool = currentTool();
  auto process = supervisor->getProcess(tool);
  print((process->isRunning() ? "Re-attaching to " : "Starting ") +
        process->getDisplayName() + ". Press Ctrl+] to detach.");
  AttachResult result = attachController->attach(tool);
  if (result.outcome == AttachResult::DETACHED) {
    print("\nDetached from " + process->getDisplayName() +
          " (still running)." +
          (result.captureSaved ? " Use //forward to send its output on."
                               : ""));
  } else {
    print("\nReturned to aic.");
  }
  saveState();
}

void InteractiveSession::printStatus() {
  std::ostringstream ss;
  for (const auto& it : supervisor->status()) {
    ss << (it.active ? "* " : "  ") << it.displayName << " (" << it.name
       << "): " << stateToString(it.state);
    if (it.sessionContinuation) {
      ss << ", has history";
    }
    if (it.state == ProcessState::DEAD && it.lastExitCode > 0) {
      ss << ", last exit code " << it.lastExitCode;
    }
    ss << "\n";
  }
  ss << log->size() << " message(s) in this session";
  print(ss.str());
}

void InteractiveSession::printHelp() {
  std::ostringstream ss;
  for (const auto& name : supervisor->getToolNames()) {
    ss << "  //" << name << "\tSwitch to "
       << supervisor->getProcess(name)->getDisplayName() << "\n";
  }
  ss << "  //i\t\tAttach to the active tool (Ctrl+] detaches)\n"
     << "  //forward [msg]\tSend the last response to another tool\n"
     << "  //history\tShow this session's messages\n"
     << "  //status\tShow every tool's state\n"
     << "  //clear\tStop all tools and forget the conversation\n"
     << "  //quit\t\tExit";
  print(ss.str());
}

void InteractiveSession::printBanner() {
  print("aic " + string(AIC_VERSION) + " - type //help for commands");
}

void InteractiveSession::print(const string& text) {
  try {
    console->write(text + "\n");
  } catch (const ChannelIOError& ex) {
    LOG(WARNING) << "Could not print to the console: " << ex.what();
  }
}

string InteractiveSession::stripFocusSequences(const string& line) {
  string retval = line;
  replaceAll(retval, "\x1b[I", "");
  replaceAll(retval, "\x1b[O", "");
  replaceAll(retval, "^[[I", "");
  replaceAll(retval, "^[[O", "");
  return retval;
}

void InteractiveSession::saveState() {
  if (!store) {
    return;
  }
  SessionState state;
  state.defaultTool = supervisor->getActive();
  state.sessionTools = supervisor->getSessionTools();
  store->save(state);
}

void InteractiveSession::watchInput() {
  loop->watchFd(console->getInputFd(), [this]() { onInput(); });
}

void InteractiveSession::unwatchInput() {
  loop->unwatchFd(console->getInputFd());
}

void InteractiveSession::onInput() {
  string chunk;
  ssize_t rc;
  try {
    rc = RawFdUtils::readAvailable(console->getInputFd(), &chunk,
                                   LINE_BUF_SIZE);
  } catch (const ChannelIOError& ex) {
    LOG(ERROR) << "Lost console input: " << ex.what();
    rc = 0;
  }
  if (rc < 0) {
    return;
  }
  if (rc == 0) {
    if (!partialLine.empty()) {
      pendingLines.push_back(partialLine);
      partialLine.clear();
    }
    inputClosed = true;
    unwatchInput();
    return;
  }
  partialLine += chunk;
  size_t eol;
  while ((eol = partialLine.find('\n')) != string::npos) {
    pendingLines.push_back(partialLine.substr(0, eol));
    partialLine.erase(0, eol + 1);
  }
}

string InteractiveSession::currentTool() {
  if (!supervisor->getActive().empty()) {
    return supervisor->getActive();
  }
  if (supervisor->getToolNames().empty()) {
    throw ConfigurationError("No tools are configured");
  }
  return supervisor->getToolNames().front();
}
}  // namespace aic
