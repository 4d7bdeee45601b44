#include "ProcessSupervisor.hpp"

#include "SupervisorErrors.hpp"

namespace aic {
ProcessSupervisor::ProcessSupervisor(shared_ptr<EventLoop> _loop,
                                     PtyChannelFactory _channelFactory,
                                     shared_ptr<Console> _console)
    : loop(_loop),
      channelFactory(_channelFactory),
      console(_console),
      sanitizers(new SanitizerRegistry()) {}

shared_ptr<ManagedProcess> ProcessSupervisor::registerTool(
    const LaunchSpec& spec) {
  if (hasTool(spec.name)) {
    throw ConfigurationError("Tool " + spec.name + " is already registered");
  }
  spec.validate();
  sanitizers->set(
      spec.name, SanitizerRegistry::create(spec.sanitizer, spec.promptPattern));
  auto process =
      make_shared<ManagedProcess>(spec, loop, channelFactory, sanitizers);
  processes[spec.name] = process;
  toolNames.push_back(spec.name);
  VLOG(1) << "Registered " << spec.name << " (" << spec.displayName << ")";
  return process;
}

bool ProcessSupervisor::hasTool(const string& name) const {
  return processes.find(name) != processes.end();
}

shared_ptr<ManagedProcess> ProcessSupervisor::getProcess(
    const string& name) const {
  auto it = processes.find(name);
  if (it == processes.end()) {
    throw ConfigurationError("Unknown tool: " + name);
  }
  return it->second;
}

shared_ptr<ManagedProcess> ProcessSupervisor::startOne(const string& name) {
  auto process = getProcess(name);
  shared_ptr<Deferred<bool>> ready;
  switch (process->getState()) {
    case ProcessState::READY:
    case ProcessState::BUSY:
    case ProcessState::INTERACTIVE:
      return process;
    case ProcessState::STARTING:
      ready = process->start(launchSize(process->getSpec()));
      break;
    case ProcessState::DEAD: {
      ready = process->start(launchSize(process->getSpec()));
      // Raw pointer: the subscription dies with this launch
      ManagedProcess* p = process.get();
      p->subscribe([this, p](const ProcessEvent& event) {
        routeEvent(p->getName(), event);
      });
      break;
    }
  }
  loop->waitFor(ready);
  if (activeTool.empty()) {
    activeTool = name;
  }
  return process;
}

void ProcessSupervisor::startAll() {
  // One at a time so startup screens do not interleave
  for (const auto& name : toolNames) {
    startOne(name);
  }
  if (!toolNames.empty() && activeTool.empty()) {
    activeTool = toolNames.front();
  }
}

void ProcessSupervisor::setActive(const string& name) {
  auto target = getProcess(name);
  for (auto& it : processes) {
    if (it.first != name &&
        it.second->getState() == ProcessState::INTERACTIVE) {
      LOG(INFO) << "Taking " << it.first << " out of interactive mode";
      it.second->exitInteractive();
    }
  }
  if (activeTool != name) {
    VLOG(1) << "Active tool: " << (activeTool.empty() ? "none" : activeTool)
            << " -> " << name;
  }
  activeTool = name;
}

shared_ptr<ManagedProcess> ProcessSupervisor::getActiveProcess() const {
  if (activeTool.empty()) {
    return shared_ptr<ManagedProcess>();
  }
  return getProcess(activeTool);
}

void ProcessSupervisor::stopAll() {
  LOG(INFO) << "Stopping all tools";
  for (const auto& name : toolNames) {
    processes[name]->stop();
  }
  processes.clear();
  toolNames.clear();
  activeTool.clear();
}

void ProcessSupervisor::resetAll() {
  for (const auto& name : toolNames) {
    auto process = processes[name];
    process->stop();
    process->resetSession();
  }
}

vector<ToolStatus> ProcessSupervisor::status() const {
  vector<ToolStatus> retval;
  for (const auto& name : toolNames) {
    auto process = getProcess(name);
    ToolStatus s;
    s.name = name;
    s.displayName = process->getDisplayName();
    s.state = process->getState();
    s.active = (name == activeTool);
    s.sessionContinuation = process->hasSessionContinuation();
    s.lastExitCode = process->getLastExitCode();
    retval.push_back(s);
  }
  return retval;
}

set<string> ProcessSupervisor::getSessionTools() const {
  set<string> retval;
  for (const auto& it : processes) {
    if (it.second->hasSessionContinuation()) {
      retval.insert(it.first);
    }
  }
  return retval;
}

void ProcessSupervisor::restoreSessions(const set<string>& tools) {
  for (const auto& name : tools) {
    auto it = processes.find(name);
    if (it == processes.end()) {
      LOG(WARNING) << "Ignoring saved session for unknown tool " << name;
      continue;
    }
    it->second->setSessionContinuation(true);
  }
}

void ProcessSupervisor::routeEvent(const string& name,
                                   const ProcessEvent& event) {
  if (event.type == ProcessEvent::EXIT) {
    auto process = getProcess(name);
    if (exitNotifier) {
      exitNotifier(name, event.exitCode, process->exitedCleanly());
    }
    return;
  }
  if (name != activeTool || !displaySink) {
    return;
  }
  auto it = processes.find(name);
  if (it != processes.end() &&
      it->second->getState() == ProcessState::INTERACTIVE) {
    // The attach controller owns the screen
    return;
  }
  displaySink(name, event.data);
}

TerminalSize ProcessSupervisor::launchSize(const LaunchSpec& spec) const {
  if (spec.hasFixedSize()) {
    return spec.fixedSize();
  }
  if (console) {
    return console->getTerminalSize();
  }
  return TerminalSize();
}
}  // namespace aic
