#ifndef __AIC_PROCESS_SUPERVISOR_HPP__
#define __AIC_PROCESS_SUPERVISOR_HPP__

#include "Console.hpp"
#include "EventLoop.hpp"
#include "Headers.hpp"
#include "ManagedProcess.hpp"

namespace aic {
/**
 * @brief One row of `ProcessSupervisor::status()`.
 */
struct ToolStatus {
  string name;
  string displayName;
  ProcessState state;
  bool active;
  bool sessionContinuation;
  int lastExitCode;
};

/**
 * @brief Owns every managed process and decides which one the user sees.
 *
 * Exactly one tool can be active.  Output from the active tool goes to the
 * display sink; everybody else keeps running and buffering in the
 * background.
 */
class ProcessSupervisor {
 public:
  typedef std::function<void(const string& tool, const string& data)>
      DisplaySink;
  /** @brief Told about every exit, with whether it counts as a failure. */
  typedef std::function<void(const string& tool, int exitCode, bool clean)>
      ExitNotifier;

  ProcessSupervisor(shared_ptr<EventLoop> _loop,
                    PtyChannelFactory _channelFactory,
                    shared_ptr<Console> _console);

  /**
   * @brief Adds a tool.  It stays DEAD until started.
   * @throws ConfigurationError on a duplicate name or an invalid spec.
   */
  shared_ptr<ManagedProcess> registerTool(const LaunchSpec& spec);
  bool hasTool(const string& name) const;
  /** @throws ConfigurationError for an unknown tool. */
  shared_ptr<ManagedProcess> getProcess(const string& name) const;
  /** @brief Tool names in registration order. */
  const vector<string>& getToolNames() const { return toolNames; }

  /**
   * @brief Makes sure `name` is running and READY (or BUSY/INTERACTIVE),
   * waiting on the event loop while it starts.  The first tool started
   * becomes active.
   * @throws ConfigurationError for an unknown tool, StartupFailure if the
   * launch fails.
   */
  shared_ptr<ManagedProcess> startOne(const string& name);
  /** @brief Starts every tool one after the other. */
  void startAll();

  /**
   * @brief Switches the foreground tool, taking any other tool out of
   * interactive mode first.
   */
  void setActive(const string& name);
  const string& getActive() const { return activeTool; }
  /** @return The active process or null if none is active. */
  shared_ptr<ManagedProcess> getActiveProcess() const;

  void setDisplaySink(DisplaySink sink) { displaySink = sink; }
  void setExitNotifier(ExitNotifier notifier) { exitNotifier = notifier; }

  /** @brief Stops every process and forgets every tool. */
  void stopAll();
  /** @brief Stops every process and drops every session flag. */
  void resetAll();

  vector<ToolStatus> status() const;

  /** @brief Tools whose next launch will resume their conversation. */
  set<string> getSessionTools() const;
  void restoreSessions(const set<string>& tools);

  shared_ptr<SanitizerRegistry> getSanitizers() const { return sanitizers; }

 protected:
  void routeEvent(const string& name, const ProcessEvent& event);
  TerminalSize launchSize(const LaunchSpec& spec) const;

  shared_ptr<EventLoop> loop;
  PtyChannelFactory channelFactory;
  shared_ptr<Console> console;
  shared_ptr<SanitizerRegistry> sanitizers;

  map<string, shared_ptr<ManagedProcess>> processes;
  vector<string> toolNames;
  string activeTool;
  DisplaySink displaySink;
  ExitNotifier exitNotifier;
};
}  // namespace aic

#endif  // __AIC_PROCESS_SUPERVISOR_HPP__
