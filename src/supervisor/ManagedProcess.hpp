#ifndef __AIC_MANAGED_PROCESS_HPP__
#define __AIC_MANAGED_PROCESS_HPP__

#include "Deferred.hpp"
#include "EventLoop.hpp"
#include "Headers.hpp"
#include "OutputSanitizer.hpp"
#include "PtyChannel.hpp"
#include "ToolConfig.hpp"

namespace aic {
enum class ProcessState { STARTING, READY, BUSY, INTERACTIVE, DEAD };

string stateToString(ProcessState state);

/**
 * @brief Something a managed process reports to its subscribers.
 */
struct ProcessEvent {
  enum Type { DATA, EXIT };

  Type type;
  /** @brief Raw pty bytes for DATA. */
  string data;
  /** @brief Exit code (or 128+signal) for EXIT. */
  int exitCode;
};

/**
 * @brief One supervised tool running behind its own pty.
 *
 * The process starts out DEAD (never launched).  `start()` moves it to
 * STARTING, and it becomes READY once the prompt pattern shows up or the
 * startup grace period passes.  A `send()` moves it to BUSY until the tool
 * has been silent for the idle window, at which point the sanitized response
 * resolves the deferred and the process is READY again.  Any exit of the
 * child makes it DEAD and settles whatever is pending.
 *
 * Subscriptions belong to one launch: they are dropped when the process
 * dies.
 */
class ManagedProcess {
 public:
  typedef std::function<void(const ProcessEvent&)> Listener;
  typedef int SubscriptionId;

  ManagedProcess(const LaunchSpec& _spec, shared_ptr<EventLoop> _loop,
                 PtyChannelFactory _channelFactory,
                 shared_ptr<SanitizerRegistry> _sanitizers);
  virtual ~ManagedProcess();

  /**
   * @brief Spawns the tool, resuming its session if it has one.
   * @return A deferred that resolves when the tool is READY and rejects
   * with StartupFailure otherwise.  While STARTING the pending deferred is
   * returned again; while running an already resolved one is returned.
   * @throws StartupFailure if the tool cannot be spawned at all.
   */
  shared_ptr<Deferred<bool>> start(const TerminalSize& size);

  /**
   * @brief Writes `command` plus the line terminator and waits for the
   * tool to go quiet.
   * @throws NotReadyError unless READY.
   * @throws ChannelIOError if the write fails (the process is then DEAD).
   */
  shared_ptr<Deferred<string>> send(const string& command);

  /** @throws NotReadyError unless READY. */
  void enterInteractive();
  /** @brief Back to READY with a session to resume.  No-op otherwise. */
  void exitInteractive();
  /**
   * @brief Forwards keystrokes while INTERACTIVE.
   * @throws NotReadyError when not INTERACTIVE, ChannelIOError on failure.
   */
  void writeRaw(const string& data);
  void resize(const TerminalSize& size);

  /**
   * @brief Kills the child.  Pending operations are rejected as if it had
   * exited by itself.
   * @return The exit code.
   */
  int stop();

  /** @brief Forgets the tool's conversation so the next launch is fresh. */
  void resetSession() { sessionContinuation = false; }
  /** @brief Restores a persisted session flag. */
  void setSessionContinuation(bool value) { sessionContinuation = value; }

  SubscriptionId subscribe(Listener listener);
  void unsubscribe(SubscriptionId id);
  int numSubscribers() const { return int(listeners.size()); }

  const string& getName() const { return spec.name; }
  const string& getDisplayName() const { return spec.displayName; }
  const LaunchSpec& getSpec() const { return spec; }
  ProcessState getState() const { return state; }
  bool isRunning() const { return state != ProcessState::DEAD; }
  bool hasSessionContinuation() const { return sessionContinuation; }
  const string& getLastResponse() const { return lastResponse; }
  const string& getOutputBuffer() const { return outputBuffer; }
  const string& getResponseBuffer() const { return responseBuffer; }
  /** @brief Exit code of the last launch, -1 if it never exited. */
  int getLastExitCode() const { return lastExitCode; }
  /** @brief False if the last launch died on its own with a non-zero code. */
  bool exitedCleanly() const { return stoppedByRequest || lastExitCode == 0; }
  int getLaunchCount() const { return launchCount; }

  /**
   * @brief Drops the leading lines of `response` that echo the lines of
   * `command`, stopping at the first line that differs.
   */
  static string stripEcho(const string& response, const string& command);

 protected:
  void onData(const string& chunk);
  void onExit(int exitCode);
  void checkReady();
  void markReady();
  void onStartupTimeout();
  void armIdleTimer();
  void completeResponse();
  /** @brief Kills a channel that failed I/O and reports the death. */
  void failChannel();
  void cancelTimers();
  void setState(ProcessState newState);
  void emit(const ProcessEvent& event);

  LaunchSpec spec;
  shared_ptr<EventLoop> loop;
  PtyChannelFactory channelFactory;
  shared_ptr<SanitizerRegistry> sanitizers;
  shared_ptr<PtyChannel> channel;
  std::unique_ptr<std::regex> promptRegex;

  ProcessState state;
  string outputBuffer;
  string responseBuffer;
  string lastResponse;
  string pendingCommand;
  bool sessionContinuation;
  bool stoppedByRequest;
  int lastExitCode;
  int launchCount;

  shared_ptr<Deferred<bool>> startup;
  shared_ptr<Deferred<string>> pendingResponse;
  EventLoop::TimerId idleTimer;
  EventLoop::TimerId startupTimer;
  EventLoop::TimerId graceTimer;

  map<SubscriptionId, Listener> listeners;
  SubscriptionId nextSubscriptionId;
};
}  // namespace aic

#endif  // __AIC_MANAGED_PROCESS_HPP__
