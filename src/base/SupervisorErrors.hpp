#ifndef __AIC_SUPERVISOR_ERRORS__
#define __AIC_SUPERVISOR_ERRORS__

#include "Headers.hpp"

namespace aic {
/**
 * @brief Base class for every recoverable failure raised by the supervisor.
 */
class SupervisorException : public std::exception {
 public:
  explicit SupervisorException(const string& msg) : message(msg) {}
  const char* what() const noexcept override { return message.c_str(); }

 private:
  std::string message = " ";
};

/**
 * @brief Unknown tool, bad config value, or a launch spec that can never
 * work.
 */
class ConfigurationError : public SupervisorException {
 public:
  explicit ConfigurationError(const string& msg) : SupervisorException(msg) {}
};

/**
 * @brief The tool could not be spawned or never signalled readiness.
 */
class StartupFailure : public SupervisorException {
 public:
  explicit StartupFailure(const string& msg) : SupervisorException(msg) {}
};

/**
 * @brief An operation needed the Ready state and the process was elsewhere.
 */
class NotReadyError : public SupervisorException {
 public:
  explicit NotReadyError(const string& msg) : SupervisorException(msg) {}
};

/**
 * @brief The process died while a response was pending.
 */
class ProcessExitedError : public SupervisorException {
 public:
  ProcessExitedError(const string& msg, int _exitCode)
      : SupervisorException(msg), exitCode(_exitCode) {}

  int getExitCode() const { return exitCode; }

 private:
  int exitCode;
};

/**
 * @brief A forward was requested but no assistant message exists.
 */
class NothingToForwardError : public SupervisorException {
 public:
  explicit NothingToForwardError(const string& msg)
      : SupervisorException(msg) {}
};

/**
 * @brief Reading or writing the pty failed.
 */
class ChannelIOError : public SupervisorException {
 public:
  explicit ChannelIOError(const string& msg) : SupervisorException(msg) {}
};

/**
 * @brief The real terminal is already owned by an attach session.
 */
class TerminalBusyError : public SupervisorException {
 public:
  explicit TerminalBusyError(const string& msg) : SupervisorException(msg) {}
};
}  // namespace aic

#endif  // __AIC_SUPERVISOR_ERRORS__
