#ifndef __AIC_LOG_HANDLER__
#define __AIC_LOG_HANDLER__

#include "Headers.hpp"

namespace aic {
/**
 * @brief Configures easylogging++ for aic.
 *
 * Diagnostics go to a log file so they never land on a terminal that a
 * wrapped tool is drawing on.  User-facing lines go through the "stdout"
 * logger.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes easylogging from `argc/argv` and returns the base
   * configuration for the default logger.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Points the default logger at `<path>/<filenamePrefix>-<time>.log`.
   * @param redirectStderrToFile also reopen stderr into the log directory so
   * stray writes cannot corrupt an attached tool's screen.
   */
  static void setupLogFiles(el::Configurations *defaultConf, const string &path,
                            const string &filenamePrefix,
                            bool logToStdout = false,
                            bool redirectStderrToFile = false,
                            string maxlogsize = "20971520");

  /** @brief Rollout callback: drops the rolled log file. */
  static void rolloutHandler(const char *filename, std::size_t size);

  /** @brief Makes the "stdout" logger print bare messages. */
  static void setupStdoutLogger();

 private:
  static void stderrToFile(const string &path, const string &stderrFilename);

  static string createLogFile(const string &path, const string &filename);
};
}  // namespace aic
#endif  // __AIC_LOG_HANDLER__
