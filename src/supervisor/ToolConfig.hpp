#ifndef __AIC_TOOL_CONFIG_HPP__
#define __AIC_TOOL_CONFIG_HPP__

#include "Headers.hpp"
#include "TerminalSize.hpp"

namespace aic {
/**
 * @brief Everything needed to (re)launch one wrapped tool.
 */
struct LaunchSpec {
  /** @brief Unique key, e.g. "claude". */
  string name;
  /** @brief Human name used in messages and forward envelopes. */
  string displayName;
  string command;
  vector<string> args;
  /** @brief Appended to `args` when the tool has a session to resume. */
  vector<string> resumeArgs;
  /** @brief Working directory, empty for aic's own. */
  string cwd;
  /** @brief Per-line readiness pattern for startup output, empty for none. */
  string promptPattern;
  /** @brief Idle window that finalizes a response. */
  int64_t responseTimeoutMs;
  int64_t startupTimeoutMs;
  /** @brief Time until Ready when there is no prompt pattern. */
  int64_t startupGraceMs;
  string lineTerminator;
  /** @brief Sanitizer kind: ansi, prompt, claude or gemini. */
  string sanitizer;
  /** @brief Fixed pty size; 0 follows the real terminal. */
  int rows;
  int cols;

  LaunchSpec();
  LaunchSpec(const string& _name, const string& _command);

  /** @brief The argument list for a launch, with resume arguments if asked. */
  vector<string> buildArgs(bool resumeSession) const;

  bool hasFixedSize() const { return rows > 0 && cols > 0; }
  TerminalSize fixedSize() const { return TerminalSize(rows, cols); }

  /** @throws ConfigurationError if this spec can never launch. */
  void validate() const;
};

/**
 * @brief The set of tools aic knows about plus its debug settings.
 *
 * Loaded from an INI file in which every section other than [General] and
 * [Debug] describes one tool.
 */
class ToolConfig {
 public:
  ToolConfig() : verbose(-1), silent(false), logsize("20971520") {}

  /** @brief Claude Code and Gemini CLI with their known quirks. */
  static ToolConfig builtIn();

  /**
   * @brief Reads an INI file.
   * @throws ConfigurationError if the file is unreadable or a value is
   * invalid.
   */
  static ToolConfig loadFile(const string& path);

  /**
   * @brief Reads `path` if it exists, otherwise returns the built-in tools.
   * A missing file is an error only when the user named it explicitly.
   */
  static ToolConfig load(const string& path, bool explicitPath);

  static string defaultPath() { return GetConfigDirectory() + "/aic.ini"; }

  /** @throws ConfigurationError on a duplicate name or an invalid spec. */
  void addTool(const LaunchSpec& spec);
  bool hasTool(const string& name) const;
  /** @throws ConfigurationError for an unknown tool. */
  const LaunchSpec& getTool(const string& name) const;
  const vector<LaunchSpec>& getTools() const { return tools; }

  const string& getDefaultTool() const { return defaultTool; }
  void setDefaultTool(const string& name);

  /** @brief Verbose level from [Debug], -1 if unset. */
  int getVerbose() const { return verbose; }
  bool isSilent() const { return silent; }
  const string& getLogSize() const { return logsize; }

 protected:
  vector<LaunchSpec> tools;
  string defaultTool;
  int verbose;
  bool silent;
  string logsize;
};
}  // namespace aic

#endif  // __AIC_TOOL_CONFIG_HPP__
