#include "ToolConfig.hpp"

#include "SimpleIni.h"
#include "SupervisorErrors.hpp"

namespace aic {
namespace {
int64_t parseMillis(const string& section, const char* key, const char* value,
                    int64_t defaultValue) {
  if (value == NULL) {
    return defaultValue;
  }
  int64_t ms;
  try {
    size_t used = 0;
    ms = stoll(value, &used);
    if (trim(string(value).substr(used)).length()) {
      throw std::invalid_argument(value);
    }
  } catch (const std::logic_error&) {
    throw ConfigurationError("[" + section + "] " + key +
                             " is not a number: " + value);
  }
  if (ms <= 0) {
    throw ConfigurationError("[" + section + "] " + key +
                             " must be positive, got " + value);
  }
  return ms;
}

int parseSize(const string& section, const char* key, const char* value) {
  if (value == NULL) {
    return 0;
  }
  try {
    int v = stoi(value);
    if (v < 0) {
      throw std::out_of_range(value);
    }
    return v;
  } catch (const std::logic_error&) {
    throw ConfigurationError("[" + section + "] " + key +
                             " is not a valid size: " + value);
  }
}

string parseLineTerminator(const string& section, const string& value) {
  if (value == "lf") {
    return "\n";
  }
  if (value == "cr") {
    return "\r";
  }
  if (value == "crlf") {
    return "\r\n";
  }
  throw ConfigurationError("[" + section +
                           "] line_terminator must be lf, cr or crlf, got " +
                           value);
}
}  // namespace

LaunchSpec::LaunchSpec()
    : responseTimeoutMs(DEFAULT_RESPONSE_TIMEOUT_MS),
      startupTimeoutMs(DEFAULT_STARTUP_TIMEOUT_MS),
      startupGraceMs(DEFAULT_STARTUP_GRACE_MS),
      lineTerminator("\n"),
      sanitizer("ansi"),
      rows(0),
      cols(0) {}

LaunchSpec::LaunchSpec(const string& _name, const string& _command)
    : LaunchSpec() {
  name = _name;
  displayName = _name;
  command = _command;
}

vector<string> LaunchSpec::buildArgs(bool resumeSession) const {
  vector<string> retval = args;
  if (resumeSession) {
    retval.insert(retval.end(), resumeArgs.begin(), resumeArgs.end());
  }
  return retval;
}

void LaunchSpec::validate() const {
  if (name.empty()) {
    throw ConfigurationError("A tool needs a name");
  }
  if (command.empty()) {
    throw ConfigurationError("Tool " + name + " has no command");
  }
  if (responseTimeoutMs <= 0 || startupTimeoutMs <= 0 || startupGraceMs <= 0) {
    throw ConfigurationError("Tool " + name + " has a non-positive timeout");
  }
  if (lineTerminator.empty()) {
    throw ConfigurationError("Tool " + name + " has no line terminator");
  }
  if (!promptPattern.empty()) {
    try {
      std::regex re(promptPattern);
    } catch (const std::regex_error& ex) {
      throw ConfigurationError("Tool " + name + " has an invalid " +
                               "prompt_pattern '" + promptPattern +
                               "': " + ex.what());
    }
  }
}

ToolConfig ToolConfig::builtIn() {
  ToolConfig config;

  LaunchSpec claude("claude", "claude");
  claude.displayName = "Claude Code";
  claude.resumeArgs = {"--continue"};
  claude.sanitizer = "claude";
  config.addTool(claude);

  LaunchSpec gemini("gemini", "gemini");
  gemini.displayName = "Gemini CLI";
  gemini.resumeArgs = {"--resume", "latest"};
  // Gemini shows a bare '>' once it accepts input
  gemini.promptPattern = "^>\\s*$";
  gemini.responseTimeoutMs = 1500;
  // First launch spends a while on auth
  gemini.startupGraceMs = 8000;
  gemini.sanitizer = "gemini";
  config.addTool(gemini);

  config.setDefaultTool("claude");
  return config;
}

ToolConfig ToolConfig::loadFile(const string& path) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    throw ConfigurationError("Invalid config file: " + path);
  }

  ToolConfig config;
  CSimpleIniA::TNamesDepend sections;
  ini.GetAllSections(sections);
  sections.sort(CSimpleIniA::Entry::LoadOrder());
  for (const auto& it : sections) {
    string section(it.pItem);
    if (section == "General" || section == "Debug") {
      continue;
    }
    const char* s = section.c_str();
    LaunchSpec spec(section, ini.GetValue(s, "command", s));
    spec.displayName = ini.GetValue(s, "display_name", s);
    spec.args = splitWhitespace(ini.GetValue(s, "args", ""));
    spec.resumeArgs = splitWhitespace(ini.GetValue(s, "resume_args", ""));
    spec.cwd = ini.GetValue(s, "cwd", "");
    spec.promptPattern = ini.GetValue(s, "prompt_pattern", "");
    spec.responseTimeoutMs =
        parseMillis(section, "response_timeout",
                    ini.GetValue(s, "response_timeout", NULL),
                    DEFAULT_RESPONSE_TIMEOUT_MS);
    spec.startupTimeoutMs =
        parseMillis(section, "startup_timeout",
                    ini.GetValue(s, "startup_timeout", NULL),
                    DEFAULT_STARTUP_TIMEOUT_MS);
    spec.startupGraceMs = parseMillis(section, "startup_grace",
                                      ini.GetValue(s, "startup_grace", NULL),
                                      DEFAULT_STARTUP_GRACE_MS);
    spec.lineTerminator =
        parseLineTerminator(section, ini.GetValue(s, "line_terminator", "lf"));
    spec.sanitizer = ini.GetValue(s, "sanitizer", "ansi");
    spec.rows = parseSize(section, "rows", ini.GetValue(s, "rows", NULL));
    spec.cols = parseSize(section, "cols", ini.GetValue(s, "cols", NULL));
    config.addTool(spec);
  }
  if (config.tools.empty()) {
    throw ConfigurationError("Config file " + path + " defines no tools");
  }

  const char* defaultTool = ini.GetValue("General", "default_tool", NULL);
  config.setDefaultTool(defaultTool ? string(defaultTool)
                                    : config.tools.front().name);

  const char* vlevel = ini.GetValue("Debug", "verbose", NULL);
  if (vlevel) {
    config.verbose = atoi(vlevel);
  }
  const char* silent = ini.GetValue("Debug", "silent", NULL);
  if (silent && atoi(silent) != 0) {
    config.silent = true;
  }
  const char* logsize = ini.GetValue("Debug", "logsize", NULL);
  if (logsize && atoi(logsize) != 0) {
    // make sure logsize is a string of int value
    config.logsize = to_string(atoi(logsize));
  }
  return config;
}

ToolConfig ToolConfig::load(const string& path, bool explicitPath) {
  if (fs::exists(path)) {
    LOG(INFO) << "Loading tools from " << path;
    return loadFile(path);
  }
  if (explicitPath) {
    throw ConfigurationError("Config file does not exist: " + path);
  }
  VLOG(1) << "No config at " << path << ", using built-in tools";
  return builtIn();
}

void ToolConfig::addTool(const LaunchSpec& spec) {
  spec.validate();
  if (hasTool(spec.name)) {
    throw ConfigurationError("Tool " + spec.name + " is defined twice");
  }
  tools.push_back(spec);
}

bool ToolConfig::hasTool(const string& name) const {
  for (const auto& it : tools) {
    if (it.name == name) {
      return true;
    }
  }
  return false;
}

const LaunchSpec& ToolConfig::getTool(const string& name) const {
  for (const auto& it : tools) {
    if (it.name == name) {
      return it;
    }
  }
  throw ConfigurationError("Unknown tool: " + name);
}

void ToolConfig::setDefaultTool(const string& name) {
  if (!hasTool(name)) {
    throw ConfigurationError("Default tool " + name + " is not configured");
  }
  defaultTool = name;
}
}  // namespace aic
