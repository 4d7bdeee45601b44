#include <cxxopts.hpp>

#include "AttachController.hpp"
#include "ConversationLog.hpp"
#include "ConversationRelay.hpp"
#include "ForkPtyChannel.hpp"
#include "Headers.hpp"
#include "InteractiveSession.hpp"
#include "LogHandler.hpp"
#include "ProcessSupervisor.hpp"
#include "PseudoTerminalConsole.hpp"
#include "SessionStore.hpp"
#include "SupervisorErrors.hpp"
#include "ToolConfig.hpp"

using namespace aic;

void handleParseException(std::exception& e, cxxopts::Options& options) {
  CLOG(INFO, "stdout") << "Exception: " << e.what() << "\n" << endl;
  CLOG(INFO, "stdout") << options.help({}) << endl;
  exit(1);
}

int listTools(const ToolConfig& config) {
  for (const auto& spec : config.getTools()) {
    string resolved = ForkPtyChannel::findExecutable(spec.command);
    CLOG(INFO, "stdout") << (spec.name == config.getDefaultTool() ? "* " : "  ")
                         << spec.name << "\t" << spec.displayName << "\t"
                         << (resolved.empty() ? spec.command + " (not found)"
                                              : resolved)
                         << endl;
  }
  return 0;
}

// Stopped tools are reaped by loop timers; give them their grace period
void waitForStoppedTools(shared_ptr<EventLoop> loop) {
  if (!loop->runUntil([loop]() { return loop->numTimers() == 0; },
                      2 * ForkPtyChannel::KILL_GRACE_MS)) {
    LOG(WARNING) << "Some tools were still exiting at shutdown";
  }
}

int askOnce(shared_ptr<ProcessSupervisor> supervisor,
            shared_ptr<ConversationRelay> relay,
            shared_ptr<SessionStore> store, const string& tool,
            const string& prompt) {
  int status = 0;
  try {
    supervisor->startOne(tool);
    string response = relay->ask(tool, prompt);
    CLOG(INFO, "stdout") << response << endl;
  } catch (const SupervisorException& ex) {
    CLOG(INFO, "stdout") << "Error: " << ex.what() << endl;
    status = 1;
  }
  SessionState state = store->load();
  if (supervisor->hasTool(tool) &&
      supervisor->getProcess(tool)->hasSessionContinuation()) {
    state.sessionTools.insert(tool);
  }
  store->save(state);
  supervisor->stopAll();
  return status;
}

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  aic::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, aic::InterruptSignalHandler);

  cxxopts::Options options(
      "aic", "Run AI coding assistants side by side and pass answers between "
             "them");
  try {
    options.positional_help("[start | ask <tool> <prompt> | tools]");

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ("l,logdir", "Base directory for log files.",
         cxxopts::value<std::string>()->default_value(""))  //
        ("logtostdout", "Write log to stdout")              //
        ("silent", "Disable logging")                       //
        ("t,tool", "Tool to make active at startup",
         cxxopts::value<std::string>()->default_value(""))  //
        ("command", "start, ask or tools",
         cxxopts::value<std::vector<std::string>>())  //
        ;

    options.parse_positional({"command"});
    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "aic version " << AIC_VERSION << endl;
      exit(0);
    }

    string cfgfile = result["cfgfile"].as<string>();
    bool explicitCfgfile = !cfgfile.empty();
    if (!explicitCfgfile) {
      cfgfile = ToolConfig::defaultPath();
    }
    ToolConfig config = ToolConfig::load(cfgfile, explicitCfgfile);

    // prioritize command line option over cfgfile
    if (result.count("verbose")) {
      el::Loggers::setVerboseLevel(result["verbose"].as<int>());
    } else if (config.getVerbose() >= 0) {
      el::Loggers::setVerboseLevel(config.getVerbose());
    }
    if (result.count("silent") || config.isSilent()) {
      defaultConf.setGlobally(el::ConfigurationType::Enabled, "false");
    }

    string logDirectory = result["logdir"].as<string>();
    if (logDirectory.empty()) {
      logDirectory = GetTempDirectory() + "aic";
    }
    bool logToStdout = result.count("logtostdout") > 0;
    // Stray stderr output would land on top of an attached tool's screen
    LogHandler::setupLogFiles(&defaultConf, logDirectory, "aic", logToStdout,
                              !logToStdout, config.getLogSize());
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    // set thread name
    el::Helpers::setThreadName("aic-main");
    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    vector<string> words;
    if (result.count("command")) {
      words = result["command"].as<vector<string>>();
    }
    string verb = words.empty() ? string("start") : words[0];

    if (verb == "tools") {
      return listTools(config);
    }

    shared_ptr<EventLoop> loop(new EventLoop());
    shared_ptr<Console> console(new PseudoTerminalConsole());
    PtyChannelFactory channelFactory = [loop]() {
      return shared_ptr<PtyChannel>(new ForkPtyChannel(loop));
    };
    shared_ptr<ProcessSupervisor> supervisor(
        new ProcessSupervisor(loop, channelFactory, console));
    for (const auto& spec : config.getTools()) {
      supervisor->registerTool(spec);
    }
    shared_ptr<SessionStore> store(
        new SessionStore(SessionStore::defaultPath()));
    SessionState saved = store->load();
    supervisor->restoreSessions(saved.sessionTools);
    shared_ptr<ConversationLog> conversation(new ConversationLog());
    shared_ptr<ConversationRelay> relay(
        new ConversationRelay(loop, supervisor, conversation));

    if (verb == "ask") {
      if (words.size() < 3) {
        CLOG(INFO, "stdout") << "Usage: aic ask <tool> <prompt>" << endl;
        return 1;
      }
      string prompt = words[2];
      for (size_t a = 3; a < words.size(); a++) {
        prompt += " " + words[a];
      }
      int status = askOnce(supervisor, relay, store, words[1], prompt);
      waitForStoppedTools(loop);
      return status;
    }

    if (verb != "start") {
      CLOG(INFO, "stdout") << "Unknown command: " << verb << "\n" << endl;
      CLOG(INFO, "stdout") << options.help({}) << endl;
      return 1;
    }

    string initialTool = result["tool"].as<string>();
    if (initialTool.empty()) {
      initialTool = supervisor->hasTool(saved.defaultTool)
                        ? saved.defaultTool
                        : config.getDefaultTool();
    }
    supervisor->setActive(initialTool);

    shared_ptr<AttachController> attachController(
        new AttachController(loop, supervisor, console, conversation));
    InteractiveSession session(loop, supervisor, relay, attachController,
                               conversation, console, store);
    int status = session.run();
    waitForStoppedTools(loop);
    return status;
  } catch (cxxopts::OptionException& oe) {
    handleParseException(oe, options);
  } catch (const ConfigurationError& ce) {
    CLOG(INFO, "stdout") << "Configuration error: " << ce.what() << endl;
    return 1;
  }
  return 0;
}
