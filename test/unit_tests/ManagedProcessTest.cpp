#include "FakePtyChannel.hpp"
#include "ManagedProcess.hpp"
#include "SupervisorErrors.hpp"
#include "TestHeaders.hpp"

using namespace aic;

namespace {
struct ProcessFixture {
  ProcessFixture()
      : loop(new EventLoop()),
        factory(loop),
        sanitizers(new SanitizerRegistry()) {}

  shared_ptr<ManagedProcess> make(const LaunchSpec& spec) {
    return make_shared<ManagedProcess>(spec, loop, factory.get(), sanitizers);
  }

  shared_ptr<ManagedProcess> makeReady(const LaunchSpec& spec) {
    auto process = make(spec);
    loop->waitFor(process->start(TerminalSize(24, 80)));
    return process;
  }

  shared_ptr<EventLoop> loop;
  FakePtyChannelFactory factory;
  shared_ptr<SanitizerRegistry> sanitizers;
};

// Mimics a tool whose pty echoes the command before answering
string echoThenAnswer(const string& input, const string& answer) {
  return trim(input) + "\r\n" + answer;
}
}  // namespace

TEST_CASE("A new process is Dead until started", "[ManagedProcess]") {
  ProcessFixture f;
  auto process = f.make(makeTestSpec("alpha"));

  REQUIRE(process->getState() == ProcessState::DEAD);
  REQUIRE_FALSE(process->isRunning());
  REQUIRE(process->getLaunchCount() == 0);
  REQUIRE(process->getLastExitCode() == -1);
  REQUIRE_THROWS_AS(process->send("hi"), NotReadyError);
  REQUIRE_THROWS_AS(process->enterInteractive(), NotReadyError);
}

TEST_CASE("Without a prompt pattern the grace period makes it Ready",
          "[ManagedProcess]") {
  ProcessFixture f;
  auto process = f.make(makeTestSpec("alpha"));

  auto ready = process->start(TerminalSize(40, 120));
  REQUIRE(process->getState() == ProcessState::STARTING);
  REQUIRE(f.loop->waitFor(ready));
  REQUIRE(process->getState() == ProcessState::READY);
  REQUIRE(process->getLaunchCount() == 1);
  REQUIRE(f.factory.last()->sizes.front() == TerminalSize(40, 120));
  REQUIRE(f.factory.last()->command == "alpha");
}

TEST_CASE("The prompt pattern marks readiness as soon as it is drawn",
          "[ManagedProcess]") {
  ProcessFixture f;
  auto spec = makeTestSpec("alpha");
  spec.promptPattern = "^>\\s*$";
  spec.startupGraceMs = 60000;
  f.factory.banner = "Loading...\r\nWelcome\r\n\x1b[1m>\x1b[0m ";
  auto process = f.make(spec);

  int64_t start = EventLoop::nowMs();
  REQUIRE(f.loop->waitFor(process->start(TerminalSize())));
  REQUIRE(process->getState() == ProcessState::READY);
  REQUIRE(EventLoop::nowMs() - start < 1000);
  REQUIRE(f.loop->numTimers() == 0);
}

TEST_CASE("A tool that never shows its prompt fails to start",
          "[ManagedProcess]") {
  ProcessFixture f;
  auto spec = makeTestSpec("alpha");
  spec.promptPattern = "^>\\s*$";
  spec.startupTimeoutMs = 100;
  f.factory.banner = "Still loading";
  auto process = f.make(spec);

  auto ready = process->start(TerminalSize());
  REQUIRE_THROWS_AS(f.loop->waitFor(ready), StartupFailure);
  REQUIRE(process->getState() == ProcessState::DEAD);
  REQUIRE(f.factory.last()->killCount == 1);
  REQUIRE_FALSE(process->exitedCleanly());
}

TEST_CASE("A spawn failure leaves the process Dead", "[ManagedProcess]") {
  ProcessFixture f;
  f.factory.failSpawn = true;
  auto process = f.make(makeTestSpec("alpha"));

  REQUIRE_THROWS_AS(process->start(TerminalSize()), StartupFailure);
  REQUIRE(process->getState() == ProcessState::DEAD);
  REQUIRE(process->getLaunchCount() == 0);
}

TEST_CASE("start is idempotent while starting and running",
          "[ManagedProcess]") {
  ProcessFixture f;
  auto process = f.make(makeTestSpec("alpha"));

  auto first = process->start(TerminalSize());
  auto second = process->start(TerminalSize());
  REQUIRE(first == second);
  REQUIRE(f.factory.numSpawned() == 1);

  f.loop->waitFor(first);
  auto third = process->start(TerminalSize());
  REQUIRE(third->isSettled());
  REQUIRE(third->get());
  REQUIRE(f.factory.numSpawned() == 1);
}

TEST_CASE("send goes Busy and resolves with the sanitized response",
          "[ManagedProcess]") {
  ProcessFixture f;
  f.factory.responder = [](const string& input) {
    return echoThenAnswer(input, "\x1b[32mworld\x1b[0m\r\n");
  };
  auto process = f.makeReady(makeTestSpec("alpha"));

  auto pending = process->send("hello");
  REQUIRE(process->getState() == ProcessState::BUSY);
  REQUIRE(f.factory.last()->writes.back() == "hello\n");
  REQUIRE_THROWS_AS(process->send("again"), NotReadyError);

  REQUIRE(f.loop->waitFor(pending) == "world");
  REQUIRE(process->getState() == ProcessState::READY);
  REQUIRE(process->getLastResponse() == "world");
  REQUIRE(process->hasSessionContinuation());
  REQUIRE(process->getResponseBuffer().empty());
}

TEST_CASE("The line terminator follows the launch spec", "[ManagedProcess]") {
  ProcessFixture f;
  auto spec = makeTestSpec("alpha");
  spec.lineTerminator = "\r";
  auto process = f.makeReady(spec);

  f.loop->waitFor(process->send("go"));
  REQUIRE(f.factory.last()->writes.back() == "go\r");
}

TEST_CASE("A tool that prints nothing completes with an empty response",
          "[ManagedProcess]") {
  ProcessFixture f;
  auto process = f.makeReady(makeTestSpec("alpha"));

  REQUIRE(f.loop->waitFor(process->send("quiet please")) == "");
  REQUIRE(process->getState() == ProcessState::READY);
}

TEST_CASE("Every chunk restarts the idle window", "[ManagedProcess]") {
  ProcessFixture f;
  auto spec = makeTestSpec("alpha");
  spec.responseTimeoutMs = 60;
  auto process = f.makeReady(spec);
  auto channel = f.factory.last();

  int64_t start = EventLoop::nowMs();
  auto pending = process->send("count");
  f.loop->addTimer(30, [channel]() { channel->emitData("one\r\n"); });
  f.loop->addTimer(60, [channel]() { channel->emitData("two\r\n"); });
  f.loop->addTimer(90, [channel]() { channel->emitData("three\r\n"); });

  REQUIRE(f.loop->waitFor(pending) == "one\ntwo\nthree");
  REQUIRE(EventLoop::nowMs() - start >= 90 + 60);
}

TEST_CASE("Output after the idle window is not part of the response",
          "[ManagedProcess]") {
  ProcessFixture f;
  auto process = f.makeReady(makeTestSpec("alpha"));
  auto channel = f.factory.last();

  auto pending = process->send("x");
  channel->emitData("first\r\n");
  REQUIRE(f.loop->waitFor(pending) == "first");

  channel->emitData("late\r\n");
  REQUIRE(process->getState() == ProcessState::READY);
  REQUIRE(process->getLastResponse() == "first");
  REQUIRE(process->getOutputBuffer().find("late") != string::npos);
}

TEST_CASE("Dying while Busy rejects with the exit code", "[ManagedProcess]") {
  ProcessFixture f;
  auto process = f.makeReady(makeTestSpec("alpha"));
  int subscriberEvents = 0;
  process->subscribe(
      [&subscriberEvents](const ProcessEvent&) { subscriberEvents++; });

  auto pending = process->send("crash");
  f.factory.last()->emitExit(3);

  REQUIRE(pending->isRejected());
  try {
    f.loop->waitFor(pending);
    FAIL("Expected the response to be rejected");
  } catch (const ProcessExitedError& ex) {
    REQUIRE(ex.getExitCode() == 3);
  }
  REQUIRE(process->getState() == ProcessState::DEAD);
  REQUIRE(process->getLastExitCode() == 3);
  REQUIRE_FALSE(process->exitedCleanly());
  REQUIRE(subscriberEvents == 1);
  REQUIRE(process->numSubscribers() == 0);
}

TEST_CASE("A failed write makes the process Dead", "[ManagedProcess]") {
  ProcessFixture f;
  auto process = f.makeReady(makeTestSpec("alpha"));
  f.factory.last()->failWrites = true;

  REQUIRE_THROWS_AS(process->send("hello"), ChannelIOError);
  REQUIRE(process->getState() == ProcessState::DEAD);
  REQUIRE(f.factory.last()->killCount == 1);
}

TEST_CASE("Subscribers get data and exit events for one launch",
          "[ManagedProcess]") {
  ProcessFixture f;
  auto process = f.makeReady(makeTestSpec("alpha"));
  vector<ProcessEvent> events;
  process->subscribe(
      [&events](const ProcessEvent& event) { events.push_back(event); });
  REQUIRE(process->numSubscribers() == 1);

  f.factory.last()->emitData("abc");
  f.factory.last()->emitExit(0);

  REQUIRE(events.size() == 2);
  REQUIRE(events[0].type == ProcessEvent::DATA);
  REQUIRE(events[0].data == "abc");
  REQUIRE(events[1].type == ProcessEvent::EXIT);
  REQUIRE(events[1].exitCode == 0);
  REQUIRE(process->numSubscribers() == 0);
  REQUIRE(process->exitedCleanly());
}

TEST_CASE("A listener can unsubscribe itself while being notified",
          "[ManagedProcess]") {
  ProcessFixture f;
  auto process = f.makeReady(makeTestSpec("alpha"));
  int calls = 0;
  ManagedProcess::SubscriptionId id = 0;
  id = process->subscribe([&](const ProcessEvent&) {
    calls++;
    process->unsubscribe(id);
  });

  f.factory.last()->emitData("a");
  f.factory.last()->emitData("b");
  REQUIRE(calls == 1);
  REQUIRE(process->numSubscribers() == 0);
}

TEST_CASE("Restarts resume the session until it is reset",
          "[ManagedProcess]") {
  ProcessFixture f;
  auto spec = makeTestSpec("alpha");
  spec.args = {"-q"};
  spec.resumeArgs = {"--continue"};
  auto process = f.makeReady(spec);
  REQUIRE(f.factory.last()->args == vector<string>({"-q"}));

  f.loop->waitFor(process->send("remember this"));
  REQUIRE(process->stop() == 143);
  REQUIRE(process->getState() == ProcessState::DEAD);
  REQUIRE(process->exitedCleanly());

  f.loop->waitFor(process->start(TerminalSize()));
  REQUIRE(f.factory.numSpawned() == 2);
  REQUIRE(f.factory.last()->args == vector<string>({"-q", "--continue"}));
  REQUIRE(process->getLaunchCount() == 2);

  process->stop();
  process->resetSession();
  f.loop->waitFor(process->start(TerminalSize()));
  REQUIRE(f.factory.last()->args == vector<string>({"-q"}));
}

TEST_CASE("Stopping during startup rejects the startup", "[ManagedProcess]") {
  ProcessFixture f;
  auto spec = makeTestSpec("alpha");
  spec.startupGraceMs = 60000;
  auto process = f.make(spec);

  auto ready = process->start(TerminalSize());
  process->stop();
  REQUIRE_THROWS_AS(f.loop->waitFor(ready), StartupFailure);
  REQUIRE(f.loop->numTimers() == 0);
}

TEST_CASE("Interactive mode passes raw keystrokes through",
          "[ManagedProcess]") {
  ProcessFixture f;
  auto process = f.makeReady(makeTestSpec("alpha"));

  REQUIRE_THROWS_AS(process->writeRaw("x"), NotReadyError);
  process->enterInteractive();
  REQUIRE(process->getState() == ProcessState::INTERACTIVE);
  REQUIRE_THROWS_AS(process->send("hi"), NotReadyError);
  REQUIRE_THROWS_AS(process->enterInteractive(), NotReadyError);

  process->writeRaw("ls\x7f");
  REQUIRE(f.factory.last()->writes.back() == "ls\x7f");

  process->exitInteractive();
  REQUIRE(process->getState() == ProcessState::READY);
  REQUIRE(process->hasSessionContinuation());
  REQUIRE_THROWS_AS(process->writeRaw("x"), NotReadyError);
}

TEST_CASE("stripEcho drops only matching echoed lines", "[ManagedProcess]") {
  REQUIRE(ManagedProcess::stripEcho("hello\r\nworld", "hello") == "world");
  REQUIRE(ManagedProcess::stripEcho("\x1b[1mhello\x1b[0m\r\nx", "hello") ==
          "x");
  REQUIRE(ManagedProcess::stripEcho("hello", "hello") == "");
  REQUIRE(ManagedProcess::stripEcho("other\nworld", "hello") ==
          "other\nworld");
  REQUIRE(ManagedProcess::stripEcho("", "hello") == "");

  SECTION("Every line of a multi-line command is dropped") {
    REQUIRE(ManagedProcess::stripEcho("one\r\ntwo\r\n\r\nthree\r\nanswer",
                                      "one\ntwo\n\nthree") == "answer");
  }

  SECTION("Stripping stops at the first line that is not an echo") {
    REQUIRE(ManagedProcess::stripEcho("one\r\nanswer\r\ntwo\r\n",
                                      "one\ntwo") == "answer\r\ntwo\r\n");
  }
}

TEST_CASE("States have readable names", "[ManagedProcess]") {
  REQUIRE(stateToString(ProcessState::STARTING) == "Starting");
  REQUIRE(stateToString(ProcessState::READY) == "Ready");
  REQUIRE(stateToString(ProcessState::BUSY) == "Busy");
  REQUIRE(stateToString(ProcessState::INTERACTIVE) == "Interactive");
  REQUIRE(stateToString(ProcessState::DEAD) == "Dead");
}
