#include "ConversationRelay.hpp"
#include "FakeConsole.hpp"
#include "FakePtyChannel.hpp"
#include "SupervisorErrors.hpp"
#include "TestHeaders.hpp"

using namespace aic;

namespace {
struct RelayFixture {
  RelayFixture()
      : loop(new EventLoop()),
        factory(loop),
        console(new FakeConsole()),
        log(new ConversationLog()) {
    factory.responder = [](const string& input) {
      return "answer to " + trim(input) + "\r\n";
    };
    supervisor.reset(new ProcessSupervisor(loop, factory.get(), console));
    auto alpha = makeTestSpec("alpha");
    alpha.displayName = "Alpha Assistant";
    supervisor->registerTool(alpha);
    supervisor->registerTool(makeTestSpec("beta"));
    relay.reset(new ConversationRelay(loop, supervisor, log));
  }

  shared_ptr<EventLoop> loop;
  FakePtyChannelFactory factory;
  shared_ptr<FakeConsole> console;
  shared_ptr<ConversationLog> log;
  shared_ptr<ProcessSupervisor> supervisor;
  shared_ptr<ConversationRelay> relay;
};
}  // namespace

TEST_CASE("The forward envelope has a fixed shape", "[ConversationRelay]") {
  REQUIRE(ConversationRelay::buildEnvelope("Claude Code", "Use a mutex.", "") ==
          "Another AI assistant (Claude Code) provided this response. Please "
          "review and share your thoughts:\n\n---\nUse a mutex.\n---");
  REQUIRE(ConversationRelay::buildEnvelope("Gemini CLI", "A", "Be brief") ==
          "Another AI assistant (Gemini CLI) provided this response. Please "
          "review and share your thoughts:\n\n---\nA\n---\n\nAdditional "
          "context: Be brief");
}

TEST_CASE("ask records the exchange", "[ConversationRelay]") {
  RelayFixture f;
  f.supervisor->startOne("alpha");

  REQUIRE(f.relay->ask("alpha", "hi") == "answer to hi");
  REQUIRE(f.log->size() == 2);
  REQUIRE(f.log->getMessages()[0].role == ConversationMessage::USER);
  REQUIRE(f.log->getMessages()[0].content == "hi");
  REQUIRE(f.log->getMessages()[1].role == ConversationMessage::ASSISTANT);
  REQUIRE(f.log->getMessages()[1].tool == "alpha");
}

TEST_CASE("A refused ask leaves no trace", "[ConversationRelay]") {
  RelayFixture f;

  REQUIRE_THROWS_AS(f.relay->ask("alpha", "hi"), NotReadyError);
  REQUIRE(f.log->empty());
  REQUIRE_THROWS_AS(f.relay->ask("nope", "hi"), ConfigurationError);
  REQUIRE(f.log->empty());
}

TEST_CASE("A tool dying mid-answer rolls the question back",
          "[ConversationRelay]") {
  RelayFixture f;
  f.supervisor->startOne("alpha");
  f.factory.last()->responder = nullptr;
  FakePtyChannelFactory* fac = &f.factory;
  f.loop->addTimer(10, [fac]() { fac->last()->emitExit(9); });

  REQUIRE_THROWS_AS(f.relay->ask("alpha", "hi"), ProcessExitedError);
  REQUIRE(f.log->empty());
}

TEST_CASE("Forwarding sends the last answer to the other tool",
          "[ConversationRelay]") {
  RelayFixture f;
  f.supervisor->startOne("alpha");
  f.supervisor->startOne("beta");
  f.relay->ask("alpha", "design it");

  string response = f.relay->forward("", "", "Focus on errors");

  string envelope = ConversationRelay::buildEnvelope(
      "Alpha Assistant", "answer to design it", "Focus on errors");
  auto betaChannel = f.factory.channels[1];
  REQUIRE(betaChannel->writes.back() == envelope + "\n");
  REQUIRE(f.log->size() == 4);
  REQUIRE(f.log->getMessages()[2].tool == "beta");
  REQUIRE(f.log->getMessages()[2].content == envelope);
  REQUIRE(f.log->getMessages()[3].tool == "beta");
  REQUIRE(response == f.log->getMessages()[3].content);
}

TEST_CASE("planForward picks the source and target", "[ConversationRelay]") {
  RelayFixture f;
  f.log->addAssistantMessage("beta", "beta said");

  ForwardPlan plan = f.relay->planForward("", "", "");
  REQUIRE(plan.fromTool == "beta");
  REQUIRE(plan.toTool == "alpha");
  REQUIRE(plan.envelope ==
          ConversationRelay::buildEnvelope("beta Tool", "beta said", ""));

  f.log->addAssistantMessage("alpha", "alpha said");
  plan = f.relay->planForward("beta", "", "");
  REQUIRE(plan.fromTool == "beta");
  REQUIRE(plan.toTool == "alpha");

  plan = f.relay->planForward("alpha", "alpha", "");
  REQUIRE(plan.toTool == "alpha");
}

TEST_CASE("Nothing to forward is reported", "[ConversationRelay]") {
  RelayFixture f;
  REQUIRE_THROWS_AS(f.relay->planForward("", "", ""), NothingToForwardError);

  f.log->addAssistantMessage("beta", "beta said");
  REQUIRE_THROWS_AS(f.relay->planForward("alpha", "", ""),
                    NothingToForwardError);
  REQUIRE_THROWS_AS(f.relay->forward("alpha", "beta"), NothingToForwardError);
  REQUIRE(f.log->size() == 1);
}

TEST_CASE("Forwarding to or from an unknown tool is a configuration error",
          "[ConversationRelay]") {
  RelayFixture f;
  f.log->addAssistantMessage("alpha", "alpha said");

  REQUIRE_THROWS_AS(f.relay->planForward("ghost", "", ""), ConfigurationError);
  REQUIRE_THROWS_AS(f.relay->planForward("", "ghost", ""), ConfigurationError);
}

TEST_CASE("A single tool has nobody to forward to", "[ConversationRelay]") {
  auto loop = make_shared<EventLoop>();
  FakePtyChannelFactory factory(loop);
  auto supervisor = make_shared<ProcessSupervisor>(
      loop, factory.get(), make_shared<FakeConsole>());
  supervisor->registerTool(makeTestSpec("solo"));
  auto log = make_shared<ConversationLog>();
  ConversationRelay relay(loop, supervisor, log);
  log->addAssistantMessage("solo", "talking to myself");

  REQUIRE_THROWS_AS(relay.planForward("", "", ""), ConfigurationError);
}
