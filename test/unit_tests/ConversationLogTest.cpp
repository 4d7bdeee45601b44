#include "ConversationLog.hpp"
#include "TestHeaders.hpp"

using namespace aic;

TEST_CASE("Messages are kept in order", "[ConversationLog]") {
  ConversationLog log;
  REQUIRE(log.empty());

  log.addUserMessage("alpha", "question");
  log.addAssistantMessage("alpha", "answer");

  REQUIRE(log.size() == 2);
  const auto& messages = log.getMessages();
  REQUIRE(messages[0].role == ConversationMessage::USER);
  REQUIRE(messages[0].tool == "alpha");
  REQUIRE(messages[0].content == "question");
  REQUIRE(messages[1].role == ConversationMessage::ASSISTANT);
  REQUIRE(messages[1].content == "answer");
  REQUIRE(messages[0].timestamp <= messages[1].timestamp);
}

TEST_CASE("The last response can be filtered by tool", "[ConversationLog]") {
  ConversationLog log;
  ConversationMessage found;
  REQUIRE_FALSE(log.getLastResponse("", &found));

  log.addUserMessage("alpha", "q1");
  log.addAssistantMessage("alpha", "from alpha");
  log.addUserMessage("beta", "q2");
  log.addAssistantMessage("beta", "from beta");
  log.addUserMessage("alpha", "q3");

  REQUIRE(log.getLastResponse("", &found));
  REQUIRE(found.tool == "beta");
  REQUIRE(found.content == "from beta");

  REQUIRE(log.getLastResponse("alpha", &found));
  REQUIRE(found.content == "from alpha");

  REQUIRE_FALSE(log.getLastResponse("gamma", &found));
}

TEST_CASE("removeLastMessage rolls back one entry", "[ConversationLog]") {
  ConversationLog log;
  REQUIRE_FALSE(log.removeLastMessage());

  log.addUserMessage("alpha", "keep");
  log.addUserMessage("alpha", "drop");
  REQUIRE(log.removeLastMessage());
  REQUIRE(log.size() == 1);
  REQUIRE(log.getMessages().back().content == "keep");

  log.clear();
  REQUIRE(log.empty());
}

TEST_CASE("History shows numbered previews", "[ConversationLog]") {
  ConversationLog log;
  REQUIRE(log.formatHistory() == "No messages in session.");

  log.addUserMessage("alpha", "short question");
  log.addAssistantMessage("alpha", string(300, 'x'));
  string history = log.formatHistory();

  REQUIRE(history.find("[1] ") == 0);
  REQUIRE(history.find(" - You:\nshort question") != string::npos);
  REQUIRE(history.find("\n\n[2] ") != string::npos);
  REQUIRE(history.find(" - alpha:\n" + string(200, 'x') + "...") !=
          string::npos);
  REQUIRE(history.find(string(201, 'x')) == string::npos);
}

TEST_CASE("History previews can be shortened", "[ConversationLog]") {
  ConversationLog log;
  log.addAssistantMessage("beta", "abcdefghij");

  string history = log.formatHistory(4);
  REQUIRE(history.substr(history.length() - 7) == "abcd...");
}

TEST_CASE("History previews end on a whole character", "[ConversationLog]") {
  ConversationLog log;
  // A cut at 4 bytes would land inside the two-byte e-acute
  log.addAssistantMessage("beta", "caf\xc3\xa9 au lait");

  string history = log.formatHistory(4);
  REQUIRE(history.substr(history.length() - 6) == "caf...");

  history = log.formatHistory(5);
  REQUIRE(history.substr(history.length() - 8) == "caf\xc3\xa9...");
}
