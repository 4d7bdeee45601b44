#include "Headers.hpp"
#include "TestHeaders.hpp"

using namespace aic;

TEST_CASE("replaceAll replaces all occurrences", "[StringUtils]") {
  std::string str = "hello world, hello universe, hello everyone";
  int count = replaceAll(str, "hello", "hi");

  REQUIRE(count == 3);
  REQUIRE(str == "hi world, hi universe, hi everyone");
}

TEST_CASE("replaceAll handles no matches", "[StringUtils]") {
  std::string str = "hello world";
  int count = replaceAll(str, "goodbye", "hi");

  REQUIRE(count == 0);
  REQUIRE(str == "hello world");
}

TEST_CASE("replaceAll returns 0 for empty pattern", "[StringUtils]") {
  std::string str = "hello world";
  int count = replaceAll(str, "", "hi");

  REQUIRE(count == 0);
  REQUIRE(str == "hello world");
}

TEST_CASE("replaceAll handles overlapping replacement", "[StringUtils]") {
  std::string str = "xxx";
  int count = replaceAll(str, "x", "yx");

  REQUIRE(count == 3);
  REQUIRE(str == "yxyxyx");
}

TEST_CASE("split keeps empty fields between delimiters", "[StringUtils]") {
  auto parts = split("a\r\rb", '\r');

  REQUIRE(parts.size() == 3);
  REQUIRE(parts[0] == "a");
  REQUIRE(parts[1] == "");
  REQUIRE(parts[2] == "b");
}

TEST_CASE("splitWhitespace drops runs of blanks", "[StringUtils]") {
  auto parts = splitWhitespace("  --resume \t latest  ");

  REQUIRE(parts.size() == 2);
  REQUIRE(parts[0] == "--resume");
  REQUIRE(parts[1] == "latest");
  REQUIRE(splitWhitespace("   ").empty());
}

TEST_CASE("trim strips both ends only", "[StringUtils]") {
  REQUIRE(trim("  a b \r\n") == "a b");
  REQUIRE(trim("\t\n") == "");
  REQUIRE(trim("x") == "x");
}
