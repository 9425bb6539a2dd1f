#include "gopilot/context/completion_text.hpp"

#include <string>

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using gopilot::context::CleanCompletion;
using gopilot::context::CompletionLabel;
using gopilot::context::ExtractWordAt;

TEST_CASE("CleanCompletion removes code fences", "[completion_text]") {
  REQUIRE(CleanCompletion("```python\nreturn a + b\n```") == "return a + b");
  REQUIRE(CleanCompletion("```\nx = 1\n```\n") == "x = 1");
  REQUIRE(CleanCompletion("return a + b") == "return a + b");
}

TEST_CASE("CleanCompletion removes answer labels", "[completion_text]") {
  REQUIRE(CleanCompletion("Completion: return a") == "return a");
  REQUIRE(CleanCompletion("OUTPUT:\n  x = 2") == "x = 2");
  REQUIRE(CleanCompletion("result: y") == "y");
  REQUIRE(CleanCompletion("results = []") == "results = []");
}

TEST_CASE("CleanCompletion keeps inner indentation", "[completion_text]") {
  const std::string body = "if x:\n    return 1\nreturn 2";
  REQUIRE(CleanCompletion("\n\n" + body + "\n\n") == body);
  REQUIRE(CleanCompletion("    indented()") == "    indented()");
}

TEST_CASE("CleanCompletion is idempotent", "[completion_text]") {
  const std::vector<std::string> samples{
      "```python\nCompletion: ```js\nfoo()\n```\n```",
      "Result: ```\n\n  bar\n\n```",
      "\n\n```\n```\n",
      "output: completion: x",
      "plain",
      "",
  };
  for (const auto& sample : samples) {
    const auto once = CleanCompletion(sample);
    REQUIRE(CleanCompletion(once) == once);
  }
}

TEST_CASE("ExtractWordAt finds the identifier under the cursor", "[completion_text]") {
  const std::string line = "result = add(1, 2)";
  REQUIRE(ExtractWordAt(line, 9) == "add");
  REQUIRE(ExtractWordAt(line, 12) == "add");
  REQUIRE(ExtractWordAt(line, 0) == "result");
  REQUIRE(ExtractWordAt(line, 7).empty());
  REQUIRE(ExtractWordAt(line, static_cast<int>(line.size())).empty());
  REQUIRE(ExtractWordAt("snake_case2", 5) == "snake_case2");
}

TEST_CASE("ExtractWordAt rejects out of range positions", "[completion_text]") {
  REQUIRE(ExtractWordAt("", 0).empty());
  REQUIRE(ExtractWordAt("abc", -1).empty());
  REQUIRE(ExtractWordAt("abc", 4).empty());
  REQUIRE(ExtractWordAt("abc", 3) == "abc");
}

TEST_CASE("CompletionLabel shows the first line", "[completion_text]") {
  REQUIRE(CompletionLabel("return a + b\nmore") == "return a + b");

  const std::string long_line(60, 'x');
  REQUIRE(CompletionLabel(long_line) == std::string(50, 'x') + "...");
  REQUIRE(CompletionLabel(std::string(50, 'y')) == std::string(50, 'y'));
}
