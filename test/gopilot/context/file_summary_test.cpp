#include "gopilot/context/file_summary.hpp"

#include <algorithm>
#include <string>

#include <catch2/catch_all.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using gopilot::context::DetectLanguage;
using gopilot::context::ExtractFileSummary;

TEST_CASE("DetectLanguage maps suffixes", "[file_summary]") {
  REQUIRE(DetectLanguage("file:///src/app.py") == "python");
  REQUIRE(DetectLanguage("file:///src/index.tsx") == "typescript");
  REQUIRE(DetectLanguage("file:///src/main.go") == "go");
  REQUIRE(DetectLanguage("file:///include/x.hpp") == "cpp");
  REQUIRE(DetectLanguage("file:///config.yml") == "yaml");
  REQUIRE(DetectLanguage("file:///README") == "text");
}

TEST_CASE("Python summaries keep imports and signatures", "[file_summary]") {
  const std::string source =
      "import os\n"
      "from typing import List\n"
      "\n"
      "class Greeter(Base):\n"
      "    def greet(self, name: str) -> str:\n"
      "        return 'hi ' + name\n"
      "\n"
      "async def fetch(url):\n"
      "    pass\n";

  REQUIRE(ExtractFileSummary(source, "python") ==
          "import os\n"
          "from typing import List\n"
          "class Greeter(Base):\n"
          "def greet(self, name:\n"
          "async def fetch(url):");
}

TEST_CASE("Python imports are only read near the top", "[file_summary]") {
  std::string source;
  for (int i = 0; i < 120; ++i) {
    source += fmt::format("x{} = {}\n", i, i);
  }
  source += "import late\n";
  source += "def tail():\n";

  REQUIRE(ExtractFileSummary(source, "python") == "def tail():");
}

TEST_CASE("Script summaries keep declarations", "[file_summary]") {
  const std::string source =
      "import React from 'react';\n"
      "const a = 1;\n"
      "function helper() {}\n"
      "export default App;\n";

  REQUIRE(ExtractFileSummary(source, "javascript") ==
          "import React from 'react';\nconst a = 1;\nexport default App;");

  const std::string wide = "const value = '" + std::string(100, 'v') + "';";
  REQUIRE(ExtractFileSummary(wide, "typescript").size() == 80);
}

TEST_CASE("Other languages fall back to leading lines", "[file_summary]") {
  std::string source = "\n\n";
  for (int i = 0; i < 15; ++i) {
    source += fmt::format("line {}\n", i);
  }
  const auto summary = ExtractFileSummary(source, "go");
  REQUIRE(summary.starts_with("line 0\nline 1"));
  REQUIRE(summary.ends_with("line 9"));

  // A python file with nothing to extract falls back too
  REQUIRE(ExtractFileSummary("x = 1\ny = 2", "python") == "x = 1\ny = 2");
  REQUIRE(ExtractFileSummary("", "text").empty());
}

TEST_CASE("Summaries are capped", "[file_summary]") {
  std::string source;
  for (int i = 0; i < 40; ++i) {
    source += fmt::format("def f{}():\n    pass\n", i);
  }
  const auto summary = ExtractFileSummary(source, "python");
  REQUIRE(std::ranges::count(summary, '\n') == 29);
  REQUIRE(summary.ends_with("def f29():"));
}
