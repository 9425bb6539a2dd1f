#include "gopilot/agent/agent.hpp"

#include <memory>
#include <string>

#include <catch2/catch_all.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "test/gopilot/common/fakes.hpp"

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using namespace gopilot::agent;
using Catch::Matchers::ContainsSubstring;
using gopilot::test::FakeBackend;
using gopilot::test::FakeRepository;

namespace {

struct AgentFixture {
  std::shared_ptr<FakeBackend> backend = std::make_shared<FakeBackend>();
  std::shared_ptr<FakeRepository> repository = std::make_shared<FakeRepository>();
  Agent agent{backend, repository};
};

}  // namespace

TEST_CASE("Action names parse", "[agent]") {
  REQUIRE(ParseAgentAction("query") == AgentAction::kQuery);
  REQUIRE(ParseAgentAction("commit_message") == AgentAction::kCommitMessage);
  REQUIRE(ParseAgentAction("summarize_branch") == AgentAction::kSummarizeBranch);
  REQUIRE(ParseAgentAction("Review") == AgentAction::kUnknown);
  REQUIRE(ParseAgentAction("") == AgentAction::kUnknown);
  for (auto name : kAgentActionNames) {
    REQUIRE(ParseAgentAction(name) != AgentAction::kUnknown);
  }
}

TEST_CASE("TruncateDiff marks the cut", "[agent]") {
  REQUIRE(TruncateDiff("short") == "short");
  REQUIRE(TruncateDiff(std::string(kMaxDiffChars, 'x')) == std::string(kMaxDiffChars, 'x'));
  REQUIRE(TruncateDiff("abcdef", 3) == "abc\n... (truncated)");
  // Never inside a multi-byte character
  REQUIRE(TruncateDiff("ab\xC3\xA9", 3) == "ab\n... (truncated)");
}

TEST_CASE_METHOD(AgentFixture, "Review without changes skips the model", "[agent]") {
  REQUIRE(agent.ReviewChanges(std::nullopt) == "No changes detected to review.");
  REQUIRE(backend->CallCount() == 0);

  const auto envelope = agent.HandleRequest("review", nlohmann::json::object());
  REQUIRE(envelope == nlohmann::json{{"result", "No changes detected to review."}});
  REQUIRE(backend->CallCount() == 0);
}

TEST_CASE_METHOD(AgentFixture, "Review prefers staged changes", "[agent]") {
  repository->staged_diff = "+staged";
  repository->unstaged_diff = "+unstaged";
  backend->SetDefaultReply("looks good");

  REQUIRE(agent.ReviewChanges(std::nullopt) == "looks good");
  const auto calls = backend->Calls();
  REQUIRE(calls.size() == 1);
  REQUIRE(calls[0].prompt == "Review this diff:\n```diff\n+staged\n```");
  REQUIRE_THAT(calls[0].system.value_or(""), ContainsSubstring("code reviewer"));
}

TEST_CASE_METHOD(AgentFixture, "Review falls back to unstaged changes", "[agent]") {
  repository->staged_diff = "";
  repository->unstaged_diff = "+unstaged";

  REQUIRE(agent.ReviewChanges(std::nullopt).has_value());
  REQUIRE_THAT(backend->Calls()[0].prompt, ContainsSubstring("+unstaged"));
}

TEST_CASE_METHOD(AgentFixture, "Review against a base branch", "[agent]") {
  repository->staged_diff = "+staged";
  repository->ref_diffs["develop.."] = "+from develop";

  auto envelope = agent.HandleRequest("review", {{"base_branch", "develop"}});
  REQUIRE(envelope.contains("result"));
  REQUIRE_THAT(backend->Calls()[0].prompt, ContainsSubstring("+from develop"));

  // A base with no differences does not fall back to local changes
  auto empty = agent.ReviewChanges(std::string("release"));
  REQUIRE(empty == "No changes detected to review.");
}

TEST_CASE_METHOD(AgentFixture, "Large diffs are truncated in prompts", "[agent]") {
  repository->unstaged_diff = std::string(kMaxDiffChars + 100, '+');

  REQUIRE(agent.SuggestCommitMessage().has_value());
  const auto prompt = backend->Calls()[0].prompt;
  REQUIRE_THAT(prompt, ContainsSubstring("... (truncated)"));
  REQUIRE(prompt.size() < kMaxDiffChars + 100);
}

TEST_CASE_METHOD(AgentFixture, "Commit message needs changes", "[agent]") {
  REQUIRE(agent.SuggestCommitMessage() == "No changes detected.");
  REQUIRE(backend->CallCount() == 0);

  repository->staged_diff = "+x";
  backend->SetDefaultReply("feat: add x");
  REQUIRE(agent.HandleRequest("commit_message", {}) ==
          nlohmann::json{{"result", "feat: add x"}});
  REQUIRE_THAT(backend->Calls()[0].system.value_or(""), ContainsSubstring("conventional"));
}

TEST_CASE_METHOD(AgentFixture, "Explain diff between branches", "[agent]") {
  SECTION("No differences") {
    REQUIRE(agent.ExplainDiff("main", std::nullopt) ==
            "No differences found between the specified branches.");
    REQUIRE(backend->CallCount() == 0);
  }

  SECTION("Defaults to main against the working tree") {
    repository->ref_diffs["main.."] = "+work";
    auto envelope = agent.HandleRequest("explain_diff", nlohmann::json::object());
    REQUIRE(envelope.contains("result"));
    REQUIRE(backend->Calls()[0].prompt ==
            "Commits:\n(no unique commits)\n\nDiff:\n```diff\n+work\n```");
  }

  SECTION("Lists the unique commits") {
    repository->ref_diffs["main..feature"] = "+feature";
    repository->branch_commits = {"abc1234 add feature", "def5678 fix"};
    auto envelope = agent.HandleRequest(
        "explain_diff", {{"base", "main"}, {"target", "feature"}});
    REQUIRE(envelope.contains("result"));
    REQUIRE_THAT(
        backend->Calls()[0].prompt,
        ContainsSubstring("Commits:\nabc1234 add feature\ndef5678 fix\n\nDiff:"));
  }
}

TEST_CASE_METHOD(AgentFixture, "Summarize a branch", "[agent]") {
  SECTION("No commits") {
    REQUIRE(agent.SummarizeBranch(std::string("topic")) ==
            "No commits found on branch 'topic'.");
  }

  SECTION("Current branch by default") {
    repository->branch = "feature";
    repository->commits = {"c2 second", "c1 first"};
    REQUIRE(agent.SummarizeBranch(std::nullopt).has_value());
    REQUIRE(backend->Calls()[0].prompt ==
            "Branch: feature\nCommits:\nc2 second\nc1 first");
  }

  SECTION("Unknown current branch") {
    repository->branch = std::nullopt;
    REQUIRE_FALSE(agent.SummarizeBranch(std::nullopt).has_value());
    REQUIRE(agent.HandleRequest("summarize_branch", {}) ==
            nlohmann::json{{"error", std::string(kBackendFailure)}});
  }
}

TEST_CASE_METHOD(AgentFixture, "Queries carry repository context", "[agent]") {
  repository->branches = {"feature", "main"};
  repository->staged_files = {"a.py"};
  repository->commits = {"c1 first"};
  backend->SetDefaultReply("answer");

  auto envelope = agent.HandleRequest("query", {{"query", "what changed?"}});
  REQUIRE(envelope == nlohmann::json{{"result", "answer"}});

  const auto calls = backend->Calls();
  REQUIRE(calls[0].prompt == "what changed?");
  const auto system = calls[0].system.value_or("");
  REQUIRE_THAT(system, ContainsSubstring("Current branch: main"));
  REQUIRE_THAT(system, ContainsSubstring("Local branches: feature, main"));
  REQUIRE_THAT(system, ContainsSubstring("Staged files: a.py"));
  REQUIRE_THAT(system, ContainsSubstring("Recent commits:\nc1 first"));
  REQUIRE_THAT(system, !ContainsSubstring("Unstaged files"));
}

TEST_CASE_METHOD(AgentFixture, "Envelope errors", "[agent]") {
  SECTION("Unknown action") {
    auto envelope = agent.HandleRequest("deploy", {});
    REQUIRE(envelope == nlohmann::json{{"error", "Unknown agent action: deploy"}});
  }

  SECTION("Backend failure") {
    repository->staged_diff = "+x";
    backend->SetDefaultReply(std::nullopt);
    auto envelope = agent.HandleRequest("review", {});
    REQUIRE(envelope == nlohmann::json{{"error", std::string(kBackendFailure)}});
  }

  SECTION("Wrongly typed parameter") {
    auto envelope = agent.HandleRequest("query", {{"query", 42}});
    REQUIRE(envelope.contains("error"));
    REQUIRE(backend->CallCount() == 0);
  }
}

TEST_CASE_METHOD(AgentFixture, "Refs that look like options are rejected", "[agent]") {
  repository->ref_diffs["--output=/tmp/leak.."] = "+x";
  repository->staged_diff = "+y";
  repository->commits = {"c1 first"};

  SECTION("Diff base") {
    auto envelope = agent.HandleRequest("explain_diff", {{"base", "--output=/tmp/leak"}});
    REQUIRE(envelope == nlohmann::json{{"error", "Invalid ref: --output=/tmp/leak"}});
  }

  SECTION("Diff target") {
    auto envelope =
        agent.HandleRequest("explain_diff", {{"base", "main"}, {"target", "-p"}});
    REQUIRE(envelope == nlohmann::json{{"error", "Invalid ref: -p"}});
  }

  SECTION("Review base branch") {
    auto envelope = agent.HandleRequest("review", {{"base_branch", "--no-index"}});
    REQUIRE(envelope.at("error") == "Invalid ref: --no-index");
  }

  SECTION("Summarized branch") {
    auto envelope = agent.HandleRequest("summarize_branch", {{"branch", "-n1"}});
    REQUIRE(envelope.at("error") == "Invalid ref: -n1");
  }

  REQUIRE(backend->CallCount() == 0);
}

TEST_CASE_METHOD(AgentFixture, "Refs with inner dashes are accepted", "[agent]") {
  repository->ref_diffs["release-1.0..feature-x"] = "+x";
  auto envelope = agent.HandleRequest(
      "explain_diff", {{"base", "release-1.0"}, {"target", "feature-x"}});
  REQUIRE(envelope.contains("result"));
  REQUIRE(backend->CallCount() == 1);
}

TEST_CASE_METHOD(AgentFixture, "Status is returned as structured data", "[agent]") {
  repository->branch = std::nullopt;
  repository->unstaged_files = {"b.py"};

  auto envelope = agent.HandleRequest("status", {});
  const auto& result = envelope.at("result");
  REQUIRE(result.at("branch").is_null());
  REQUIRE(result.at("branches") == nlohmann::json::array({"main"}));
  REQUIRE(result.at("unstaged_files") == nlohmann::json::array({"b.py"}));
  REQUIRE(result.at("staged_files").empty());
  REQUIRE(backend->CallCount() == 0);
}
