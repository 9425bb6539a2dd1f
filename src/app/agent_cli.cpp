#include "app/agent_cli.hpp"

#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <fmt/ranges.h>

#include "gopilot/utils/text_utils.hpp"

namespace app {

namespace {

auto SplitWords(std::string_view line) -> std::vector<std::string> {
  std::istringstream stream{std::string(line)};
  std::vector<std::string> words;
  for (std::string word; stream >> word;) {
    words.push_back(std::move(word));
  }
  return words;
}

auto WordAt(const std::vector<std::string>& words, std::size_t index)
    -> std::optional<std::string> {
  if (index < words.size()) {
    return words[index];
  }
  return std::nullopt;
}

auto IsCommand(std::string_view line, std::string_view command) -> bool {
  return line == command ||
         (line.starts_with(command) && line.size() > command.size() &&
          line[command.size()] == ' ');
}

auto ListOrNone(const std::vector<std::string>& values) -> std::string {
  return values.empty() ? std::string("(none)")
                        : fmt::format("{}", fmt::join(values, ", "));
}

void PrintReply(std::ostream& out, const std::optional<std::string>& reply) {
  fmt::print(out, "{}\n", reply && !reply->empty() ? *reply : kNoResponse);
}

void PrintStatus(std::ostream& out, const gopilot::repository::StatusSummary& s) {
  fmt::print(out, "  branch: {}\n", s.branch.value_or("unknown"));
  fmt::print(out, "  branches: {}\n", ListOrNone(s.branches));
  fmt::print(out, "  staged_files: {}\n", ListOrNone(s.staged_files));
  fmt::print(out, "  unstaged_files: {}\n", ListOrNone(s.unstaged_files));
  fmt::print(out, "  recent_commits: {}\n", ListOrNone(s.recent_commits));
}

}  // namespace

auto RunAgentCli(gopilot::agent::Agent* agent, std::istream& in, std::ostream& out)
    -> int {
  if (agent == nullptr) {
    fmt::print(out, "Error: not inside a git repository. Agent mode requires git.\n");
    return 1;
  }

  const auto branch = agent->Repository()->CurrentBranch();
  fmt::print(out, "gopilot agent - branch: {}\n", branch.value_or("unknown"));
  fmt::print(
      out,
      "Commands: /review, /commit, /diff <base> [target], /summary [branch], "
      "/status, /quit\nOr type a question.\n\n");

  std::string raw;
  while (true) {
    fmt::print(out, "{}", kAgentPrompt);
    out.flush();
    if (!std::getline(in, raw)) {
      fmt::print(out, "\nBye!\n");
      break;
    }

    const std::string line(gopilot::utils::Trim(raw));
    if (line.empty()) {
      continue;
    }
    if (line == "/quit" || line == "/exit" || line == "/q") {
      fmt::print(out, "Bye!\n");
      break;
    }

    if (line == "/status") {
      PrintStatus(out, agent->Status());
    } else if (line == "/review") {
      fmt::print(out, "Reviewing changes ...\n");
      PrintReply(out, agent->ReviewChanges(std::nullopt));
    } else if (line == "/commit") {
      fmt::print(out, "Generating commit message ...\n");
      PrintReply(out, agent->SuggestCommitMessage());
    } else if (IsCommand(line, "/diff")) {
      const auto words = SplitWords(line);
      const auto base = WordAt(words, 1).value_or(
          std::string(gopilot::agent::kDefaultDiffBase));
      const auto target = WordAt(words, 2);
      fmt::print(out, "Explaining diff {}..{} ...\n", base, target.value_or("HEAD"));
      PrintReply(out, agent->ExplainDiff(base, target));
    } else if (IsCommand(line, "/summary")) {
      const auto words = SplitWords(line);
      fmt::print(out, "Summarizing branch ...\n");
      PrintReply(out, agent->SummarizeBranch(WordAt(words, 1)));
    } else {
      fmt::print(out, "Thinking ...\n");
      PrintReply(out, agent->ProcessQuery(line));
    }
  }
  return 0;
}

}  // namespace app
