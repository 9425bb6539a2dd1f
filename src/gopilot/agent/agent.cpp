#include "gopilot/agent/agent.hpp"

#include <exception>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "gopilot/utils/scoped_timer.hpp"
#include "gopilot/utils/text_utils.hpp"

namespace gopilot::agent {

namespace {

constexpr auto kQuerySystem =
    "You are a GitHub Copilot-style agent embedded in a developer's local "
    "environment. You have access to the git repository context shown "
    "below. Answer the developer's question concisely and helpfully.\n\n"
    "Repository context:\n";

constexpr auto kReviewSystem =
    "You are a senior code reviewer. Review the following diff and provide "
    "actionable feedback. Focus on bugs, readability, performance, and "
    "security. Be concise.";

constexpr auto kCommitSystem =
    "You are a commit message generator. Based on the diff provided, write a "
    "clear, conventional commit message. Use the format:\n"
    "<type>(<scope>): <description>\n\n<body>\n\n"
    "Types: feat, fix, docs, style, refactor, test, chore.";

constexpr auto kExplainSystem =
    "You are a technical writer. Explain the following code changes between "
    "two git branches in clear, concise language suitable for a pull request "
    "description.";

constexpr auto kSummarySystem =
    "You are a project manager assistant. Summarize the work done on this "
    "branch based on the commit history. Be concise.";

// Absent, null and empty values all read as std::nullopt
auto OptionalParam(const nlohmann::json& params, std::string_view key)
    -> std::optional<std::string> {
  if (!params.is_object()) {
    return std::nullopt;
  }
  auto it = params.find(key);
  if (it == params.end() || it->is_null()) {
    return std::nullopt;
  }
  auto value = it->get<std::string>();
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

// Params naming git refs
constexpr std::array<std::string_view, 4> kRefParams = {
    "base", "target", "branch", "base_branch"};

// First ref param that git would read as an option
auto FindOptionLikeRef(const nlohmann::json& params)
    -> std::optional<std::string> {
  for (const auto key : kRefParams) {
    auto value = OptionalParam(params, key);
    if (value && value->starts_with('-')) {
      return value;
    }
  }
  return std::nullopt;
}

auto FormatRepositoryContext(const repository::StatusSummary& status)
    -> std::string {
  std::string text = fmt::format(
      "Current branch: {}\nLocal branches: {}",
      status.branch.value_or("unknown"), fmt::join(status.branches, ", "));
  if (!status.staged_files.empty()) {
    text += fmt::format(
        "\nStaged files: {}", fmt::join(status.staged_files, ", "));
  }
  if (!status.unstaged_files.empty()) {
    text += fmt::format(
        "\nUnstaged files: {}", fmt::join(status.unstaged_files, ", "));
  }
  if (!status.recent_commits.empty()) {
    text += fmt::format(
        "\nRecent commits:\n{}", fmt::join(status.recent_commits, "\n"));
  }
  return text;
}

}  // namespace

auto ParseAgentAction(std::string_view name) -> AgentAction {
  if (name == "query") {
    return AgentAction::kQuery;
  }
  if (name == "review") {
    return AgentAction::kReview;
  }
  if (name == "commit_message") {
    return AgentAction::kCommitMessage;
  }
  if (name == "explain_diff") {
    return AgentAction::kExplainDiff;
  }
  if (name == "summarize_branch") {
    return AgentAction::kSummarizeBranch;
  }
  if (name == "status") {
    return AgentAction::kStatus;
  }
  return AgentAction::kUnknown;
}

auto TruncateDiff(std::string_view text, std::size_t limit) -> std::string {
  if (text.size() <= limit) {
    return std::string(text);
  }
  return utils::Prefix(text, limit) + "\n... (truncated)";
}

Agent::Agent(
    std::shared_ptr<backend::ModelBackend> backend,
    std::shared_ptr<repository::RepositoryInspector> repository,
    std::shared_ptr<spdlog::logger> logger)
    : backend_(std::move(backend)),
      repository_(std::move(repository)),
      logger_(logger ? logger : spdlog::default_logger()) {
}

auto Agent::Ask(const std::string& prompt, const std::string& system)
    -> std::optional<std::string> {
  return backend_->Generate(prompt, system, std::nullopt);
}

auto Agent::PendingDiff() -> std::string {
  auto diff = repository_->Diff(repository::DiffSpec{.staged = true});
  if (!diff || diff->empty()) {
    diff = repository_->Diff(repository::DiffSpec{});
  }
  return diff.value_or("");
}

auto Agent::ProcessQuery(const std::string& query)
    -> std::optional<std::string> {
  const auto context = FormatRepositoryContext(repository_->Status());
  return Ask(query, kQuerySystem + context);
}

auto Agent::ReviewChanges(const std::optional<std::string>& base_branch)
    -> std::optional<std::string> {
  std::string diff;
  if (base_branch) {
    diff = repository_->Diff(repository::DiffSpec{.base = base_branch})
               .value_or("");
  } else {
    diff = PendingDiff();
  }
  if (diff.empty()) {
    return "No changes detected to review.";
  }
  return Ask(
      fmt::format("Review this diff:\n```diff\n{}\n```", TruncateDiff(diff)),
      kReviewSystem);
}

auto Agent::SuggestCommitMessage() -> std::optional<std::string> {
  const auto diff = PendingDiff();
  if (diff.empty()) {
    return "No changes detected.";
  }
  return Ask(
      fmt::format(
          "Generate a commit message for:\n```diff\n{}\n```",
          TruncateDiff(diff)),
      kCommitSystem);
}

auto Agent::ExplainDiff(
    const std::string& base, const std::optional<std::string>& target)
    -> std::optional<std::string> {
  const auto diff =
      repository_->Diff(repository::DiffSpec{.base = base, .target = target})
          .value_or("");
  if (diff.empty()) {
    return "No differences found between the specified branches.";
  }

  const auto commits =
      repository_->BranchCommits(base, target, kBranchCommitCount);
  const std::string commits_text =
      commits.empty() ? std::string("(no unique commits)")
                      : fmt::format("{}", fmt::join(commits, "\n"));
  return Ask(
      fmt::format(
          "Commits:\n{}\n\nDiff:\n```diff\n{}\n```", commits_text,
          TruncateDiff(diff)),
      kExplainSystem);
}

auto Agent::SummarizeBranch(const std::optional<std::string>& branch)
    -> std::optional<std::string> {
  const auto name = branch ? branch : repository_->CurrentBranch();
  if (!name) {
    logger_->warn("Cannot summarize: current branch is unknown");
    return std::nullopt;
  }

  const auto commits = repository_->CommitLog(kSummaryCommitCount, name);
  if (commits.empty()) {
    return fmt::format("No commits found on branch '{}'.", *name);
  }
  return Ask(
      fmt::format("Branch: {}\nCommits:\n{}", *name, fmt::join(commits, "\n")),
      kSummarySystem);
}

auto Agent::Status() -> repository::StatusSummary {
  return repository_->Status();
}

auto Agent::HandleRequest(std::string_view action, const nlohmann::json& params)
    -> nlohmann::json {
  utils::ScopedTimer timer(fmt::format("Agent action '{}'", action), logger_);

  try {
    if (auto ref = FindOptionLikeRef(params)) {
      logger_->warn("Rejected agent ref '{}' for action={}", *ref, action);
      return nlohmann::json{{"error", fmt::format("Invalid ref: {}", *ref)}};
    }

    std::optional<std::string> text;
    switch (ParseAgentAction(action)) {
      case AgentAction::kQuery:
        text = ProcessQuery(OptionalParam(params, "query").value_or(""));
        break;
      case AgentAction::kReview:
        text = ReviewChanges(OptionalParam(params, "base_branch"));
        break;
      case AgentAction::kCommitMessage:
        text = SuggestCommitMessage();
        break;
      case AgentAction::kExplainDiff:
        text = ExplainDiff(
            OptionalParam(params, "base")
                .value_or(std::string(kDefaultDiffBase)),
            OptionalParam(params, "target"));
        break;
      case AgentAction::kSummarizeBranch:
        text = SummarizeBranch(OptionalParam(params, "branch"));
        break;
      case AgentAction::kStatus:
        return nlohmann::json{{"result", Status()}};
      case AgentAction::kUnknown:
        logger_->warn("Unknown agent action: {}", action);
        return nlohmann::json{
            {"error", fmt::format("Unknown agent action: {}", action)}};
    }

    if (!text) {
      return nlohmann::json{{"error", std::string(kBackendFailure)}};
    }
    return nlohmann::json{{"result", *text}};
  } catch (const std::exception& e) {
    logger_->error("Agent error for action={}: {}", action, e.what());
    return nlohmann::json{{"error", e.what()}};
  }
}

}  // namespace gopilot::agent
