#pragma once

#include <array>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "gopilot/backend/model_backend.hpp"
#include "gopilot/repository/repository_inspector.hpp"

namespace gopilot::agent {

enum class AgentAction {
  kQuery,
  kReview,
  kCommitMessage,
  kExplainDiff,
  kSummarizeBranch,
  kStatus,
  kUnknown,
};

// Wire names of every supported action, in advertisement order
constexpr std::array<std::string_view, 6> kAgentActionNames = {
    "query",        "review",           "commit_message",
    "explain_diff", "summarize_branch", "status"};

auto ParseAgentAction(std::string_view name) -> AgentAction;

constexpr std::size_t kMaxDiffChars = 4000;
constexpr int kSummaryCommitCount = 20;
constexpr int kBranchCommitCount = 50;
constexpr std::string_view kDefaultDiffBase = "main";

constexpr std::string_view kBackendFailure =
    "Failed to generate response (Ollama unreachable?)";

// Cuts `text` to `limit` bytes and marks the cut
auto TruncateDiff(std::string_view text, std::size_t limit = kMaxDiffChars)
    -> std::string;

// Git-aware assistant actions. Each action reads the repository fresh and
// asks the backend at most once; answers that need no model are returned
// directly. Actions return std::nullopt when the backend fails.
class Agent {
 public:
  Agent(
      std::shared_ptr<backend::ModelBackend> backend,
      std::shared_ptr<repository::RepositoryInspector> repository,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  auto ProcessQuery(const std::string& query) -> std::optional<std::string>;

  // Against `base_branch` when given, else staged changes, else unstaged
  auto ReviewChanges(const std::optional<std::string>& base_branch)
      -> std::optional<std::string>;

  auto SuggestCommitMessage() -> std::optional<std::string>;

  auto ExplainDiff(
      const std::string& base, const std::optional<std::string>& target)
      -> std::optional<std::string>;

  // Current branch when `branch` is absent
  auto SummarizeBranch(const std::optional<std::string>& branch)
      -> std::optional<std::string>;

  auto Status() -> repository::StatusSummary;

  // Runs one action and wraps the outcome as {"result": ...} or
  // {"error": "..."}. Never throws.
  auto HandleRequest(std::string_view action, const nlohmann::json& params)
      -> nlohmann::json;

  [[nodiscard]] auto Repository() const
      -> const std::shared_ptr<repository::RepositoryInspector>& {
    return repository_;
  }

 private:
  // Staged diff, falling back to the unstaged one
  auto PendingDiff() -> std::string;

  auto Ask(const std::string& prompt, const std::string& system)
      -> std::optional<std::string>;

  std::shared_ptr<backend::ModelBackend> backend_;
  std::shared_ptr<repository::RepositoryInspector> repository_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace gopilot::agent
