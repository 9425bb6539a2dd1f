#include "gopilot/repository/repository_inspector.hpp"

namespace gopilot::repository {

void to_json(nlohmann::json& j, const StatusSummary& s) {
  j = nlohmann::json{
      {"branch", s.branch ? nlohmann::json(*s.branch) : nlohmann::json(nullptr)},
      {"branches", s.branches},
      {"staged_files", s.staged_files},
      {"unstaged_files", s.unstaged_files},
      {"recent_commits", s.recent_commits},
  };
}

auto RepositoryInspector::Status() -> StatusSummary {
  return StatusSummary{
      .branch = CurrentBranch(),
      .branches = ListBranches(false),
      .staged_files = ChangedFiles(DiffSpec{.staged = true}),
      .unstaged_files = ChangedFiles(DiffSpec{}),
      .recent_commits = CommitLog(kStatusCommitCount, std::nullopt),
  };
}

}  // namespace gopilot::repository
