#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace gopilot::repository {

// Which changes a diff covers.
// - nothing set: unstaged working-tree changes
// - staged: index against HEAD
// - base only: base against the working tree
// - base and target: between two refs
struct DiffSpec {
  bool staged{false};
  std::optional<std::string> base;
  std::optional<std::string> target;
};

// Snapshot of the repository, read fresh on every call
struct StatusSummary {
  std::optional<std::string> branch;
  std::vector<std::string> branches;
  std::vector<std::string> staged_files;
  std::vector<std::string> unstaged_files;
  std::vector<std::string> recent_commits;
};

// `branch` serializes as null when unknown
void to_json(nlohmann::json& j, const StatusSummary& s);

// Read-only view of a version-controlled working tree. Every query fails
// soft: an unavailable tool or a failing command yields an empty list or
// std::nullopt, never an exception.
class RepositoryInspector {
 public:
  static constexpr int kStatusCommitCount = 5;

  RepositoryInspector() = default;
  RepositoryInspector(const RepositoryInspector&) = delete;
  RepositoryInspector(RepositoryInspector&&) = delete;
  auto operator=(const RepositoryInspector&) -> RepositoryInspector& = delete;
  auto operator=(RepositoryInspector&&) -> RepositoryInspector& = delete;
  virtual ~RepositoryInspector() = default;

  [[nodiscard]] virtual auto Root() const -> const std::filesystem::path& = 0;

  virtual auto IsRepository() -> bool = 0;

  virtual auto CurrentBranch() -> std::optional<std::string> = 0;

  // Sorted. `include_remote` adds remote-tracking branches.
  virtual auto ListBranches(bool include_remote) -> std::vector<std::string> = 0;

  // Trimmed diff text; empty when there are no changes
  virtual auto Diff(const DiffSpec& spec) -> std::optional<std::string> = 0;

  virtual auto ChangedFiles(const DiffSpec& spec) -> std::vector<std::string> = 0;

  // One-line summaries, newest first
  virtual auto CommitLog(int count, const std::optional<std::string>& ref)
      -> std::vector<std::string> = 0;

  // Commits reachable from `target` (HEAD when absent) but not from `base`
  virtual auto BranchCommits(
      const std::string& base, const std::optional<std::string>& target,
      int count) -> std::vector<std::string> = 0;

  // Tracked paths relative to the root, sorted
  virtual auto ListProjectFiles() -> std::vector<std::string> = 0;

  virtual auto FileAtRef(const std::string& path, const std::string& ref)
      -> std::optional<std::string> = 0;

  auto Status() -> StatusSummary;
};

}  // namespace gopilot::repository
