#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "gopilot/repository/command_runner.hpp"
#include "gopilot/repository/repository_inspector.hpp"

namespace gopilot::repository {

// Answers repository queries with `git -C <root> ...` subprocesses
class GitRepository : public RepositoryInspector {
 public:
  GitRepository(
      std::filesystem::path root, CommandRunner runner,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  [[nodiscard]] auto Root() const -> const std::filesystem::path& override {
    return root_;
  }

  auto IsRepository() -> bool override;
  auto CurrentBranch() -> std::optional<std::string> override;
  auto ListBranches(bool include_remote) -> std::vector<std::string> override;
  auto Diff(const DiffSpec& spec) -> std::optional<std::string> override;
  auto ChangedFiles(const DiffSpec& spec) -> std::vector<std::string> override;
  auto CommitLog(int count, const std::optional<std::string>& ref)
      -> std::vector<std::string> override;
  auto BranchCommits(
      const std::string& base, const std::optional<std::string>& target,
      int count) -> std::vector<std::string> override;
  auto ListProjectFiles() -> std::vector<std::string> override;
  auto FileAtRef(const std::string& path, const std::string& ref)
      -> std::optional<std::string> override;

 private:
  // Trimmed stdout, or std::nullopt on any failure
  auto RunGit(std::vector<std::string> args) -> std::optional<std::string>;

  // Non-blank trimmed lines of a command's output
  auto RunGitLines(std::vector<std::string> args) -> std::vector<std::string>;

  static auto DiffArgs(const DiffSpec& spec, bool name_only)
      -> std::vector<std::string>;

  std::filesystem::path root_;
  CommandRunner runner_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace gopilot::repository
