#pragma once

#include <deque>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "gopilot/backend/model_backend.hpp"
#include "gopilot/repository/repository_inspector.hpp"

namespace gopilot::test {

// Records every generation request and answers from a script
class FakeBackend : public backend::ModelBackend {
 public:
  struct Call {
    std::string prompt;
    std::optional<std::string> system;
  };

  // Queued replies are used first, then `default_reply`
  void QueueReply(std::optional<std::string> reply) {
    std::lock_guard lock(mutex_);
    replies_.push_back(std::move(reply));
  }

  void SetDefaultReply(std::optional<std::string> reply) {
    std::lock_guard lock(mutex_);
    default_reply_ = std::move(reply);
  }

  // Generate throws std::runtime_error(`message`) while set
  void SetFailure(std::optional<std::string> message) {
    std::lock_guard lock(mutex_);
    failure_ = std::move(message);
  }

  void SetHealthy(bool healthy) {
    std::lock_guard lock(mutex_);
    healthy_ = healthy;
  }

  auto Generate(
      const std::string& prompt, const std::optional<std::string>& system,
      const std::optional<std::string>& /*model*/)
      -> std::optional<std::string> override {
    std::lock_guard lock(mutex_);
    calls_.push_back(Call{.prompt = prompt, .system = system});
    if (failure_) {
      throw std::runtime_error(*failure_);
    }
    if (!replies_.empty()) {
      auto reply = std::move(replies_.front());
      replies_.pop_front();
      return reply;
    }
    return default_reply_;
  }

  auto HealthCheck() -> bool override {
    std::lock_guard lock(mutex_);
    return healthy_;
  }

  auto ListModels() -> std::vector<std::string> override {
    std::lock_guard lock(mutex_);
    return healthy_ ? std::vector<std::string>{"codellama"}
                    : std::vector<std::string>{};
  }

  [[nodiscard]] auto Calls() const -> std::vector<Call> {
    std::lock_guard lock(mutex_);
    return calls_;
  }

  [[nodiscard]] auto CallCount() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return calls_.size();
  }

 private:
  mutable std::mutex mutex_;
  std::deque<std::optional<std::string>> replies_;
  std::optional<std::string> default_reply_{"ok"};
  std::optional<std::string> failure_;
  bool healthy_{true};
  std::vector<Call> calls_;
};

// In-memory repository whose answers are plain fields
class FakeRepository : public repository::RepositoryInspector {
 public:
  explicit FakeRepository(std::filesystem::path root = "/work/project")
      : root_(std::move(root)) {
  }

  bool is_repository{true};
  std::optional<std::string> branch{"main"};
  std::vector<std::string> branches{"main"};
  std::optional<std::string> staged_diff;
  std::optional<std::string> unstaged_diff;
  // Keyed by "base..target", target empty when absent
  std::map<std::string, std::string> ref_diffs;
  std::vector<std::string> staged_files;
  std::vector<std::string> unstaged_files;
  std::vector<std::string> commits;
  std::vector<std::string> branch_commits;
  std::vector<std::string> project_files;

  [[nodiscard]] auto Root() const -> const std::filesystem::path& override {
    return root_;
  }

  auto IsRepository() -> bool override {
    return is_repository;
  }

  auto CurrentBranch() -> std::optional<std::string> override {
    return branch;
  }

  auto ListBranches(bool /*include_remote*/) -> std::vector<std::string> override {
    return branches;
  }

  auto Diff(const repository::DiffSpec& spec)
      -> std::optional<std::string> override {
    if (spec.base) {
      auto it = ref_diffs.find(*spec.base + ".." + spec.target.value_or(""));
      return it != ref_diffs.end() ? std::optional(it->second) : std::nullopt;
    }
    return spec.staged ? staged_diff : unstaged_diff;
  }

  auto ChangedFiles(const repository::DiffSpec& spec)
      -> std::vector<std::string> override {
    return spec.staged ? staged_files : unstaged_files;
  }

  auto CommitLog(int count, const std::optional<std::string>& /*ref*/)
      -> std::vector<std::string> override {
    std::vector<std::string> result = commits;
    if (result.size() > static_cast<std::size_t>(count)) {
      result.resize(static_cast<std::size_t>(count));
    }
    return result;
  }

  auto BranchCommits(
      const std::string& /*base*/, const std::optional<std::string>& /*target*/,
      int /*count*/) -> std::vector<std::string> override {
    return branch_commits;
  }

  auto ListProjectFiles() -> std::vector<std::string> override {
    return project_files;
  }

  auto FileAtRef(const std::string& /*path*/, const std::string& /*ref*/)
      -> std::optional<std::string> override {
    return std::nullopt;
  }

 private:
  std::filesystem::path root_;
};

}  // namespace gopilot::test
