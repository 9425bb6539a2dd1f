#include "gopilot/repository/git_repository.hpp"

#include <algorithm>
#include <string_view>

#include <fmt/format.h>

#include "gopilot/utils/text_utils.hpp"

namespace gopilot::repository {

namespace {

constexpr std::string_view kEndOfOptions = "--end-of-options";

}  // namespace

GitRepository::GitRepository(
    std::filesystem::path root, CommandRunner runner,
    std::shared_ptr<spdlog::logger> logger)
    : root_(std::move(root)),
      runner_(std::move(runner)),
      logger_(logger ? logger : spdlog::default_logger()) {
  logger_->info("Repository inspector bound to {}", root_.string());
}

auto GitRepository::RunGit(std::vector<std::string> args)
    -> std::optional<std::string> {
  std::vector<std::string> argv = {"git", "-C", root_.string()};
  argv.insert(
      argv.end(), std::make_move_iterator(args.begin()),
      std::make_move_iterator(args.end()));

  auto result = runner_.Run(argv);
  if (!result) {
    switch (result.error().kind) {
      case CommandErrorKind::kNotFound:
        logger_->error("git executable not found");
        break;
      case CommandErrorKind::kTimeout:
        logger_->error("git command timed out");
        break;
      case CommandErrorKind::kFailed:
        logger_->debug(
            "git command failed ({}): {}", result.error().exit_code,
            result.error().message);
        break;
    }
    return std::nullopt;
  }
  return std::string(utils::Trim(*result));
}

auto GitRepository::RunGitLines(std::vector<std::string> args)
    -> std::vector<std::string> {
  std::vector<std::string> lines;
  auto output = RunGit(std::move(args));
  if (!output || output->empty()) {
    return lines;
  }
  for (const auto& line : utils::SplitLines(*output)) {
    auto trimmed = utils::Trim(line);
    if (!trimmed.empty()) {
      lines.emplace_back(trimmed);
    }
  }
  return lines;
}

auto GitRepository::DiffArgs(const DiffSpec& spec, bool name_only)
    -> std::vector<std::string> {
  std::vector<std::string> args = {"diff"};
  if (name_only) {
    args.emplace_back("--name-only");
  }
  if (spec.staged) {
    args.emplace_back("--cached");
  }
  // Refs come from clients and must never parse as options
  args.emplace_back(kEndOfOptions);
  if (spec.base && !spec.base->empty()) {
    args.push_back(*spec.base);
  }
  if (spec.target && !spec.target->empty()) {
    args.push_back(*spec.target);
  }
  return args;
}

auto GitRepository::IsRepository() -> bool {
  return RunGit({"rev-parse", "--is-inside-work-tree"}) == "true";
}

auto GitRepository::CurrentBranch() -> std::optional<std::string> {
  auto branch = RunGit({"rev-parse", "--abbrev-ref", "HEAD"});
  if (branch && branch->empty()) {
    return std::nullopt;
  }
  return branch;
}

auto GitRepository::ListBranches(bool include_remote)
    -> std::vector<std::string> {
  std::vector<std::string> args = {"branch", "--format=%(refname:short)"};
  if (include_remote) {
    args.emplace_back("--all");
  }
  auto branches = RunGitLines(std::move(args));
  std::ranges::sort(branches);
  return branches;
}

auto GitRepository::Diff(const DiffSpec& spec) -> std::optional<std::string> {
  return RunGit(DiffArgs(spec, false));
}

auto GitRepository::ChangedFiles(const DiffSpec& spec)
    -> std::vector<std::string> {
  return RunGitLines(DiffArgs(spec, true));
}

auto GitRepository::CommitLog(int count, const std::optional<std::string>& ref)
    -> std::vector<std::string> {
  std::vector<std::string> args = {
      "log", fmt::format("-{}", count), "--oneline"};
  if (ref && !ref->empty()) {
    args.emplace_back(kEndOfOptions);
    args.push_back(*ref);
  }
  return RunGitLines(std::move(args));
}

auto GitRepository::BranchCommits(
    const std::string& base, const std::optional<std::string>& target,
    int count) -> std::vector<std::string> {
  const std::string range = fmt::format(
      "{}..{}", base, (target && !target->empty()) ? *target : "HEAD");
  return RunGitLines(
      {"log", "--oneline", fmt::format("-{}", count), std::string(kEndOfOptions),
       range});
}

auto GitRepository::ListProjectFiles() -> std::vector<std::string> {
  auto files = RunGitLines({"ls-files"});
  std::ranges::sort(files);
  return files;
}

auto GitRepository::FileAtRef(const std::string& path, const std::string& ref)
    -> std::optional<std::string> {
  return RunGit(
      {"show", std::string(kEndOfOptions), fmt::format("{}:{}", ref, path)});
}

}  // namespace gopilot::repository
