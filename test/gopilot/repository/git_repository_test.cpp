#include "gopilot/repository/git_repository.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>

#include <catch2/catch_all.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using gopilot::repository::CommandRunner;
using gopilot::repository::DiffSpec;
using gopilot::repository::GitRepository;
using namespace std::chrono_literals;

namespace {

auto MakeTempDir(std::string_view tag) -> std::filesystem::path {
  std::random_device device;
  auto dir = std::filesystem::temp_directory_path() /
             fmt::format("gopilot-{}-{:08x}", tag, device());
  std::filesystem::create_directories(dir);
  return dir;
}

// Throwaway repository on branch main with one commit of a.txt and b.txt
class TempRepository {
 public:
  TempRepository() : root_(MakeTempDir("repo")), runner_(30s) {
    Git({"init", "-q"});
    Git({"symbolic-ref", "HEAD", "refs/heads/main"});
    Write("a.txt", "alpha\n");
    Write("b.txt", "beta\n");
    Git({"add", "a.txt", "b.txt"});
    Commit("initial commit");
  }

  TempRepository(const TempRepository&) = delete;
  auto operator=(const TempRepository&) -> TempRepository& = delete;

  ~TempRepository() {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
  }

  static auto GitAvailable() -> bool {
    return CommandRunner(10s).Run({"git", "--version"}).has_value();
  }

  void Git(std::vector<std::string> args) {
    std::vector<std::string> argv = {
        "git", "-C", root_.string(), "-c", "user.name=Test",
        "-c", "user.email=test@example.com", "-c", "commit.gpgsign=false"};
    argv.insert(argv.end(), args.begin(), args.end());
    auto result = runner_.Run(argv);
    if (!result) {
      FAIL(fmt::format("git {} failed: {}", args.front(), result.error().message));
    }
  }

  void Write(const std::string& name, const std::string& content) {
    std::ofstream(root_ / name) << content;
  }

  void Commit(const std::string& message) {
    Git({"commit", "-q", "-m", message});
  }

  [[nodiscard]] auto Root() const -> const std::filesystem::path& {
    return root_;
  }

 private:
  std::filesystem::path root_;
  CommandRunner runner_;
};

}  // namespace

TEST_CASE("A fresh repository reports its state", "[git_repository]") {
  if (!TempRepository::GitAvailable()) {
    SKIP("git is not installed");
  }
  TempRepository temp;
  GitRepository repository(temp.Root(), CommandRunner(30s));

  REQUIRE(repository.IsRepository());
  REQUIRE(repository.CurrentBranch() == "main");
  REQUIRE(repository.ListBranches(false) == std::vector<std::string>{"main"});
  REQUIRE(repository.ListProjectFiles() == std::vector<std::string>{"a.txt", "b.txt"});

  auto diff = repository.Diff(DiffSpec{});
  REQUIRE(diff.has_value());
  REQUIRE(diff->empty());
  REQUIRE(repository.ChangedFiles(DiffSpec{}).empty());

  const auto log = repository.CommitLog(5, std::nullopt);
  REQUIRE(log.size() == 1);
  REQUIRE_THAT(log.front(), Catch::Matchers::EndsWith("initial commit"));

  REQUIRE(repository.FileAtRef("a.txt", "HEAD") == "alpha");
  REQUIRE_FALSE(repository.FileAtRef("missing.txt", "HEAD").has_value());
}

TEST_CASE("Staged and unstaged changes are kept apart", "[git_repository]") {
  if (!TempRepository::GitAvailable()) {
    SKIP("git is not installed");
  }
  TempRepository temp;
  GitRepository repository(temp.Root(), CommandRunner(30s));

  temp.Write("a.txt", "alpha\nnew line\n");
  REQUIRE(repository.ChangedFiles(DiffSpec{}) == std::vector<std::string>{"a.txt"});
  REQUIRE(repository.ChangedFiles(DiffSpec{.staged = true}).empty());
  REQUIRE_THAT(
      repository.Diff(DiffSpec{}).value_or(""),
      Catch::Matchers::ContainsSubstring("+new line"));

  temp.Git({"add", "a.txt"});
  temp.Write("b.txt", "beta\nchanged\n");

  const auto status = repository.Status();
  REQUIRE(status.branch == "main");
  REQUIRE(status.staged_files == std::vector<std::string>{"a.txt"});
  REQUIRE(status.unstaged_files == std::vector<std::string>{"b.txt"});
  REQUIRE(status.recent_commits.size() == 1);

  const nlohmann::json json = status;
  REQUIRE(json.at("branch") == "main");
  REQUIRE(json.at("staged_files") == nlohmann::json::array({"a.txt"}));
}

TEST_CASE("Branch ranges cover only the branch's commits", "[git_repository]") {
  if (!TempRepository::GitAvailable()) {
    SKIP("git is not installed");
  }
  TempRepository temp;
  GitRepository repository(temp.Root(), CommandRunner(30s));

  temp.Git({"checkout", "-q", "-b", "feature"});
  temp.Write("c.txt", "gamma\n");
  temp.Git({"add", "c.txt"});
  temp.Commit("add gamma");
  temp.Write("c.txt", "gamma\ndelta\n");
  temp.Git({"add", "c.txt"});
  temp.Commit("add delta");

  REQUIRE(repository.CurrentBranch() == "feature");
  REQUIRE(repository.ListBranches(false) == std::vector<std::string>{"feature", "main"});

  const auto commits = repository.BranchCommits("main", std::nullopt, 50);
  REQUIRE(commits.size() == 2);
  REQUIRE_THAT(commits.front(), Catch::Matchers::EndsWith("add delta"));
  REQUIRE(repository.BranchCommits("main", std::string("feature"), 50) == commits);
  REQUIRE(repository.BranchCommits("main", std::string("feature"), 1).size() == 1);

  REQUIRE(repository.CommitLog(20, std::string("main")).size() == 1);
  REQUIRE(repository.CommitLog(20, std::nullopt).size() == 3);

  const auto between = repository.Diff(DiffSpec{.base = "main", .target = "feature"});
  REQUIRE_THAT(between.value_or(""), Catch::Matchers::ContainsSubstring("+delta"));
  REQUIRE(
      repository.ChangedFiles(DiffSpec{.base = "main", .target = "feature"}) ==
      std::vector<std::string>{"c.txt"});
}

TEST_CASE("Refs are never read as git options", "[git_repository]") {
  if (!TempRepository::GitAvailable()) {
    SKIP("git is not installed");
  }
  TempRepository temp;
  GitRepository repository(temp.Root(), CommandRunner(30s));
  temp.Write("a.txt", "alpha\nmore\n");

  const auto leak = temp.Root() / "leak.txt";
  const std::string output_ref = fmt::format("--output={}", leak.string());

  REQUIRE_FALSE(repository.Diff(DiffSpec{.base = output_ref}).has_value());
  REQUIRE(repository.ChangedFiles(DiffSpec{.base = output_ref}).empty());
  REQUIRE(
      repository.Diff(DiffSpec{.base = "main", .target = output_ref}) == std::nullopt);
  REQUIRE(repository.CommitLog(5, output_ref).empty());
  REQUIRE(repository.BranchCommits(output_ref, std::nullopt, 5).empty());
  REQUIRE_FALSE(repository.FileAtRef("a.txt", output_ref).has_value());
  REQUIRE_FALSE(std::filesystem::exists(leak));

  // Plain refs still resolve
  REQUIRE_THAT(
      repository.Diff(DiffSpec{.base = "main"}).value_or(""),
      Catch::Matchers::ContainsSubstring("+more"));
  REQUIRE(repository.FileAtRef("a.txt", "main") == "alpha");
}

TEST_CASE("Directories outside a work tree are not repositories", "[git_repository]") {
  if (!TempRepository::GitAvailable()) {
    SKIP("git is not installed");
  }
  const auto dir = MakeTempDir("plain");
  GitRepository repository(dir, CommandRunner(30s));

  REQUIRE_FALSE(repository.IsRepository());
  REQUIRE_FALSE(repository.CurrentBranch().has_value());
  REQUIRE(repository.ListBranches(false).empty());
  REQUIRE(repository.ListProjectFiles().empty());
  REQUIRE_FALSE(repository.Diff(DiffSpec{}).has_value());

  std::filesystem::remove_all(dir);
}
