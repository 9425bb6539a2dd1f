#pragma once

#include <chrono>
#include <expected>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace gopilot::repository {

enum class CommandErrorKind {
  kNotFound,
  kTimeout,
  kFailed,
};

struct CommandError {
  CommandErrorKind kind;
  // Exit status for kFailed, -1 otherwise
  int exit_code{-1};
  std::string message;
};

// Runs an external program with captured stdout and a hard deadline.
// stdin is /dev/null. Thread-safe: every call forks its own child.
class CommandRunner {
 public:
  explicit CommandRunner(
      std::chrono::milliseconds timeout,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  // argv[0] is looked up on PATH. On success returns stdout verbatim.
  // A child still running at the deadline is killed.
  [[nodiscard]] auto Run(const std::vector<std::string>& argv) const
      -> std::expected<std::string, CommandError>;

  [[nodiscard]] auto Timeout() const -> std::chrono::milliseconds {
    return timeout_;
  }

 private:
  std::chrono::milliseconds timeout_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace gopilot::repository
