#include "gopilot/repository/command_runner.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "gopilot/utils/text_utils.hpp"

namespace gopilot::repository {

namespace {

// Closes the descriptor on scope exit
class UniqueFd {
 public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) : fd_(fd) {
  }
  ~UniqueFd() {
    Reset();
  }

  UniqueFd(const UniqueFd&) = delete;
  auto operator=(const UniqueFd&) -> UniqueFd& = delete;
  UniqueFd(UniqueFd&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {
  }
  auto operator=(UniqueFd&& other) noexcept -> UniqueFd& {
    if (this != &other) {
      Reset();
      fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
  }

  [[nodiscard]] auto Get() const -> int {
    return fd_;
  }

  void Reset() {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

 private:
  int fd_{-1};
};

struct Pipe {
  UniqueFd read;
  UniqueFd write;
};

auto MakePipe() -> std::expected<Pipe, std::string> {
  std::array<int, 2> fds{};
  if (::pipe2(fds.data(), O_CLOEXEC) < 0) {
    return std::unexpected(fmt::format("pipe2() failed: {}", std::strerror(errno)));
  }
  return Pipe{.read = UniqueFd(fds[0]), .write = UniqueFd(fds[1])};
}

void KillAndReap(pid_t pid) {
  ::kill(pid, SIGKILL);
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
  }
}

// Reads whatever is available. Returns false once the descriptor hit EOF.
auto DrainInto(int fd, std::string& out) -> bool {
  std::array<char, 4096> chunk{};
  const ssize_t n = ::read(fd, chunk.data(), chunk.size());
  if (n > 0) {
    out.append(chunk.data(), static_cast<std::size_t>(n));
    return true;
  }
  if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
    return true;
  }
  return false;
}

}  // namespace

CommandRunner::CommandRunner(
    std::chrono::milliseconds timeout, std::shared_ptr<spdlog::logger> logger)
    : timeout_(timeout), logger_(logger ? logger : spdlog::default_logger()) {
}

auto CommandRunner::Run(const std::vector<std::string>& argv) const
    -> std::expected<std::string, CommandError> {
  if (argv.empty()) {
    return std::unexpected(CommandError{
        .kind = CommandErrorKind::kFailed, .message = "empty command line"});
  }

  logger_->debug("Running: {}", fmt::join(argv, " "));

  auto out_pipe = MakePipe();
  auto err_pipe = MakePipe();
  // Carries errno from a failed execvp; closed by a successful exec
  auto exec_pipe = MakePipe();
  for (const auto* p : {&out_pipe, &err_pipe, &exec_pipe}) {
    if (!p->has_value()) {
      return std::unexpected(CommandError{
          .kind = CommandErrorKind::kFailed, .message = p->error()});
    }
  }

  // Built before fork: only async-signal-safe calls are allowed in the child
  std::vector<char*> c_argv;
  c_argv.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    c_argv.push_back(const_cast<char*>(arg.c_str()));
  }
  c_argv.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid < 0) {
    return std::unexpected(CommandError{
        .kind = CommandErrorKind::kFailed,
        .message = fmt::format("fork() failed: {}", std::strerror(errno))});
  }

  if (pid == 0) {
    const int dev_null = ::open("/dev/null", O_RDONLY);
    if (dev_null >= 0) {
      ::dup2(dev_null, STDIN_FILENO);
    }
    ::dup2((*out_pipe).write.Get(), STDOUT_FILENO);
    ::dup2((*err_pipe).write.Get(), STDERR_FILENO);
    ::execvp(c_argv[0], c_argv.data());
    const int exec_errno = errno;
    [[maybe_unused]] auto written =
        ::write((*exec_pipe).write.Get(), &exec_errno, sizeof(exec_errno));
    ::_exit(127);
  }

  out_pipe->write.Reset();
  err_pipe->write.Reset();
  exec_pipe->write.Reset();

  int exec_errno = 0;
  ssize_t n = 0;
  do {
    n = ::read(exec_pipe->read.Get(), &exec_errno, sizeof(exec_errno));
  } while (n < 0 && errno == EINTR);
  if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    const auto kind = (exec_errno == ENOENT) ? CommandErrorKind::kNotFound
                                             : CommandErrorKind::kFailed;
    logger_->error("Failed to execute {}: {}", argv[0], std::strerror(exec_errno));
    return std::unexpected(CommandError{
        .kind = kind,
        .message = fmt::format(
            "{}: {}", argv[0], std::strerror(exec_errno))});
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout_;
  std::string stdout_text;
  std::string stderr_text;
  bool stdout_open = true;
  bool stderr_open = true;

  while (stdout_open || stderr_open) {
    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      KillAndReap(pid);
      logger_->error(
          "{} timed out after {}ms", fmt::join(argv, " "), timeout_.count());
      return std::unexpected(CommandError{
          .kind = CommandErrorKind::kTimeout,
          .message = fmt::format("timed out after {}ms", timeout_.count())});
    }

    std::array<pollfd, 2> fds{{
        {.fd = stdout_open ? out_pipe->read.Get() : -1, .events = POLLIN, .revents = 0},
        {.fd = stderr_open ? err_pipe->read.Get() : -1, .events = POLLIN, .revents = 0},
    }};
    const int ready = ::poll(
        fds.data(), fds.size(), static_cast<int>(remaining.count()));
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      const std::string reason = std::strerror(errno);
      KillAndReap(pid);
      return std::unexpected(CommandError{
          .kind = CommandErrorKind::kFailed,
          .message = fmt::format("poll() failed: {}", reason)});
    }

    if (stdout_open && (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
      stdout_open = DrainInto(out_pipe->read.Get(), stdout_text);
    }
    if (stderr_open && (fds[1].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
      stderr_open = DrainInto(err_pipe->read.Get(), stderr_text);
    }
  }

  int status = 0;
  pid_t waited = 0;
  do {
    waited = ::waitpid(pid, &status, 0);
  } while (waited < 0 && errno == EINTR);

  const int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
  if (waited < 0 || exit_code != 0) {
    const auto stderr_trimmed = std::string(utils::Trim(stderr_text));
    logger_->warn(
        "{} failed ({}): {}", fmt::join(argv, " "), exit_code, stderr_trimmed);
    return std::unexpected(CommandError{
        .kind = CommandErrorKind::kFailed,
        .exit_code = exit_code,
        .message = stderr_trimmed});
  }

  return stdout_text;
}

}  // namespace gopilot::repository
