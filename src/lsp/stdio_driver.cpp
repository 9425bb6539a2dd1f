#include "lsp/stdio_driver.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>

#include <fmt/format.h>

#include "lsp/connection.hpp"

namespace lsp {

using error::LspError;
using error::LspErrorCode;

StdioDriver::StdioDriver(
    asio::any_io_executor executor, LspServer& server,
    std::shared_ptr<spdlog::logger> logger)
    : executor_(std::move(executor)),
      server_(server),
      logger_(logger ? logger : spdlog::default_logger()) {
}

auto StdioDriver::Run() -> asio::awaitable<std::expected<void, LspError>> {
  // Duplicated so closing the stream descriptors leaves fds 0/1 intact
  const int in_fd = ::dup(STDIN_FILENO);
  const int out_fd = ::dup(STDOUT_FILENO);
  if (in_fd < 0 || out_fd < 0) {
    const std::string reason = std::strerror(errno);
    if (in_fd >= 0) {
      ::close(in_fd);
    }
    if (out_fd >= 0) {
      ::close(out_fd);
    }
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kTransportError,
        fmt::format("Failed to duplicate stdio descriptors: {}", reason));
  }

  asio::posix::stream_descriptor input(executor_);
  asio::posix::stream_descriptor output(executor_);
  asio::error_code ec;
  input.assign(in_fd, ec);
  if (!ec) {
    output.assign(out_fd, ec);
  } else {
    ::close(in_fd);
    ::close(out_fd);
  }
  if (ec) {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kTransportError,
        fmt::format("Failed to attach stdio: {}", ec.message()));
  }

  logger_->info("Serving LSP over stdio");
  auto served = co_await ServeConnection(input, output, server_, logger_);
  if (!served) {
    co_return std::unexpected(served.error());
  }
  logger_->info("Stdio connection ended");
  co_return Ok();
}

}  // namespace lsp
