#pragma once

#include <expected>
#include <memory>

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include "lsp/error.hpp"
#include "lsp/lsp_server.hpp"

namespace lsp {

// Serves a single client over the process's stdin/stdout
class StdioDriver {
 public:
  StdioDriver(
      asio::any_io_executor executor, LspServer& server,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  // Runs until EOF on stdin or exit. Fails if the descriptors can't be
  // attached to the executor, or on a read or write error.
  auto Run() -> asio::awaitable<std::expected<void, error::LspError>>;

 private:
  asio::any_io_executor executor_;
  LspServer& server_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace lsp
