#pragma once

#include <atomic>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include "lsp/error.hpp"
#include "lsp/lsp_server.hpp"

namespace lsp {

// Accepts TCP clients and serves each one on its own strand. Clients share
// the server instance and nothing else. Must outlive its connections.
class SocketDriver {
 public:
  SocketDriver(
      asio::any_io_executor executor, LspServer& server, std::string host,
      std::uint16_t port, std::shared_ptr<spdlog::logger> logger = nullptr);

  // Opens and binds the listening socket. Port 0 picks a free port.
  auto Bind() -> std::expected<asio::ip::tcp::endpoint, error::LspError>;

  // Accepts until Stop() is called. Requires a successful Bind().
  auto AcceptLoop() -> asio::awaitable<void>;

  void Stop();

  [[nodiscard]] auto ActiveConnections() const -> std::size_t {
    return active_connections_.load();
  }

 private:
  auto Serve(asio::ip::tcp::socket socket) -> asio::awaitable<void>;

  asio::any_io_executor executor_;
  LspServer& server_;
  std::string host_;
  std::uint16_t port_;
  std::shared_ptr<spdlog::logger> logger_;
  asio::ip::tcp::acceptor acceptor_;
  std::atomic<std::size_t> active_connections_{0};
};

}  // namespace lsp
