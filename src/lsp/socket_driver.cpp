#include "lsp/socket_driver.hpp"

#include <fmt/format.h>

#include "lsp/connection.hpp"

namespace lsp {

using error::LspError;
using error::LspErrorCode;

SocketDriver::SocketDriver(
    asio::any_io_executor executor, LspServer& server, std::string host,
    std::uint16_t port, std::shared_ptr<spdlog::logger> logger)
    : executor_(std::move(executor)),
      server_(server),
      host_(std::move(host)),
      port_(port),
      logger_(logger ? logger : spdlog::default_logger()),
      acceptor_(executor_) {
}

auto SocketDriver::Bind()
    -> std::expected<asio::ip::tcp::endpoint, LspError> {
  asio::error_code ec;
  const auto address = asio::ip::make_address(host_, ec);
  if (ec) {
    return LspError::UnexpectedFromCode(
        LspErrorCode::kTransportError,
        fmt::format("Invalid listen address '{}': {}", host_, ec.message()));
  }

  const asio::ip::tcp::endpoint endpoint(address, port_);
  acceptor_.open(endpoint.protocol(), ec);
  if (!ec) {
    acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
  }
  if (!ec) {
    acceptor_.bind(endpoint, ec);
  }
  if (!ec) {
    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
  }
  if (ec) {
    asio::error_code ignored;
    acceptor_.close(ignored);
    return LspError::UnexpectedFromCode(
        LspErrorCode::kTransportError,
        fmt::format(
            "Failed to listen on {}:{}: {}", host_, port_, ec.message()));
  }

  auto local = acceptor_.local_endpoint(ec);
  if (ec) {
    return LspError::UnexpectedFromCode(
        LspErrorCode::kTransportError,
        fmt::format("Failed to query local endpoint: {}", ec.message()));
  }
  logger_->info(
      "Listening on {}:{}", local.address().to_string(), local.port());
  return local;
}

auto SocketDriver::AcceptLoop() -> asio::awaitable<void> {
  while (acceptor_.is_open()) {
    asio::error_code ec;
    // Each accepted socket is bound to a fresh strand
    auto socket = co_await acceptor_.async_accept(
        asio::make_strand(executor_),
        asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
      if (ec == asio::error::operation_aborted) {
        break;
      }
      logger_->warn("Accept failed: {}", ec.message());
      continue;
    }

    auto socket_executor = socket.get_executor();
    asio::co_spawn(socket_executor, Serve(std::move(socket)), asio::detached);
  }
  logger_->debug("Accept loop stopped");
}

void SocketDriver::Stop() {
  asio::error_code ec;
  acceptor_.close(ec);
  if (ec) {
    logger_->warn("Failed to close acceptor: {}", ec.message());
  }
}

auto SocketDriver::Serve(asio::ip::tcp::socket socket)
    -> asio::awaitable<void> {
  asio::error_code ec;
  const auto remote = socket.remote_endpoint(ec);
  const std::string peer =
      ec ? std::string("<unknown>")
         : fmt::format("{}:{}", remote.address().to_string(), remote.port());

  const auto active = ++active_connections_;
  logger_->info("Client connected: {} ({} active)", peer, active);

  // A failed connection ends only that client
  if (auto served = co_await ServeConnection(socket, socket, server_, logger_);
      !served) {
    logger_->warn("Connection {} failed: {}", peer, served.error().Message());
  }

  socket.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
  socket.close(ec);
  const auto remaining = --active_connections_;
  logger_->info("Client disconnected: {} ({} active)", peer, remaining);
}

}  // namespace lsp
