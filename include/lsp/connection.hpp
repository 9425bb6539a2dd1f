#pragma once

#include <array>
#include <expected>
#include <memory>
#include <string>

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include <fmt/format.h>

#include "lsp/error.hpp"
#include "lsp/lsp_server.hpp"
#include "lsp/message_framer.hpp"

namespace lsp {

constexpr std::size_t kReadChunkBytes = 8192;

// Serves one client until EOF, a read/write error, or the session exits.
// Frames are dispatched in arrival order and every response is written
// with a single write. `input` and `output` may be the same stream.
// EOF, cancellation and exit end the connection cleanly; any other read or
// write failure is returned as kTransportError.
template <typename ReadStream, typename WriteStream>
auto ServeConnection(
    ReadStream& input, WriteStream& output, LspServer& server,
    std::shared_ptr<spdlog::logger> logger)
    -> asio::awaitable<std::expected<void, error::LspError>> {
  if (!logger) {
    logger = spdlog::default_logger();
  }

  FrameReader reader(logger);
  std::array<char, kReadChunkBytes> chunk{};

  while (!server.HasExited()) {
    asio::error_code ec;
    const std::size_t bytes_read = co_await input.async_read_some(
        asio::buffer(chunk), asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
      if (ec == asio::error::eof) {
        logger->debug("Connection closed by peer");
        co_return Ok();
      }
      if (ec == asio::error::operation_aborted) {
        co_return Ok();
      }
      logger->warn("Read failed: {}", ec.message());
      co_return error::LspError::UnexpectedFromCode(
          error::LspErrorCode::kTransportError,
          fmt::format("Read failed: {}", ec.message()));
    }

    reader.Append(std::string_view(chunk.data(), bytes_read));

    while (auto message = reader.Next()) {
      auto response = co_await server.HandleMessage(std::move(*message));
      if (response) {
        const std::string frame = MessageFramer::Frame(*response);
        co_await asio::async_write(
            output, asio::buffer(frame),
            asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
          logger->warn("Write failed: {}", ec.message());
          co_return error::LspError::UnexpectedFromCode(
              error::LspErrorCode::kTransportError,
              fmt::format("Write failed: {}", ec.message()));
        }
        logger->trace("Sent {} bytes", frame.size());
      }

      if (server.HasExited()) {
        logger->debug("Session exited, closing connection");
        co_return Ok();
      }
    }
  }
  co_return Ok();
}

}  // namespace lsp
