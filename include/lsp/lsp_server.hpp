#pragma once

#include <expected>
#include <memory>
#include <optional>

#include <asio/awaitable.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "lsp/basic.hpp"
#include "lsp/document_sync.hpp"
#include "lsp/error.hpp"
#include "lsp/language_features.hpp"
#include "lsp/lifecycle.hpp"
#include "lsp/method.hpp"

namespace lsp {

using lsp::error::LspError;
using lsp::error::LspErrorCode;
using lsp::error::Ok;

// Routes decoded JSON-RPC messages to the typed handlers below.
//
// The lifecycle gate, response construction and error conversion live here;
// derived servers only implement the handlers. One instance is shared by all
// connections, so handlers must be safe to run concurrently.
class LspServer {
 public:
  explicit LspServer(std::shared_ptr<spdlog::logger> logger = nullptr);

  LspServer(const LspServer&) = delete;
  LspServer(LspServer&&) = delete;
  auto operator=(const LspServer&) -> LspServer& = delete;
  auto operator=(LspServer&&) -> LspServer& = delete;

  virtual ~LspServer() = default;

  // Handles one message. Returns the response to send, or std::nullopt for
  // notifications and messages that need no answer. Never throws.
  auto HandleMessage(nlohmann::json message)
      -> asio::awaitable<std::optional<nlohmann::json>>;

  [[nodiscard]] auto HasExited() const -> bool {
    return GetLifecycleState() == LifecycleState::kExited;
  }

  auto Logger() -> std::shared_ptr<spdlog::logger> {
    return logger_;
  }

  static auto MakeResponse(const RequestId& id, nlohmann::json result)
      -> nlohmann::json;
  static auto MakeErrorResponse(const RequestId& id, const LspError& error)
      -> nlohmann::json;

 protected:
  [[nodiscard]] virtual auto GetLifecycleState() const -> LifecycleState = 0;

  // Initialize Request
  virtual auto OnInitialize(InitializeParams /*unused*/)
      -> asio::awaitable<std::expected<InitializeResult, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented, "OnInitialize is not implemented");
  }

  // Initialized Notification
  virtual auto OnInitialized(InitializedParams /*unused*/)
      -> asio::awaitable<std::expected<void, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented,
        "OnInitialized is not implemented");
  }

  // Shutdown Request
  virtual auto OnShutdown(ShutdownParams /*unused*/)
      -> asio::awaitable<std::expected<ShutdownResult, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented, "OnShutdown is not implemented");
  }

  // Exit Notification
  virtual auto OnExit(ExitParams /*unused*/)
      -> asio::awaitable<std::expected<void, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented, "OnExit is not implemented");
  }

  // DidOpenTextDocument Notification
  virtual auto OnDidOpenTextDocument(DidOpenTextDocumentParams /*unused*/)
      -> asio::awaitable<std::expected<void, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented,
        "OnDidOpenTextDocument is not implemented");
  }

  // DidChangeTextDocument Notification
  virtual auto OnDidChangeTextDocument(DidChangeTextDocumentParams /*unused*/)
      -> asio::awaitable<std::expected<void, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented,
        "OnDidChangeTextDocument is not implemented");
  }

  // DidSaveTextDocument Notification
  virtual auto OnDidSaveTextDocument(DidSaveTextDocumentParams /*unused*/)
      -> asio::awaitable<std::expected<void, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented,
        "OnDidSaveTextDocument is not implemented");
  }

  // DidCloseTextDocument Notification
  virtual auto OnDidCloseTextDocument(DidCloseTextDocumentParams /*unused*/)
      -> asio::awaitable<std::expected<void, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented,
        "OnDidCloseTextDocument is not implemented");
  }

  // Completion Request
  virtual auto OnCompletion(CompletionParams /*unused*/)
      -> asio::awaitable<std::expected<CompletionResult, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented, "OnCompletion is not implemented");
  }

  // Hover Request
  virtual auto OnHover(HoverParams /*unused*/)
      -> asio::awaitable<std::expected<HoverResult, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented, "OnHover is not implemented");
  }

  // Agent Request (custom method, untyped envelope)
  virtual auto OnAgentRequest(nlohmann::json /*unused*/)
      -> asio::awaitable<std::expected<nlohmann::json, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented,
        "OnAgentRequest is not implemented");
  }

  // CancelRequest Notification. Accepted and ignored by default: requests
  // are not cancellable once dispatched.
  virtual auto OnCancelRequest(CancelParams /*unused*/)
      -> asio::awaitable<std::expected<void, LspError>> {
    co_return Ok();
  }

 private:
  std::shared_ptr<spdlog::logger> logger_;

  // Rejects messages the current lifecycle state does not allow
  auto CheckLifecycle(Method method, bool is_request) const
      -> std::expected<void, LspError>;

  auto DispatchRequest(Method method, const nlohmann::json& params)
      -> asio::awaitable<std::expected<nlohmann::json, LspError>>;

  auto DispatchNotification(Method method, const nlohmann::json& params)
      -> asio::awaitable<std::expected<void, LspError>>;
};

}  // namespace lsp
