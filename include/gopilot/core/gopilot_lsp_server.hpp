#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>
#include <type_traits>

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include "gopilot/backend/model_backend.hpp"
#include "gopilot/core/session_state.hpp"
#include "gopilot/repository/repository_inspector.hpp"
#include "lsp/lifecycle.hpp"
#include "lsp/lsp_server.hpp"

namespace gopilot {

constexpr std::string_view kServerName = "gopilot";
constexpr std::string_view kServerVersion = "0.1.0";
constexpr std::string_view kCompletionDetail = "AI Completion (gopilot)";
constexpr std::string_view kHoverHeading = "**AI Explanation (gopilot)**\n\n";
constexpr std::string_view kAgentUnavailable =
    "Agent not available (not a git repository)";

// Opens an inspector for a directory. May return nullptr.
using RepositoryFactory =
    std::function<std::shared_ptr<repository::RepositoryInspector>(
        const std::filesystem::path&)>;

struct ServerOptions {
  int context_lines{50};
  // Threads running backend and repository calls
  std::size_t assistant_threads{4};
};

class GopilotLspServer : public lsp::LspServer {
 public:
  GopilotLspServer(
      std::shared_ptr<SessionState> session,
      std::shared_ptr<backend::ModelBackend> backend,
      RepositoryFactory repository_factory, ServerOptions options,
      std::shared_ptr<spdlog::logger> logger = nullptr,
      std::shared_ptr<spdlog::logger> rpc_logger = nullptr);

  GopilotLspServer(const GopilotLspServer&) = delete;
  GopilotLspServer(GopilotLspServer&&) = delete;
  auto operator=(const GopilotLspServer&) -> GopilotLspServer& = delete;
  auto operator=(GopilotLspServer&&) -> GopilotLspServer& = delete;

  ~GopilotLspServer() override;

  // Binds the session to the repository at `root`. The agent is enabled only
  // when `root` is inside a work tree. Blocks on the repository check.
  auto BindRepository(const std::filesystem::path& root) -> bool;

  // Called with the exit code once the exit notification is handled
  void SetExitCallback(std::function<void(int)> callback) {
    exit_callback_ = std::move(callback);
  }

  [[nodiscard]] auto ExitCode() const -> std::optional<int> {
    return exit_code_;
  }

  [[nodiscard]] auto Session() const -> const std::shared_ptr<SessionState>& {
    return session_;
  }

 protected:
  [[nodiscard]] auto GetLifecycleState() const -> lsp::LifecycleState override {
    return session_->State();
  }

  // Initialize Request
  auto OnInitialize(lsp::InitializeParams params) -> asio::awaitable<
      std::expected<lsp::InitializeResult, lsp::LspError>> override;

  // Initialized Notification
  auto OnInitialized(lsp::InitializedParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  // Shutdown Request
  auto OnShutdown(lsp::ShutdownParams params) -> asio::awaitable<
      std::expected<lsp::ShutdownResult, lsp::LspError>> override;

  // Exit Notification
  auto OnExit(lsp::ExitParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  // Did Open Text Document Notification
  auto OnDidOpenTextDocument(lsp::DidOpenTextDocumentParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  // Did Change Text Document Notification
  auto OnDidChangeTextDocument(lsp::DidChangeTextDocumentParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  // Did Save Text Document Notification
  auto OnDidSaveTextDocument(lsp::DidSaveTextDocumentParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  // Did Close Text Document Notification
  auto OnDidCloseTextDocument(lsp::DidCloseTextDocumentParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  // Completion Request
  auto OnCompletion(lsp::CompletionParams params) -> asio::awaitable<
      std::expected<lsp::CompletionResult, lsp::LspError>> override;

  // Hover Request
  auto OnHover(lsp::HoverParams params)
      -> asio::awaitable<std::expected<lsp::HoverResult, lsp::LspError>> override;

  // Agent Request
  auto OnAgentRequest(nlohmann::json params) -> asio::awaitable<
      std::expected<nlohmann::json, lsp::LspError>> override;

 private:
  // Runs `fn` on the assistant pool and resumes the caller with its result.
  // Exceptions propagate to the awaiting coroutine.
  template <typename F>
  auto RunBlocking(F fn) -> asio::awaitable<std::invoke_result_t<F&>> {
    using Result = std::invoke_result_t<F&>;
    co_return co_await asio::co_spawn(
        assistant_pool_.get_executor(),
        [fn = std::move(fn)]() mutable -> asio::awaitable<Result> {
          co_return fn();
        },
        asio::use_awaitable);
  }

  auto MakeBinding(const std::filesystem::path& root) -> RepositoryBinding;

  // Completion items for a stored document; empty on any failure
  auto Complete(
      const std::string& uri, const std::string& text, lsp::Position position)
      -> std::vector<lsp::CompletionItem>;

  auto Explain(
      const std::string& uri, const std::string& text, lsp::Position position)
      -> lsp::HoverResult;

  std::shared_ptr<SessionState> session_;
  std::shared_ptr<backend::ModelBackend> backend_;
  RepositoryFactory repository_factory_;
  ServerOptions options_;
  std::shared_ptr<spdlog::logger> logger_;

  std::function<void(int)> exit_callback_;
  std::optional<int> exit_code_;

  asio::thread_pool assistant_pool_;
};

}  // namespace gopilot
