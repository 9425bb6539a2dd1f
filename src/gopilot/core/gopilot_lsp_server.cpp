#include "gopilot/core/gopilot_lsp_server.hpp"

#include <algorithm>
#include <exception>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "gopilot/agent/agent.hpp"
#include "gopilot/backend/prompt_builder.hpp"
#include "gopilot/context/completion_text.hpp"
#include "gopilot/context/context_assembler.hpp"
#include "gopilot/context/file_summary.hpp"
#include "gopilot/utils/scoped_timer.hpp"
#include "gopilot/utils/text_utils.hpp"
#include "gopilot/utils/uri.hpp"

namespace gopilot {

using lsp::LspError;
using lsp::LspErrorCode;
using lsp::Ok;

namespace {

auto MakeCapabilities() -> lsp::ServerCapabilities {
  return lsp::ServerCapabilities{
      .textDocumentSync =
          lsp::TextDocumentSyncOptions{
              .openClose = true,
              .change = lsp::TextDocumentSyncKind::kFull,
              .save = lsp::SaveOptions{.includeText = true},
          },
      .completionProvider =
          lsp::CompletionOptions{
              .triggerCharacters =
                  std::vector<std::string>{".", "(", "[", "{", ",", " ", ":"},
              .resolveProvider = false,
          },
      .hoverProvider = true,
  };
}

// Root from the initialize params; rootUri wins over rootPath
auto RootFromParams(const lsp::InitializeParams& params)
    -> std::optional<std::filesystem::path> {
  if (params.rootUri && !params.rootUri->empty()) {
    return std::filesystem::path(utils::UriToPath(*params.rootUri));
  }
  if (params.rootPath && !params.rootPath->empty()) {
    return std::filesystem::path(*params.rootPath);
  }
  return std::nullopt;
}

}  // namespace

GopilotLspServer::GopilotLspServer(
    std::shared_ptr<SessionState> session,
    std::shared_ptr<backend::ModelBackend> backend,
    RepositoryFactory repository_factory, ServerOptions options,
    std::shared_ptr<spdlog::logger> logger,
    std::shared_ptr<spdlog::logger> rpc_logger)
    : lsp::LspServer(rpc_logger ? rpc_logger : logger),
      session_(std::move(session)),
      backend_(std::move(backend)),
      repository_factory_(std::move(repository_factory)),
      options_(options),
      logger_(logger ? logger : spdlog::default_logger()),
      assistant_pool_(std::max<std::size_t>(1, options.assistant_threads)) {
}

GopilotLspServer::~GopilotLspServer() {
  assistant_pool_.join();
}

auto GopilotLspServer::MakeBinding(const std::filesystem::path& root)
    -> RepositoryBinding {
  auto repository = repository_factory_ ? repository_factory_(root) : nullptr;
  if (!repository || !repository->IsRepository()) {
    logger_->info("Agent disabled: {} is not a git repository", root.string());
    return {};
  }
  logger_->info("Agent enabled for {}", root.string());
  auto agent = std::make_shared<agent::Agent>(backend_, repository, logger_);
  return RepositoryBinding{
      .repository = std::move(repository), .agent = std::move(agent)};
}

auto GopilotLspServer::BindRepository(const std::filesystem::path& root)
    -> bool {
  auto binding = MakeBinding(root);
  const bool enabled = binding.agent != nullptr;
  session_->BindRepository(std::move(binding));
  return enabled;
}

auto GopilotLspServer::OnInitialize(lsp::InitializeParams params)
    -> asio::awaitable<std::expected<lsp::InitializeResult, LspError>> {
  utils::ScopedTimer timer("initialize", logger_);

  if (params.clientInfo) {
    logger_->info(
        "Initialize from {} {}", params.clientInfo->name,
        params.clientInfo->version.value_or(""));
  }

  if (auto root = RootFromParams(params)) {
    logger_->info("Workspace root: {}", root->string());
    auto binding =
        co_await RunBlocking([this, root = *root]() { return MakeBinding(root); });
    session_->BindRepository(std::move(binding));
  }

  session_->MarkInitializing();

  lsp::InitializeResult::ServerInfo server_info{
      .name = std::string(kServerName),
      .version = std::string(kServerVersion),
  };
  if (session_->Binding().agent) {
    server_info.agentActions = std::vector<std::string>(
        agent::kAgentActionNames.begin(), agent::kAgentActionNames.end());
  }

  co_return lsp::InitializeResult{
      .capabilities = MakeCapabilities(),
      .serverInfo = std::move(server_info),
  };
}

auto GopilotLspServer::OnInitialized(lsp::InitializedParams /*unused*/)
    -> asio::awaitable<std::expected<void, LspError>> {
  session_->MarkInitialized();
  logger_->info("Server initialized");

  // Best effort: the session works without a reachable backend
  auto models = co_await RunBlocking([this]() -> std::optional<std::vector<std::string>> {
    if (!backend_->HealthCheck()) {
      return std::nullopt;
    }
    return backend_->ListModels();
  });
  if (!models) {
    logger_->warn("Ollama server is not available");
  } else if (!models->empty()) {
    logger_->info("Available models: {}", fmt::join(*models, ", "));
  } else {
    logger_->info("Ollama server is available");
  }
  co_return Ok();
}

auto GopilotLspServer::OnShutdown(lsp::ShutdownParams /*unused*/)
    -> asio::awaitable<std::expected<lsp::ShutdownResult, LspError>> {
  logger_->info("Shutdown requested");
  session_->MarkShutdownRequested();
  co_return lsp::ShutdownResult{};
}

auto GopilotLspServer::OnExit(lsp::ExitParams /*unused*/)
    -> asio::awaitable<std::expected<void, LspError>> {
  const int code = session_->MarkExited();
  exit_code_ = code;
  logger_->info("Exit notification received, exit code {}", code);
  if (exit_callback_) {
    exit_callback_(code);
  }
  co_return Ok();
}

auto GopilotLspServer::OnDidOpenTextDocument(
    lsp::DidOpenTextDocumentParams params)
    -> asio::awaitable<std::expected<void, LspError>> {
  logger_->info("Document opened: {}", params.textDocument.uri);
  session_->StoreDocument(
      params.textDocument.uri, std::move(params.textDocument.text));
  co_return Ok();
}

auto GopilotLspServer::OnDidChangeTextDocument(
    lsp::DidChangeTextDocumentParams params)
    -> asio::awaitable<std::expected<void, LspError>> {
  // Full sync: the last change carries the whole document
  if (params.contentChanges.empty()) {
    co_return Ok();
  }
  auto& change = params.contentChanges.back();
  if (!change.IsFullContent()) {
    logger_->warn(
        "Ignoring ranged change for {}: only full sync is supported",
        params.textDocument.uri);
    co_return Ok();
  }
  session_->StoreDocument(params.textDocument.uri, std::move(change.text));
  co_return Ok();
}

auto GopilotLspServer::OnDidSaveTextDocument(
    lsp::DidSaveTextDocumentParams params)
    -> asio::awaitable<std::expected<void, LspError>> {
  if (params.text) {
    session_->StoreDocument(params.textDocument.uri, std::move(*params.text));
  }
  logger_->debug("Document saved: {}", params.textDocument.uri);
  co_return Ok();
}

auto GopilotLspServer::OnDidCloseTextDocument(
    lsp::DidCloseTextDocumentParams params)
    -> asio::awaitable<std::expected<void, LspError>> {
  session_->RemoveDocument(params.textDocument.uri);
  logger_->debug("Document closed: {}", params.textDocument.uri);
  co_return Ok();
}

auto GopilotLspServer::Complete(
    const std::string& uri, const std::string& text, lsp::Position position)
    -> std::vector<lsp::CompletionItem> {
  const auto lines = utils::SplitLines(text);
  const auto local = context::BuildLocalScope(
      lines, position.line, position.character, options_.context_lines);
  const auto secondary =
      context::BuildSecondaryContext(uri, session_->Documents());
  const auto binding = session_->Binding();
  const auto project = context::BuildProjectScope(binding.repository.get());
  const auto language = context::DetectLanguage(uri);

  logger_->debug(
      "Completion at {}:{}:{} ({}): local={} secondary={} project={} chars",
      uri, position.line, position.character, language,
      local.before.size() + local.after.size(), secondary.size(),
      project.size());

  const auto prompt = backend::BuildCompletionPrompt({
      .language = language,
      .code_before = local.before,
      .code_after = local.after,
      .secondary_context = secondary,
      .project_context = project,
  });

  auto raw = backend_->Generate(prompt.user, prompt.system, std::nullopt);
  if (!raw || raw->empty()) {
    logger_->warn("No completion received from Ollama");
    return {};
  }

  auto completion = context::CleanCompletion(*raw);
  if (utils::IsBlank(completion)) {
    return {};
  }

  return {lsp::CompletionItem{
      .label = context::CompletionLabel(completion),
      .kind = lsp::CompletionItemKind::kText,
      .detail = std::string(kCompletionDetail),
      .documentation =
          lsp::MarkupContent{
              .kind = lsp::MarkupKind::kMarkdown,
              .value = fmt::format("```{}\n{}\n```", language, completion),
          },
      .insertText = completion,
      .insertTextFormat = lsp::InsertTextFormat::kPlainText,
  }};
}

auto GopilotLspServer::OnCompletion(lsp::CompletionParams params)
    -> asio::awaitable<std::expected<lsp::CompletionResult, LspError>> {
  utils::ScopedTimer timer("textDocument/completion", logger_);

  const auto& uri = params.textDocument.uri;
  auto text = session_->GetDocument(uri);
  if (!text || text->empty()) {
    logger_->warn("Document not found: {}", uri);
    co_return lsp::CompletionList{.isIncomplete = false, .items = {}};
  }

  // Failures degrade to an empty list, never a JSON-RPC error
  auto items = co_await RunBlocking(
      [this, uri, text = std::move(*text), position = params.position]()
          -> std::vector<lsp::CompletionItem> {
        try {
          return Complete(uri, text, position);
        } catch (const std::exception& e) {
          logger_->error("Completion failed for {}: {}", uri, e.what());
          return {};
        }
      });
  logger_->debug("Returning {} completion items", items.size());
  co_return lsp::CompletionList{.isIncomplete = false, .items = std::move(items)};
}

auto GopilotLspServer::Explain(
    const std::string& uri, const std::string& text, lsp::Position position)
    -> lsp::HoverResult {
  const auto lines = utils::SplitLines(text);
  if (position.line < 0 || position.line >= static_cast<int>(lines.size())) {
    return std::nullopt;
  }
  const auto& line = lines[position.line];

  const auto word = context::ExtractWordAt(line, position.character);
  if (word.empty()) {
    return std::nullopt;
  }

  const auto language = context::DetectLanguage(uri);
  logger_->debug(
      "Hover for '{}' at {}:{}:{}", word, uri, position.line,
      position.character);

  const auto prompt = backend::BuildExplainPrompt(
      context::BuildHoverContext(lines, position.line), language);
  auto explanation = backend_->Generate(prompt.user, prompt.system, std::nullopt);
  if (!explanation || explanation->empty()) {
    return std::nullopt;
  }

  return lsp::Hover{
      .contents =
          lsp::MarkupContent{
              .kind = lsp::MarkupKind::kMarkdown,
              .value = std::string(kHoverHeading) + *explanation,
          },
      .range =
          lsp::Range{
              .start = {.line = position.line, .character = 0},
              .end = {.line = position.line,
                      .character = static_cast<int>(line.size())},
          },
  };
}

auto GopilotLspServer::OnHover(lsp::HoverParams params)
    -> asio::awaitable<std::expected<lsp::HoverResult, LspError>> {
  utils::ScopedTimer timer("textDocument/hover", logger_);

  const auto& uri = params.textDocument.uri;
  auto text = session_->GetDocument(uri);
  if (!text || text->empty()) {
    logger_->warn("Document not found: {}", uri);
    co_return lsp::HoverResult{};
  }

  co_return co_await RunBlocking(
      [this, uri, text = std::move(*text), position = params.position]()
          -> lsp::HoverResult {
        try {
          return Explain(uri, text, position);
        } catch (const std::exception& e) {
          logger_->error("Hover failed for {}: {}", uri, e.what());
          return std::nullopt;
        }
      });
}

auto GopilotLspServer::OnAgentRequest(nlohmann::json params)
    -> asio::awaitable<std::expected<nlohmann::json, LspError>> {
  utils::ScopedTimer timer("gopilot/agent", logger_);

  auto agent = session_->Binding().agent;
  if (!agent) {
    co_return nlohmann::json{{"error", std::string(kAgentUnavailable)}};
  }

  if (!params.is_object()) {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kInvalidParams, "Agent params must be an object");
  }
  auto action_it = params.find("action");
  if (action_it != params.end() && !action_it->is_string()) {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kInvalidParams, "Agent action must be a string");
  }
  std::string action =
      action_it != params.end() ? action_it->get<std::string>() : "";
  nlohmann::json action_params = params.contains("params")
                                     ? params.at("params")
                                     : nlohmann::json::object();

  logger_->info("Agent request: action={}", action);
  co_return co_await RunBlocking(
      [agent = std::move(agent), action = std::move(action),
       action_params = std::move(action_params)]() {
        return agent->HandleRequest(action, action_params);
      });
}

}  // namespace gopilot
