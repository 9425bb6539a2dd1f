#include "lsp/lsp_server.hpp"

#include <exception>
#include <string>
#include <utility>

#include <asio.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace lsp {

namespace {

template <typename Params>
auto ParseParams(const nlohmann::json& params)
    -> std::expected<Params, LspError> {
  try {
    return params.get<Params>();
  } catch (const nlohmann::json::exception& e) {
    return LspError::UnexpectedFromCode(
        LspErrorCode::kInvalidParams, fmt::format("Invalid params: {}", e.what()));
  }
}

template <typename Result>
auto ToJsonResult(std::expected<Result, LspError> result)
    -> std::expected<nlohmann::json, LspError> {
  if (!result) {
    return std::unexpected(result.error());
  }
  return nlohmann::json(*result);
}

}  // namespace

LspServer::LspServer(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()) {
}

auto LspServer::MakeResponse(const RequestId& id, nlohmann::json result)
    -> nlohmann::json {
  return nlohmann::json{
      {"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

auto LspServer::MakeErrorResponse(const RequestId& id, const LspError& error)
    -> nlohmann::json {
  return nlohmann::json{
      {"jsonrpc", "2.0"}, {"id", id}, {"error", error.ToJson()}};
}

auto LspServer::HandleMessage(nlohmann::json message)
    -> asio::awaitable<std::optional<nlohmann::json>> {
  if (!message.is_object()) {
    Logger()->warn("Ignoring non-object message");
    co_return std::nullopt;
  }

  auto method_it = message.find("method");
  if (method_it == message.end() || !method_it->is_string()) {
    // Responses from the client and malformed envelopes need no answer
    Logger()->debug("Ignoring message without method");
    co_return std::nullopt;
  }

  const auto method_name = method_it->get<std::string>();
  const auto method = ParseMethod(method_name);
  const bool has_id = message.contains("id");
  const RequestId id = has_id ? message.at("id") : RequestId{};
  const bool is_request = has_id && !IsNotification(method);

  auto params_it = message.find("params");
  const nlohmann::json params =
      params_it != message.end() ? *params_it : nlohmann::json::object();

  if (method == Method::kUnknown) {
    if (!is_request) {
      Logger()->debug("Ignoring unknown notification: {}", method_name);
      co_return std::nullopt;
    }
    Logger()->warn("Method not found: {}", method_name);
    co_return MakeErrorResponse(
        id, LspError::FromCode(
                LspErrorCode::kMethodNotFound,
                fmt::format("Method not found: {}", method_name)));
  }

  if (auto gate = CheckLifecycle(method, is_request); !gate) {
    if (!is_request) {
      Logger()->warn(
          "Dropping {} in state {}", method_name,
          ToString(GetLifecycleState()));
      co_return std::nullopt;
    }
    co_return MakeErrorResponse(id, gate.error());
  }

  Logger()->debug("Dispatching {}", method_name);

  std::optional<std::string> failure;
  if (IsNotification(method)) {
    try {
      auto result = co_await DispatchNotification(method, params);
      if (!result) {
        Logger()->warn(
            "{} failed: {}", method_name, result.error().Message());
      }
    } catch (const std::exception& e) {
      failure = e.what();
    }
    if (failure) {
      Logger()->error("{} threw: {}", method_name, *failure);
    }
    co_return std::nullopt;
  }

  std::expected<nlohmann::json, LspError> result =
      LspError::UnexpectedFromCode(LspErrorCode::kInternalError);
  try {
    result = co_await DispatchRequest(method, params);
  } catch (const std::exception& e) {
    failure = e.what();
  }

  if (failure) {
    Logger()->error("{} threw: {}", method_name, *failure);
    result = LspError::UnexpectedFromCode(
        LspErrorCode::kInternalError,
        fmt::format("Internal error: {}", *failure));
  }

  if (!is_request) {
    // A request method sent without an id is handled but never answered
    co_return std::nullopt;
  }
  if (!result) {
    Logger()->debug(
        "{} -> error {}", method_name, result.error().ToRpcCode());
    co_return MakeErrorResponse(id, result.error());
  }
  co_return MakeResponse(id, std::move(*result));
}

auto LspServer::CheckLifecycle(Method method, bool is_request) const
    -> std::expected<void, LspError> {
  if (method == Method::kExit) {
    return Ok();
  }

  switch (GetLifecycleState()) {
    case LifecycleState::kUninitialized:
      if (method == Method::kInitialize) {
        return Ok();
      }
      return LspError::UnexpectedFromCode(
          LspErrorCode::kServerNotInitialized,
          is_request ? "Server not initialized" : "Notification before initialize");
    case LifecycleState::kInitializing:
    case LifecycleState::kInitialized:
      return Ok();
    case LifecycleState::kShutdownRequested:
    case LifecycleState::kExited:
      return LspError::UnexpectedFromCode(
          LspErrorCode::kInvalidRequest, "Server is shutting down");
  }
  return Ok();
}

auto LspServer::DispatchRequest(Method method, const nlohmann::json& params)
    -> asio::awaitable<std::expected<nlohmann::json, LspError>> {
  switch (method) {
    case Method::kInitialize: {
      auto parsed = ParseParams<InitializeParams>(params);
      if (!parsed) {
        co_return std::unexpected(parsed.error());
      }
      co_return ToJsonResult(co_await OnInitialize(std::move(*parsed)));
    }
    case Method::kShutdown: {
      auto result = co_await OnShutdown(ShutdownParams{});
      if (!result) {
        co_return std::unexpected(result.error());
      }
      co_return nlohmann::json(nullptr);
    }
    case Method::kCompletion: {
      auto parsed = ParseParams<CompletionParams>(params);
      if (!parsed) {
        co_return std::unexpected(parsed.error());
      }
      co_return ToJsonResult(co_await OnCompletion(std::move(*parsed)));
    }
    case Method::kHover: {
      auto parsed = ParseParams<HoverParams>(params);
      if (!parsed) {
        co_return std::unexpected(parsed.error());
      }
      auto result = co_await OnHover(std::move(*parsed));
      if (!result) {
        co_return std::unexpected(result.error());
      }
      if (!result->has_value()) {
        co_return nlohmann::json(nullptr);
      }
      co_return nlohmann::json(**result);
    }
    case Method::kAgent:
      co_return co_await OnAgentRequest(params);
    case Method::kInitialized:
    case Method::kExit:
    case Method::kDidOpenTextDocument:
    case Method::kDidChangeTextDocument:
    case Method::kDidSaveTextDocument:
    case Method::kDidCloseTextDocument:
    case Method::kCancelRequest:
    case Method::kUnknown:
      break;
  }
  co_return LspError::UnexpectedFromCode(
      LspErrorCode::kMethodNotFound,
      fmt::format("Method not found: {}", ToString(method)));
}

auto LspServer::DispatchNotification(
    Method method, const nlohmann::json& params)
    -> asio::awaitable<std::expected<void, LspError>> {
  switch (method) {
    case Method::kInitialized:
      co_return co_await OnInitialized(InitializedParams{});
    case Method::kExit:
      co_return co_await OnExit(ExitParams{});
    case Method::kDidOpenTextDocument: {
      auto parsed = ParseParams<DidOpenTextDocumentParams>(params);
      if (!parsed) {
        co_return std::unexpected(parsed.error());
      }
      co_return co_await OnDidOpenTextDocument(std::move(*parsed));
    }
    case Method::kDidChangeTextDocument: {
      auto parsed = ParseParams<DidChangeTextDocumentParams>(params);
      if (!parsed) {
        co_return std::unexpected(parsed.error());
      }
      co_return co_await OnDidChangeTextDocument(std::move(*parsed));
    }
    case Method::kDidSaveTextDocument: {
      auto parsed = ParseParams<DidSaveTextDocumentParams>(params);
      if (!parsed) {
        co_return std::unexpected(parsed.error());
      }
      co_return co_await OnDidSaveTextDocument(std::move(*parsed));
    }
    case Method::kDidCloseTextDocument: {
      auto parsed = ParseParams<DidCloseTextDocumentParams>(params);
      if (!parsed) {
        co_return std::unexpected(parsed.error());
      }
      co_return co_await OnDidCloseTextDocument(std::move(*parsed));
    }
    case Method::kCancelRequest: {
      auto parsed = ParseParams<CancelParams>(params);
      if (!parsed) {
        co_return std::unexpected(parsed.error());
      }
      co_return co_await OnCancelRequest(std::move(*parsed));
    }
    case Method::kInitialize:
    case Method::kShutdown:
    case Method::kCompletion:
    case Method::kHover:
    case Method::kAgent:
    case Method::kUnknown:
      break;
  }
  co_return LspError::UnexpectedFromCode(
      LspErrorCode::kMethodNotFound,
      fmt::format("Not a notification: {}", ToString(method)));
}

}  // namespace lsp
