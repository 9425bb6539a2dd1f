#pragma once

#include <expected>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace lsp::error {

enum class LspErrorCode {
  // JSON-RPC errors
  kInvalidRequest,
  kMethodNotFound,
  kInvalidParams,
  kInternalError,

  // LSP errors
  kServerNotInitialized,
  kMethodNotImplemented,
  kTransportError,
};

namespace detail {

inline auto DefaultMessageFor(LspErrorCode code) -> std::string {
  switch (code) {
    case LspErrorCode::kInvalidRequest:
      return "Invalid request";
    case LspErrorCode::kMethodNotFound:
      return "Method not found";
    case LspErrorCode::kInvalidParams:
      return "Invalid params";
    case LspErrorCode::kInternalError:
      return "Internal error";
    case LspErrorCode::kServerNotInitialized:
      return "Server not initialized";
    case LspErrorCode::kMethodNotImplemented:
      return "Method not implemented";
    case LspErrorCode::kTransportError:
      return "Transport error";
  }
  return "Unknown error";
}

}  // namespace detail

class LspError {
 public:
  explicit LspError(LspErrorCode code, std::string message)
      : code_(code), message_(std::move(message)) {
  }

  [[nodiscard]] auto Code() const -> LspErrorCode {
    return code_;
  }
  [[nodiscard]] auto Message() const -> const std::string& {
    return message_;
  }

  // Numeric code carried in the JSON-RPC error object
  [[nodiscard]] auto ToRpcCode() const -> int {
    switch (code_) {
      case LspErrorCode::kInvalidRequest:
        return -32600;
      case LspErrorCode::kMethodNotFound:
      case LspErrorCode::kMethodNotImplemented:
        return -32601;
      case LspErrorCode::kInvalidParams:
        return -32602;
      case LspErrorCode::kServerNotInitialized:
        return -32002;
      case LspErrorCode::kInternalError:
      case LspErrorCode::kTransportError:
        return -32603;
    }
    return -32603;
  }

  [[nodiscard]] auto ToJson() const -> nlohmann::json {
    return {
        {"code", ToRpcCode()},
        {"message", message_},
    };
  }

  static auto FromCode(LspErrorCode code, const std::string& message = "")
      -> LspError {
    if (message.empty()) {
      return LspError(code, detail::DefaultMessageFor(code));
    }
    return LspError(code, message);
  }

  static auto UnexpectedFromCode(
      LspErrorCode code, const std::string& details = "")
      -> std::unexpected<LspError> {
    return std::unexpected<LspError>(FromCode(code, details));
  }

 private:
  LspErrorCode code_;
  std::string message_;
};

inline auto Ok() -> std::expected<void, LspError> {
  return {};
}

inline void to_json(nlohmann::json& j, const LspError& e) {
  j = e.ToJson();
}

}  // namespace lsp::error
