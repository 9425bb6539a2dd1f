#include "lsp/method.hpp"

#include <array>
#include <utility>

namespace lsp {

namespace {

constexpr std::array<std::pair<Method, std::string_view>, 12> kMethodNames = {{
    {Method::kInitialize, "initialize"},
    {Method::kInitialized, "initialized"},
    {Method::kShutdown, "shutdown"},
    {Method::kExit, "exit"},
    {Method::kDidOpenTextDocument, "textDocument/didOpen"},
    {Method::kDidChangeTextDocument, "textDocument/didChange"},
    {Method::kDidSaveTextDocument, "textDocument/didSave"},
    {Method::kDidCloseTextDocument, "textDocument/didClose"},
    {Method::kCompletion, "textDocument/completion"},
    {Method::kHover, "textDocument/hover"},
    {Method::kAgent, kAgentMethodName},
    {Method::kCancelRequest, "$/cancelRequest"},
}};

}  // namespace

auto ParseMethod(std::string_view name) -> Method {
  for (const auto& [method, method_name] : kMethodNames) {
    if (method_name == name) {
      return method;
    }
  }
  return Method::kUnknown;
}

auto ToString(Method method) -> std::string_view {
  for (const auto& [candidate, method_name] : kMethodNames) {
    if (candidate == method) {
      return method_name;
    }
  }
  return "<unknown>";
}

auto IsNotification(Method method) -> bool {
  switch (method) {
    case Method::kInitialized:
    case Method::kExit:
    case Method::kDidOpenTextDocument:
    case Method::kDidChangeTextDocument:
    case Method::kDidSaveTextDocument:
    case Method::kDidCloseTextDocument:
    case Method::kCancelRequest:
      return true;
    case Method::kInitialize:
    case Method::kShutdown:
    case Method::kCompletion:
    case Method::kHover:
    case Method::kAgent:
    case Method::kUnknown:
      return false;
  }
  return false;
}

}  // namespace lsp
