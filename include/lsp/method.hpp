#pragma once

#include <string_view>

namespace lsp {

// Every method the server understands. Anything else maps to kUnknown.
enum class Method {
  kInitialize,
  kInitialized,
  kShutdown,
  kExit,
  kDidOpenTextDocument,
  kDidChangeTextDocument,
  kDidSaveTextDocument,
  kDidCloseTextDocument,
  kCompletion,
  kHover,
  kAgent,
  kCancelRequest,
  kUnknown,
};

// Custom request carrying agent actions
constexpr std::string_view kAgentMethodName = "gopilot/agent";

auto ParseMethod(std::string_view name) -> Method;

auto ToString(Method method) -> std::string_view;

// Notifications never receive a response
auto IsNotification(Method method) -> bool;

}  // namespace lsp
