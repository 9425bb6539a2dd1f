#include "lsp/lifecycle.hpp"

#include <nlohmann/json.hpp>

#include "lsp/json_utils.hpp"

namespace lsp {

auto ToString(LifecycleState state) -> std::string_view {
  switch (state) {
    case LifecycleState::kUninitialized:
      return "uninitialized";
    case LifecycleState::kInitializing:
      return "initializing";
    case LifecycleState::kInitialized:
      return "initialized";
    case LifecycleState::kShutdownRequested:
      return "shutdown-requested";
    case LifecycleState::kExited:
      return "exited";
  }
  return "unknown";
}

void to_json(nlohmann::json& j, const WorkspaceFolder& w) {
  j = nlohmann::json{{"uri", w.uri}, {"name", w.name}};
}

void from_json(const nlohmann::json& j, WorkspaceFolder& w) {
  j.at("uri").get_to(w.uri);
  from_json_or(j, "name", w.name, std::string{});
}

// Initialize Request
void to_json(nlohmann::json& j, const InitializeParams::ClientInfo& p) {
  j = nlohmann::json{{"name", p.name}};
  to_json_optional(j, "version", p.version);
}

void from_json(const nlohmann::json& j, InitializeParams::ClientInfo& p) {
  j.at("name").get_to(p.name);
  from_json_optional(j, "version", p.version);
}

void to_json(nlohmann::json& j, const InitializeParams& p) {
  j = nlohmann::json::object();
  to_json_optional(j, "processId", p.processId);
  to_json_optional(j, "clientInfo", p.clientInfo);
  to_json_optional(j, "rootPath", p.rootPath);
  to_json_optional(j, "rootUri", p.rootUri);
  to_json_optional(j, "initializationOptions", p.initializationOptions);
  to_json_optional(j, "capabilities", p.capabilities);
  to_json_optional(j, "workspaceFolders", p.workspaceFolders);
}

void from_json(const nlohmann::json& j, InitializeParams& p) {
  if (!j.is_object()) {
    return;
  }
  from_json_optional(j, "processId", p.processId);
  from_json_optional(j, "clientInfo", p.clientInfo);
  from_json_optional(j, "rootPath", p.rootPath);
  from_json_optional(j, "rootUri", p.rootUri);
  from_json_optional(j, "initializationOptions", p.initializationOptions);
  from_json_optional(j, "capabilities", p.capabilities);
  from_json_optional(j, "workspaceFolders", p.workspaceFolders);
}

void to_json(nlohmann::json& j, const InitializeResult::ServerInfo& p) {
  j = nlohmann::json{{"name", p.name}};
  to_json_optional(j, "version", p.version);
  if (p.agentActions.has_value()) {
    j["agentCapabilities"] = nlohmann::json{{"actions", *p.agentActions}};
  }
}

void from_json(const nlohmann::json& j, InitializeResult::ServerInfo& p) {
  j.at("name").get_to(p.name);
  from_json_optional(j, "version", p.version);
  if (j.contains("agentCapabilities")) {
    from_json_optional(j.at("agentCapabilities"), "actions", p.agentActions);
  }
}

void to_json(nlohmann::json& j, const InitializeResult& p) {
  j = nlohmann::json{{"capabilities", p.capabilities}};
  to_json_optional(j, "serverInfo", p.serverInfo);
}

void from_json(const nlohmann::json& j, InitializeResult& p) {
  j.at("capabilities").get_to(p.capabilities);
  from_json_optional(j, "serverInfo", p.serverInfo);
}

// Initialized Notification
void to_json(nlohmann::json& j, const InitializedParams&) {
  j = nlohmann::json::object();
}
void from_json(const nlohmann::json&, InitializedParams&) {}

// Shutdown Request
void to_json(nlohmann::json& j, const ShutdownParams&) {
  j = nullptr;
}
void from_json(const nlohmann::json&, ShutdownParams&) {}

void to_json(nlohmann::json& j, const ShutdownResult&) {
  j = nullptr;
}
void from_json(const nlohmann::json&, ShutdownResult&) {}

// Exit Notification
void to_json(nlohmann::json& j, const ExitParams&) {
  j = nullptr;
}
void from_json(const nlohmann::json&, ExitParams&) {}

// Cancel Notification
void to_json(nlohmann::json& j, const CancelParams& p) {
  j = nlohmann::json{{"id", p.id}};
}

void from_json(const nlohmann::json& j, CancelParams& p) {
  p.id = j.value("id", nlohmann::json{});
}

}  // namespace lsp
