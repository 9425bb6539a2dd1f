#include "lsp/server_capabilities.hpp"

#include "lsp/json_utils.hpp"

namespace lsp {

void to_json(nlohmann::json& j, const SaveOptions& o) {
  j = nlohmann::json::object();
  to_json_optional(j, "includeText", o.includeText);
}

void from_json(const nlohmann::json& j, SaveOptions& o) {
  from_json_optional(j, "includeText", o.includeText);
}

void to_json(nlohmann::json& j, const TextDocumentSyncKind& k) {
  j = static_cast<int>(k);
}

void from_json(const nlohmann::json& j, TextDocumentSyncKind& k) {
  k = static_cast<TextDocumentSyncKind>(j.get<int>());
}

void to_json(nlohmann::json& j, const TextDocumentSyncOptions& o) {
  j = nlohmann::json::object();
  to_json_optional(j, "openClose", o.openClose);
  to_json_optional(j, "change", o.change);
  to_json_optional(j, "save", o.save);
}

void from_json(const nlohmann::json& j, TextDocumentSyncOptions& o) {
  from_json_optional(j, "openClose", o.openClose);
  from_json_optional(j, "change", o.change);
  from_json_optional(j, "save", o.save);
}

void to_json(nlohmann::json& j, const CompletionOptions& o) {
  j = nlohmann::json::object();
  to_json_optional(j, "triggerCharacters", o.triggerCharacters);
  to_json_optional(j, "resolveProvider", o.resolveProvider);
}

void from_json(const nlohmann::json& j, CompletionOptions& o) {
  from_json_optional(j, "triggerCharacters", o.triggerCharacters);
  from_json_optional(j, "resolveProvider", o.resolveProvider);
}

void to_json(nlohmann::json& j, const ServerCapabilities& c) {
  j = nlohmann::json::object();
  to_json_optional(j, "textDocumentSync", c.textDocumentSync);
  to_json_optional(j, "completionProvider", c.completionProvider);
  to_json_optional(j, "hoverProvider", c.hoverProvider);
}

void from_json(const nlohmann::json& j, ServerCapabilities& c) {
  from_json_optional(j, "textDocumentSync", c.textDocumentSync);
  from_json_optional(j, "completionProvider", c.completionProvider);
  from_json_optional(j, "hoverProvider", c.hoverProvider);
}

}  // namespace lsp
