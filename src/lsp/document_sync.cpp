#include "lsp/document_sync.hpp"

#include "lsp/json_utils.hpp"

namespace lsp {

// DidOpenTextDocument Notification
void to_json(nlohmann::json& j, const DidOpenTextDocumentParams& p) {
  j = nlohmann::json{{"textDocument", p.textDocument}};
}

void from_json(const nlohmann::json& j, DidOpenTextDocumentParams& p) {
  j.at("textDocument").get_to(p.textDocument);
}

// DidChangeTextDocument Notification
void to_json(nlohmann::json& j, const TextDocumentContentChangeEvent& e) {
  j = nlohmann::json{{"text", e.text}};
  to_json_optional(j, "range", e.range);
}

void from_json(const nlohmann::json& j, TextDocumentContentChangeEvent& e) {
  from_json_optional(j, "range", e.range);
  from_json_or(j, "text", e.text, std::string{});
}

void to_json(nlohmann::json& j, const DidChangeTextDocumentParams& p) {
  j = nlohmann::json{
      {"textDocument", p.textDocument}, {"contentChanges", p.contentChanges}};
}

void from_json(const nlohmann::json& j, DidChangeTextDocumentParams& p) {
  j.at("textDocument").get_to(p.textDocument);
  from_json_or(
      j, "contentChanges", p.contentChanges,
      std::vector<TextDocumentContentChangeEvent>{});
}

// DidSaveTextDocument Notification
void to_json(nlohmann::json& j, const DidSaveTextDocumentParams& p) {
  j = nlohmann::json{{"textDocument", p.textDocument}};
  to_json_optional(j, "text", p.text);
}

void from_json(const nlohmann::json& j, DidSaveTextDocumentParams& p) {
  j.at("textDocument").get_to(p.textDocument);
  from_json_optional(j, "text", p.text);
}

// DidCloseTextDocument Notification
void to_json(nlohmann::json& j, const DidCloseTextDocumentParams& p) {
  j = nlohmann::json{{"textDocument", p.textDocument}};
}

void from_json(const nlohmann::json& j, DidCloseTextDocumentParams& p) {
  j.at("textDocument").get_to(p.textDocument);
}

}  // namespace lsp
