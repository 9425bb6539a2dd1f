#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "lsp/document_sync.hpp"

namespace lsp {

struct SaveOptions {
  std::optional<bool> includeText;
};

void to_json(nlohmann::json& j, const SaveOptions& o);
void from_json(const nlohmann::json& j, SaveOptions& o);

void to_json(nlohmann::json& j, const TextDocumentSyncKind& k);
void from_json(const nlohmann::json& j, TextDocumentSyncKind& k);

struct TextDocumentSyncOptions {
  std::optional<bool> openClose = true;
  std::optional<TextDocumentSyncKind> change = TextDocumentSyncKind::kFull;
  std::optional<SaveOptions> save;
};

void to_json(nlohmann::json& j, const TextDocumentSyncOptions& o);
void from_json(const nlohmann::json& j, TextDocumentSyncOptions& o);

struct CompletionOptions {
  std::optional<std::vector<std::string>> triggerCharacters;
  std::optional<bool> resolveProvider;
};

void to_json(nlohmann::json& j, const CompletionOptions& o);
void from_json(const nlohmann::json& j, CompletionOptions& o);

struct ServerCapabilities {
  std::optional<TextDocumentSyncOptions> textDocumentSync;
  std::optional<CompletionOptions> completionProvider;
  std::optional<bool> hoverProvider;
};

void to_json(nlohmann::json& j, const ServerCapabilities& c);
void from_json(const nlohmann::json& j, ServerCapabilities& c);

}  // namespace lsp
