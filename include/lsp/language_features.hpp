#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "lsp/basic.hpp"

namespace lsp {

// Completion Request
struct CompletionParams : TextDocumentPositionParams {
  std::optional<nlohmann::json> context;
};

void to_json(nlohmann::json& j, const CompletionParams& p);
void from_json(const nlohmann::json& j, CompletionParams& p);

enum class CompletionItemKind {
  kText = 1,
  kMethod = 2,
  kFunction = 3,
  kSnippet = 15,
};

enum class InsertTextFormat {
  kPlainText = 1,
  kSnippet = 2,
};

struct CompletionItem {
  std::string label;
  std::optional<CompletionItemKind> kind;
  std::optional<std::string> detail;
  std::optional<MarkupContent> documentation;
  std::optional<std::string> insertText;
  std::optional<InsertTextFormat> insertTextFormat;
};

void to_json(nlohmann::json& j, const CompletionItem& c);
void from_json(const nlohmann::json& j, CompletionItem& c);

struct CompletionList {
  bool isIncomplete = false;
  std::vector<CompletionItem> items;
};

void to_json(nlohmann::json& j, const CompletionList& c);
void from_json(const nlohmann::json& j, CompletionList& c);

using CompletionResult = CompletionList;

// Hover Request
struct HoverParams : TextDocumentPositionParams {};

void to_json(nlohmann::json& j, const HoverParams& p);
void from_json(const nlohmann::json& j, HoverParams& p);

struct Hover {
  MarkupContent contents;
  std::optional<Range> range;
};

void to_json(nlohmann::json& j, const Hover& h);
void from_json(const nlohmann::json& j, Hover& h);

// Serializes to `null` when empty
using HoverResult = std::optional<Hover>;

}  // namespace lsp
