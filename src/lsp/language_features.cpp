#include "lsp/language_features.hpp"

#include "lsp/json_utils.hpp"

namespace lsp {

// Completion Request
void to_json(nlohmann::json& j, const CompletionParams& p) {
  to_json(j, static_cast<const TextDocumentPositionParams&>(p));
  to_json_optional(j, "context", p.context);
}

void from_json(const nlohmann::json& j, CompletionParams& p) {
  from_json(j, static_cast<TextDocumentPositionParams&>(p));
  from_json_optional(j, "context", p.context);
}

void to_json(nlohmann::json& j, const CompletionItem& c) {
  j = nlohmann::json{{"label", c.label}};
  if (c.kind.has_value()) {
    j["kind"] = static_cast<int>(*c.kind);
  }
  to_json_optional(j, "detail", c.detail);
  to_json_optional(j, "documentation", c.documentation);
  to_json_optional(j, "insertText", c.insertText);
  if (c.insertTextFormat.has_value()) {
    j["insertTextFormat"] = static_cast<int>(*c.insertTextFormat);
  }
}

void from_json(const nlohmann::json& j, CompletionItem& c) {
  j.at("label").get_to(c.label);
  if (j.contains("kind")) {
    c.kind = static_cast<CompletionItemKind>(j.at("kind").get<int>());
  }
  from_json_optional(j, "detail", c.detail);
  from_json_optional(j, "documentation", c.documentation);
  from_json_optional(j, "insertText", c.insertText);
  if (j.contains("insertTextFormat")) {
    c.insertTextFormat =
        static_cast<InsertTextFormat>(j.at("insertTextFormat").get<int>());
  }
}

void to_json(nlohmann::json& j, const CompletionList& c) {
  j = nlohmann::json{
      {"isIncomplete", c.isIncomplete}, {"items", nlohmann::json::array()}};
  for (const auto& item : c.items) {
    j["items"].push_back(item);
  }
}

void from_json(const nlohmann::json& j, CompletionList& c) {
  from_json_or(j, "isIncomplete", c.isIncomplete, false);
  from_json_or(j, "items", c.items, std::vector<CompletionItem>{});
}

// Hover Request
void to_json(nlohmann::json& j, const HoverParams& p) {
  to_json(j, static_cast<const TextDocumentPositionParams&>(p));
}

void from_json(const nlohmann::json& j, HoverParams& p) {
  from_json(j, static_cast<TextDocumentPositionParams&>(p));
}

void to_json(nlohmann::json& j, const Hover& h) {
  j = nlohmann::json{{"contents", h.contents}};
  to_json_optional(j, "range", h.range);
}

void from_json(const nlohmann::json& j, Hover& h) {
  j.at("contents").get_to(h.contents);
  from_json_optional(j, "range", h.range);
}

}  // namespace lsp
