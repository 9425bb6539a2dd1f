#include "gopilot/backend/prompt_builder.hpp"

#include <fmt/format.h>

namespace gopilot::backend {

namespace {

constexpr auto kCompletionSystemTemplate =
    "You are a code completion assistant. Complete the code naturally.\n"
    "Language: {}\n"
    "Rules:\n"
    "- Only output the completion, no explanations\n"
    "- Match the coding style\n"
    "- Keep it concise and relevant";

constexpr auto kExplainSystem =
    "You are a code documentation assistant.\n"
    "Provide brief, helpful explanations of code.\n"
    "Keep explanations concise (2-3 sentences max).";

}  // namespace

auto BuildCompletionPrompt(const CompletionPromptInput& input) -> Prompt {
  Prompt prompt;
  prompt.system = fmt::format(kCompletionSystemTemplate, input.language);
  if (!input.secondary_context.empty()) {
    prompt.system += "\n\n" + input.secondary_context;
  }
  if (!input.project_context.empty()) {
    prompt.system += "\n\n" + input.project_context;
  }

  prompt.user = fmt::format(
      "Complete this code:\n```{}\n{}", input.language, input.code_before);
  if (!input.code_after.empty()) {
    prompt.user += "\n[CURSOR]\n" + input.code_after;
  }
  prompt.user += "\n```\nCompletion:";
  return prompt;
}

auto BuildExplainPrompt(const std::string& code, const std::string& language)
    -> Prompt {
  return Prompt{
      .system = kExplainSystem,
      .user = fmt::format(
          "Explain this {} code briefly:\n```{}\n{}\n```", language, language,
          code),
  };
}

}  // namespace gopilot::backend
