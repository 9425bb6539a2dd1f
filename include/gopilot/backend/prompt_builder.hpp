#pragma once

#include <string>

namespace gopilot::backend {

struct Prompt {
  std::string system;
  std::string user;
};

struct CompletionPromptInput {
  std::string language;
  std::string code_before;
  std::string code_after;
  std::string secondary_context;
  std::string project_context;
};

// Local code goes in the user prompt, marked with [CURSOR] when there is
// code after it. Open-tab and project context are appended to the system
// prompt in that order, each only when non-empty.
auto BuildCompletionPrompt(const CompletionPromptInput& input) -> Prompt;

auto BuildExplainPrompt(const std::string& code, const std::string& language)
    -> Prompt;

}  // namespace gopilot::backend
