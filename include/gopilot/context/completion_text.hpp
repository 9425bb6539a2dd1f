#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace gopilot::context {

constexpr std::size_t kCompletionLabelWidth = 50;

// Strips what models wrap around code: a leading fence with its language
// tag, a trailing fence, a "Completion:"/"Output:"/"Result:" label, and
// blank leading and trailing lines. Indentation inside is kept.
// CleanCompletion(CleanCompletion(x)) == CleanCompletion(x).
auto CleanCompletion(std::string_view text) -> std::string;

// Maximal [A-Za-z0-9_] run touching `character`. Empty for an empty line or
// a character outside [0, line length].
auto ExtractWordAt(std::string_view line, int character) -> std::string;

// First line of the completion, cut to 50 bytes plus "..." when longer
auto CompletionLabel(std::string_view completion) -> std::string;

}  // namespace gopilot::context
