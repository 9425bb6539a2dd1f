#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace gopilot::context {

constexpr std::size_t kMaxSummaryLines = 30;
constexpr std::size_t kFallbackScanLines = 20;
constexpr std::size_t kFallbackMaxLines = 10;
constexpr std::size_t kImportScanLines = 100;
constexpr std::size_t kSummaryLineWidth = 80;

// Language identifier from the file suffix, "text" when unknown
auto DetectLanguage(std::string_view uri) -> std::string;

// Imports and signatures that describe a file to the model. Falls back to
// the first non-blank lines when nothing language-specific is found.
auto ExtractFileSummary(std::string_view text, std::string_view language)
    -> std::string;

}  // namespace gopilot::context
