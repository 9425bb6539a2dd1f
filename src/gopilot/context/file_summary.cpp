#include "gopilot/context/file_summary.hpp"

#include <algorithm>
#include <array>
#include <initializer_list>
#include <utility>
#include <vector>

#include "gopilot/utils/text_utils.hpp"

namespace gopilot::context {

namespace {

constexpr std::array<std::pair<std::string_view, std::string_view>, 26>
    kLanguageBySuffix = {{
        {".py", "python"},      {".js", "javascript"}, {".ts", "typescript"},
        {".jsx", "javascript"}, {".tsx", "typescript"}, {".go", "go"},
        {".rs", "rust"},        {".java", "java"},     {".c", "c"},
        {".cpp", "cpp"},        {".h", "c"},           {".hpp", "cpp"},
        {".rb", "ruby"},        {".php", "php"},       {".lua", "lua"},
        {".sh", "bash"},        {".bash", "bash"},     {".zsh", "zsh"},
        {".sql", "sql"},        {".html", "html"},     {".css", "css"},
        {".json", "json"},      {".yaml", "yaml"},     {".yml", "yaml"},
        {".md", "markdown"},    {".toml", "toml"},
    }};

auto StartsWithAny(
    std::string_view text, std::initializer_list<std::string_view> prefixes)
    -> bool {
  for (auto prefix : prefixes) {
    if (text.starts_with(prefix)) {
      return true;
    }
  }
  return false;
}

void CollectPython(
    const std::vector<std::string>& lines, std::vector<std::string>& out) {
  for (std::size_t i = 0; i < lines.size(); ++i) {
    const auto stripped = utils::Trim(lines[i]);
    if (i < kImportScanLines && StartsWithAny(stripped, {"import ", "from "})) {
      out.emplace_back(stripped);
    } else if (StartsWithAny(stripped, {"def ", "class ", "async def "})) {
      // Signature up to and including its first colon
      const auto colon = stripped.find(':');
      if (colon != std::string_view::npos) {
        out.emplace_back(stripped.substr(0, colon + 1));
      }
    }
  }
}

void CollectScript(
    const std::vector<std::string>& lines, std::vector<std::string>& out) {
  const auto limit = std::min(lines.size(), kImportScanLines);
  for (std::size_t i = 0; i < limit; ++i) {
    const auto stripped = utils::Trim(lines[i]);
    if (StartsWithAny(
            stripped, {"import ", "export ", "const ", "let ", "var "})) {
      out.push_back(utils::Prefix(stripped, kSummaryLineWidth));
    }
  }
}

void CollectLeadingLines(
    const std::vector<std::string>& lines, std::vector<std::string>& out) {
  const auto limit = std::min(lines.size(), kFallbackScanLines);
  for (std::size_t i = 0; i < limit && out.size() < kFallbackMaxLines; ++i) {
    const auto stripped = utils::Trim(lines[i]);
    if (!stripped.empty()) {
      out.push_back(utils::Prefix(stripped, kSummaryLineWidth));
    }
  }
}

}  // namespace

auto DetectLanguage(std::string_view uri) -> std::string {
  for (const auto& [suffix, language] : kLanguageBySuffix) {
    if (uri.ends_with(suffix)) {
      return std::string(language);
    }
  }
  return "text";
}

auto ExtractFileSummary(std::string_view text, std::string_view language)
    -> std::string {
  const auto lines = utils::SplitLines(text);
  std::vector<std::string> summary;

  if (language == "python") {
    CollectPython(lines, summary);
  } else if (language == "javascript" || language == "typescript") {
    CollectScript(lines, summary);
  }

  if (summary.empty()) {
    CollectLeadingLines(lines, summary);
  }

  if (summary.size() > kMaxSummaryLines) {
    summary.resize(kMaxSummaryLines);
  }
  return utils::JoinLines(summary);
}

}  // namespace gopilot::context
