#include "gopilot/context/context_assembler.hpp"

#include <algorithm>
#include <cstdint>

#include <fmt/format.h>

#include "gopilot/context/file_summary.hpp"
#include "gopilot/utils/text_utils.hpp"
#include "gopilot/utils/uri.hpp"

namespace gopilot::context {

auto BuildLocalScope(
    const std::vector<std::string>& lines, int line, int character, int window)
    -> LocalScope {
  const auto line_count = static_cast<int>(lines.size());
  line = std::max(line, 0);
  window = std::max(window, 0);

  const int start = std::max(0, line - window);
  const auto end = static_cast<int>(std::min<std::int64_t>(
      line_count, std::int64_t{line} + window + 1));

  std::vector<std::string> before_lines;
  for (int i = start; i < std::min(line, line_count); ++i) {
    before_lines.push_back(lines[i]);
  }

  LocalScope scope;
  if (line >= line_count) {
    scope.before = utils::JoinLines(before_lines);
    return scope;
  }

  const std::string& current = lines[line];
  // Never cut inside a multi-byte character
  const auto split = utils::Utf8Floor(
      current, static_cast<std::size_t>(std::max(character, 0)));

  scope.cursor_prefix = current.substr(0, split);
  before_lines.push_back(scope.cursor_prefix);
  scope.before = utils::JoinLines(before_lines);

  std::vector<std::string> after_lines;
  after_lines.push_back(current.substr(split));
  for (int i = line + 1; i < end; ++i) {
    after_lines.push_back(lines[i]);
  }
  scope.after = utils::JoinLines(after_lines);
  return scope;
}

auto BuildSecondaryContext(
    std::string_view active_uri, const DocumentSnapshot& documents)
    -> std::string {
  if (documents.size() < 2) {
    return "";
  }

  std::vector<std::string> parts;
  parts.emplace_back(kSecondaryContextHeader);
  for (const auto& [uri, text] : documents) {
    if (uri == active_uri) {
      continue;
    }
    const auto language = DetectLanguage(uri);
    parts.push_back(
        fmt::format("\n--- {} ({}) ---", utils::DisplayPath(uri), language));
    auto summary = ExtractFileSummary(text, language);
    if (!summary.empty()) {
      parts.push_back(std::move(summary));
    }
  }

  // Only the header: the active document was the one other entry
  if (parts.size() == 1) {
    return "";
  }
  return utils::JoinLines(parts);
}

auto BuildProjectScope(repository::RepositoryInspector* repository)
    -> std::string {
  if (repository == nullptr) {
    return "";
  }
  auto files = repository->ListProjectFiles();
  if (files.empty()) {
    return "";
  }
  if (files.size() > kMaxProjectFiles) {
    files.resize(kMaxProjectFiles);
  }
  return std::string(kProjectScopeHeader) + utils::JoinLines(files);
}

auto BuildHoverContext(const std::vector<std::string>& lines, int line)
    -> std::string {
  const int start = std::max(0, line - kHoverContextRadius);
  const int end =
      std::min(static_cast<int>(lines.size()), line + kHoverContextRadius);
  if (start >= end) {
    return "";
  }
  return utils::JoinLines(
      lines, static_cast<std::size_t>(start), static_cast<std::size_t>(end));
}

}  // namespace gopilot::context
