#include "gopilot/context/completion_text.hpp"

#include <array>
#include <cctype>
#include <utility>
#include <vector>

#include "gopilot/utils/text_utils.hpp"

namespace gopilot::context {

namespace {

constexpr std::string_view kFence = "```";
constexpr std::array<std::string_view, 3> kLabels = {
    "completion:", "output:", "result:"};

auto IsWordChar(char c) -> bool {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

auto IsSpace(char c) -> bool {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

auto StripLeadingFence(std::string_view text) -> std::string_view {
  if (!text.starts_with(kFence)) {
    return text;
  }
  text.remove_prefix(kFence.size());
  while (!text.empty() && IsWordChar(text.front())) {
    text.remove_prefix(1);
  }
  if (text.starts_with('\n')) {
    text.remove_prefix(1);
  }
  return text;
}

auto StripTrailingFence(std::string_view text) -> std::string_view {
  if (text.ends_with("```\n")) {
    text.remove_suffix(1);
  }
  if (!text.ends_with(kFence)) {
    return text;
  }
  text.remove_suffix(kFence.size());
  if (text.ends_with('\n')) {
    text.remove_suffix(1);
  }
  return text;
}

auto StripLabel(std::string_view text) -> std::string_view {
  const auto lowered = utils::ToLower(text.substr(0, 16));
  for (auto label : kLabels) {
    if (std::string_view(lowered).starts_with(label)) {
      text.remove_prefix(label.size());
      while (!text.empty() && IsSpace(text.front())) {
        text.remove_prefix(1);
      }
      break;
    }
  }
  return text;
}

auto DropBlankEdgeLines(std::string_view text) -> std::string {
  auto lines = utils::SplitLines(text);
  std::size_t first = 0;
  while (first < lines.size() && utils::IsBlank(lines[first])) {
    ++first;
  }
  std::size_t last = lines.size();
  while (last > first && utils::IsBlank(lines[last - 1])) {
    --last;
  }
  return utils::JoinLines(lines, first, last);
}

auto CleanOnce(std::string_view text) -> std::string {
  text = StripLeadingFence(text);
  text = StripTrailingFence(text);
  text = StripLabel(text);
  return DropBlankEdgeLines(text);
}

}  // namespace

auto CleanCompletion(std::string_view text) -> std::string {
  // Repeat to a fixed point so nested wrappers are removed too
  std::string current = CleanOnce(text);
  while (true) {
    std::string next = CleanOnce(current);
    if (next == current) {
      return current;
    }
    current = std::move(next);
  }
}

auto ExtractWordAt(std::string_view line, int character) -> std::string {
  if (line.empty() || character < 0 ||
      static_cast<std::size_t>(character) > line.size()) {
    return "";
  }
  auto start = static_cast<std::size_t>(character);
  auto end = start;
  while (start > 0 && IsWordChar(line[start - 1])) {
    --start;
  }
  while (end < line.size() && IsWordChar(line[end])) {
    ++end;
  }
  return std::string(line.substr(start, end - start));
}

auto CompletionLabel(std::string_view completion) -> std::string {
  const auto newline = completion.find('\n');
  const auto first_line = completion.substr(0, newline);
  if (first_line.size() > kCompletionLabelWidth) {
    return std::string(first_line.substr(0, kCompletionLabelWidth)) + "...";
  }
  return std::string(first_line);
}

}  // namespace gopilot::context
