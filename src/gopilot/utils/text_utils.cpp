#include "gopilot/utils/text_utils.hpp"

#include <algorithm>
#include <cctype>

namespace gopilot::utils {

namespace {

auto IsSpace(char c) -> bool {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' ||
         c == '\v';
}

}  // namespace

auto SplitLines(std::string_view text) -> std::vector<std::string> {
  std::vector<std::string> lines;
  std::size_t start = 0;
  while (true) {
    const auto newline = text.find('\n', start);
    if (newline == std::string_view::npos) {
      lines.emplace_back(text.substr(start));
      break;
    }
    lines.emplace_back(text.substr(start, newline - start));
    start = newline + 1;
  }
  return lines;
}

auto JoinLines(
    const std::vector<std::string>& lines, std::size_t begin, std::size_t end)
    -> std::string {
  end = std::min(end, lines.size());
  std::string joined;
  for (std::size_t i = begin; i < end; ++i) {
    if (i != begin) {
      joined += '\n';
    }
    joined += lines[i];
  }
  return joined;
}

auto JoinLines(const std::vector<std::string>& lines) -> std::string {
  return JoinLines(lines, 0, lines.size());
}

auto Trim(std::string_view text) -> std::string_view {
  while (!text.empty() && IsSpace(text.front())) {
    text.remove_prefix(1);
  }
  while (!text.empty() && IsSpace(text.back())) {
    text.remove_suffix(1);
  }
  return text;
}

auto IsBlank(std::string_view text) -> bool {
  return Trim(text).empty();
}

auto ToLower(std::string_view text) -> std::string {
  std::string lowered(text);
  std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return lowered;
}

auto Utf8Floor(std::string_view text, std::size_t offset) -> std::size_t {
  if (offset >= text.size()) {
    return text.size();
  }
  // Continuation bytes are 10xxxxxx
  while (offset > 0 &&
         (static_cast<unsigned char>(text[offset]) & 0xC0U) == 0x80U) {
    --offset;
  }
  return offset;
}

auto Prefix(std::string_view text, std::size_t max_bytes) -> std::string {
  return std::string(text.substr(0, Utf8Floor(text, max_bytes)));
}

}  // namespace gopilot::utils
