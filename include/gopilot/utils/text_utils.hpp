#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace gopilot::utils {

// Splits on '\n' only. "a\n" yields {"a", ""}; "" yields {""}.
auto SplitLines(std::string_view text) -> std::vector<std::string>;

auto JoinLines(
    const std::vector<std::string>& lines, std::size_t begin, std::size_t end)
    -> std::string;

auto JoinLines(const std::vector<std::string>& lines) -> std::string;

// Strips spaces, tabs, CR and LF from both ends
auto Trim(std::string_view text) -> std::string_view;

auto IsBlank(std::string_view text) -> bool;

auto ToLower(std::string_view text) -> std::string;

// Largest offset <= `offset` that does not split a UTF-8 sequence
auto Utf8Floor(std::string_view text, std::size_t offset) -> std::size_t;

// At most `max_bytes` bytes of `text`, cut on a UTF-8 boundary
auto Prefix(std::string_view text, std::size_t max_bytes) -> std::string;

}  // namespace gopilot::utils
