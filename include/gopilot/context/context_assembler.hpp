#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "gopilot/repository/repository_inspector.hpp"

namespace gopilot::context {

constexpr int kDefaultContextLines = 50;
constexpr std::size_t kMaxProjectFiles = 200;
constexpr int kHoverContextRadius = 5;

constexpr std::string_view kSecondaryContextHeader =
    "=== Open Tabs (Secondary Context) ===";
constexpr std::string_view kProjectScopeHeader = "=== Project Files ===\n";

// Open documents keyed by URI, in URI order
using DocumentSnapshot = std::map<std::string, std::string>;

struct LocalScope {
  // Window lines above the cursor line, then the cursor prefix
  std::string before;
  // Rest of the cursor line, then window lines below it
  std::string after;
  std::string cursor_prefix;
};

// Code around the cursor within `window` lines either side. `character` is
// a byte offset clamped to [0, line length]. A line past the end of the
// document yields an empty prefix and an empty `after`.
auto BuildLocalScope(
    const std::vector<std::string>& lines, int line, int character, int window)
    -> LocalScope;

// Summaries of every open document other than `active_uri`. Empty unless at
// least two documents are open.
auto BuildSecondaryContext(
    std::string_view active_uri, const DocumentSnapshot& documents)
    -> std::string;

// Tracked file listing, capped at kMaxProjectFiles. Empty without a
// repository or when it lists nothing.
auto BuildProjectScope(repository::RepositoryInspector* repository)
    -> std::string;

// Lines [line - 5, line + 5) joined, for explaining the code under a hover
auto BuildHoverContext(const std::vector<std::string>& lines, int line)
    -> std::string;

}  // namespace gopilot::context
