#pragma once

#include <string>
#include <string_view>

namespace gopilot::utils {

constexpr std::string_view kFileScheme = "file://";

inline auto IsFileUri(std::string_view uri) -> bool {
  return uri.starts_with(kFileScheme);
}

// The URI with its `file://` prefix removed and nothing else changed.
// Used for display in prompts.
inline auto DisplayPath(std::string_view uri) -> std::string {
  if (IsFileUri(uri)) {
    uri.remove_prefix(kFileScheme.size());
  }
  return std::string(uri);
}

// Convert a file URI to a local path, decoding %XX escapes.
// "file:///home/user/my%20repo" -> "/home/user/my repo"
// Anything that isn't a file URI is returned as is.
inline auto UriToPath(std::string_view uri) -> std::string {
  if (!IsFileUri(uri)) {
    return std::string(uri);
  }
  uri.remove_prefix(kFileScheme.size());

  auto hex_value = [](char c) -> int {
    if (c >= '0' && c <= '9') {
      return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
      return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
      return c - 'A' + 10;
    }
    return -1;
  };

  std::string path;
  path.reserve(uri.size());
  for (std::size_t i = 0; i < uri.size(); ++i) {
    if (uri[i] == '%' && i + 2 < uri.size()) {
      const int high = hex_value(uri[i + 1]);
      const int low = hex_value(uri[i + 2]);
      if (high >= 0 && low >= 0) {
        path += static_cast<char>(high * 16 + low);
        i += 2;
        continue;
      }
    }
    path += uri[i];
  }
  return path;
}

}  // namespace gopilot::utils
