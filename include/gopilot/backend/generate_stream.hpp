#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace gopilot::backend {

// Folds a newline-delimited JSON generation stream into one text. Each
// object may carry a "response" fragment; `"done": true` ends the stream.
// Lines that don't decode are skipped.
class GenerateStream {
 public:
  static constexpr std::size_t kDefaultMaxBytes = 4 * 1024 * 1024;

  explicit GenerateStream(std::size_t max_bytes = kDefaultMaxBytes);

  // Feeds raw bytes, which may split lines anywhere. Returns false once the
  // stream is done or the byte bound was crossed, telling the reader to stop.
  auto Feed(std::string_view bytes) -> bool;

  // Processes a trailing line that had no newline
  void Finish();

  [[nodiscard]] auto Text() const -> const std::string& {
    return text_;
  }

  [[nodiscard]] auto IsDone() const -> bool {
    return done_;
  }

  [[nodiscard]] auto IsTruncated() const -> bool {
    return truncated_;
  }

  [[nodiscard]] auto SkippedLines() const -> std::size_t {
    return skipped_lines_;
  }

 private:
  void ConsumeLine(std::string_view line);

  std::size_t max_bytes_;
  std::size_t received_bytes_{0};
  std::string pending_;
  std::string text_;
  bool done_{false};
  bool truncated_{false};
  std::size_t skipped_lines_{0};
};

}  // namespace gopilot::backend
