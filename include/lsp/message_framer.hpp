#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace lsp {

// Encodes and decodes `Content-Length` framed JSON-RPC messages
class MessageFramer {
 public:
  enum class DeframeStatus {
    kNeedMoreData,
    kComplete,
    kMalformed,
  };

  struct DeframeResult {
    DeframeStatus status{DeframeStatus::kNeedMoreData};
    std::string body;
    // Bytes to drop from the front of the buffer (frame or bad header block)
    std::size_t consumed_bytes{0};
    std::string error;
  };

  // Header blocks larger than this are treated as garbage
  static constexpr std::size_t kMaxHeaderBytes = 16384;

  static auto Frame(const nlohmann::json& message) -> std::string;
  static auto Frame(std::string_view body) -> std::string;

  // Looks for one complete frame at the start of `buffer`
  static auto TryDeframe(std::string_view buffer) -> DeframeResult;

  // Returns std::nullopt when the body is not valid JSON
  static auto ParseBody(std::string_view body) -> std::optional<nlohmann::json>;
};

// Accumulates bytes from a stream and yields the decoded messages in order.
// A frame may span any number of Append calls.
class FrameReader {
 public:
  explicit FrameReader(std::shared_ptr<spdlog::logger> logger = nullptr);

  void Append(std::string_view bytes);

  // Next decoded message, or std::nullopt when more bytes are needed.
  // Malformed frames and invalid JSON bodies are logged and skipped.
  auto Next() -> std::optional<nlohmann::json>;

  [[nodiscard]] auto BufferedBytes() const -> std::size_t {
    return buffer_.size();
  }

 private:
  std::shared_ptr<spdlog::logger> logger_;
  std::string buffer_;
};

}  // namespace lsp
