#include "lsp/message_framer.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

#include <fmt/format.h>

namespace lsp {

namespace {

constexpr std::string_view kHeaderTerminator = "\r\n\r\n";
constexpr std::string_view kLineTerminator = "\r\n";

auto TrimWhitespace(std::string_view text) -> std::string_view {
  while (!text.empty() &&
         std::isspace(static_cast<unsigned char>(text.front())) != 0) {
    text.remove_prefix(1);
  }
  while (!text.empty() &&
         std::isspace(static_cast<unsigned char>(text.back())) != 0) {
    text.remove_suffix(1);
  }
  return text;
}

auto EqualsIgnoreCase(std::string_view a, std::string_view b) -> bool {
  return std::ranges::equal(a, b, [](char x, char y) {
    return std::tolower(static_cast<unsigned char>(x)) ==
           std::tolower(static_cast<unsigned char>(y));
  });
}

// Returns the declared body length, 0 when absent or invalid
auto ParseContentLength(std::string_view header_block) -> std::size_t {
  std::size_t content_length = 0;
  while (!header_block.empty()) {
    auto line_end = header_block.find(kLineTerminator);
    auto line = header_block.substr(0, line_end);
    header_block = line_end == std::string_view::npos
                       ? std::string_view{}
                       : header_block.substr(line_end + kLineTerminator.size());

    auto colon = line.find(':');
    if (colon == std::string_view::npos) {
      continue;
    }
    auto key = TrimWhitespace(line.substr(0, colon));
    if (!EqualsIgnoreCase(key, "Content-Length")) {
      continue;
    }
    auto value = TrimWhitespace(line.substr(colon + 1));
    std::size_t parsed = 0;
    auto [ptr, ec] =
        std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (ec != std::errc{} || ptr != value.data() + value.size()) {
      return 0;
    }
    content_length = parsed;
  }
  return content_length;
}

}  // namespace

auto MessageFramer::Frame(const nlohmann::json& message) -> std::string {
  const std::string body =
      message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  return Frame(std::string_view{body});
}

auto MessageFramer::Frame(std::string_view body) -> std::string {
  return fmt::format("Content-Length: {}\r\n\r\n{}", body.size(), body);
}

auto MessageFramer::TryDeframe(std::string_view buffer) -> DeframeResult {
  auto header_end = buffer.find(kHeaderTerminator);
  if (header_end == std::string_view::npos) {
    if (buffer.size() > kMaxHeaderBytes) {
      return {
          .status = DeframeStatus::kMalformed,
          .body = "",
          .consumed_bytes = buffer.size(),
          .error = "Header block exceeds size limit"};
    }
    return {};  // Need more data
  }

  const auto header_size = header_end + kHeaderTerminator.size();
  const auto content_length =
      ParseContentLength(buffer.substr(0, header_end));
  if (content_length == 0) {
    return {
        .status = DeframeStatus::kMalformed,
        .body = "",
        .consumed_bytes = header_size,
        .error = "Missing or invalid Content-Length header"};
  }

  if (buffer.size() < header_size + content_length) {
    return {};  // Need more data
  }

  return {
      .status = DeframeStatus::kComplete,
      .body = std::string(buffer.substr(header_size, content_length)),
      .consumed_bytes = header_size + content_length,
      .error = ""};
}

auto MessageFramer::ParseBody(std::string_view body)
    -> std::optional<nlohmann::json> {
  auto message = nlohmann::json::parse(body, nullptr, false);
  if (message.is_discarded()) {
    return std::nullopt;
  }
  return message;
}

FrameReader::FrameReader(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()) {
}

void FrameReader::Append(std::string_view bytes) {
  buffer_.append(bytes);
}

auto FrameReader::Next() -> std::optional<nlohmann::json> {
  while (true) {
    auto result = MessageFramer::TryDeframe(buffer_);
    if (result.status == MessageFramer::DeframeStatus::kNeedMoreData) {
      return std::nullopt;
    }
    buffer_.erase(0, result.consumed_bytes);

    if (result.status == MessageFramer::DeframeStatus::kMalformed) {
      logger_->error("Dropping malformed frame: {}", result.error);
      continue;
    }

    auto message = MessageFramer::ParseBody(result.body);
    if (!message) {
      logger_->error(
          "Dropping frame with invalid JSON body ({} bytes)",
          result.body.size());
      continue;
    }
    return message;
  }
}

}  // namespace lsp
