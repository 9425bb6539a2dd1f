#include "gopilot/backend/generate_stream.hpp"

#include <nlohmann/json.hpp>

#include "gopilot/utils/text_utils.hpp"

namespace gopilot::backend {

GenerateStream::GenerateStream(std::size_t max_bytes) : max_bytes_(max_bytes) {
}

auto GenerateStream::Feed(std::string_view bytes) -> bool {
  if (done_ || truncated_) {
    return false;
  }

  received_bytes_ += bytes.size();
  pending_.append(bytes);

  std::size_t start = 0;
  while (!done_) {
    const auto newline = pending_.find('\n', start);
    if (newline == std::string::npos) {
      break;
    }
    ConsumeLine(std::string_view(pending_).substr(start, newline - start));
    start = newline + 1;
  }
  pending_.erase(0, start);

  if (!done_ && received_bytes_ > max_bytes_) {
    truncated_ = true;
  }
  return !done_ && !truncated_;
}

void GenerateStream::Finish() {
  if (!done_ && !pending_.empty()) {
    ConsumeLine(pending_);
  }
  pending_.clear();
}

void GenerateStream::ConsumeLine(std::string_view line) {
  line = utils::Trim(line);
  if (line.empty()) {
    return;
  }

  auto chunk = nlohmann::json::parse(line, nullptr, false);
  if (chunk.is_discarded() || !chunk.is_object()) {
    ++skipped_lines_;
    return;
  }

  if (auto it = chunk.find("response"); it != chunk.end() && it->is_string()) {
    text_ += it->get_ref<const std::string&>();
  }
  if (auto it = chunk.find("done"); it != chunk.end() && it->is_boolean() &&
                                    it->get<bool>()) {
    done_ = true;
  }
}

}  // namespace gopilot::backend
