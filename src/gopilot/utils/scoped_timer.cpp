#include "gopilot/utils/scoped_timer.hpp"

#include <fmt/format.h>

namespace gopilot::utils {

ScopedTimer::ScopedTimer(
    std::string operation_name, std::shared_ptr<spdlog::logger> logger,
    spdlog::level::level_enum level)
    : start_(std::chrono::steady_clock::now()),
      operation_name_(std::move(operation_name)),
      logger_(logger ? logger : spdlog::default_logger()),
      level_(level) {
}

ScopedTimer::~ScopedTimer() {
  logger_->log(
      level_, "{} took {}", operation_name_, FormatDuration(GetElapsed()));
}

auto ScopedTimer::GetElapsed() const -> std::chrono::microseconds {
  return std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now() - start_);
}

auto ScopedTimer::FormatDuration(std::chrono::microseconds duration)
    -> std::string {
  const auto micros = duration.count();
  if (micros < 1000) {
    return fmt::format("{}us", micros);
  }
  if (micros < 1'000'000) {
    return fmt::format("{}ms", micros / 1000);
  }
  return fmt::format("{:.1f}s", static_cast<double>(micros) / 1'000'000.0);
}

}  // namespace gopilot::utils
