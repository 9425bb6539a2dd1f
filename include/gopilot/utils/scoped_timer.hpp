#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace gopilot::utils {

// Logs the lifetime of a scope when it ends. Used around each request and
// each collaborator round trip.
class ScopedTimer {
 public:
  ScopedTimer(
      std::string operation_name, std::shared_ptr<spdlog::logger> logger,
      spdlog::level::level_enum level = spdlog::level::debug);
  ~ScopedTimer();

  ScopedTimer(const ScopedTimer&) = delete;
  ScopedTimer(ScopedTimer&&) = delete;
  auto operator=(const ScopedTimer&) -> ScopedTimer& = delete;
  auto operator=(ScopedTimer&&) -> ScopedTimer& = delete;

  [[nodiscard]] auto GetElapsed() const -> std::chrono::microseconds;

  // "850us", "42ms" or "1.2s"
  static auto FormatDuration(std::chrono::microseconds duration)
      -> std::string;

 private:
  std::chrono::steady_clock::time_point start_;
  std::string operation_name_;
  std::shared_ptr<spdlog::logger> logger_;
  spdlog::level::level_enum level_;
};

}  // namespace gopilot::utils
