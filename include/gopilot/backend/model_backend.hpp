#pragma once

#include <optional>
#include <string>
#include <vector>

namespace gopilot::backend {

// A text-generation service. Calls block; failures are reported as
// std::nullopt / false / empty, never thrown.
class ModelBackend {
 public:
  ModelBackend() = default;
  ModelBackend(const ModelBackend&) = delete;
  ModelBackend(ModelBackend&&) = delete;
  auto operator=(const ModelBackend&) -> ModelBackend& = delete;
  auto operator=(ModelBackend&&) -> ModelBackend& = delete;
  virtual ~ModelBackend() = default;

  // std::nullopt when the service is unreachable or answers with an error.
  // `model` overrides the configured default.
  virtual auto Generate(
      const std::string& prompt, const std::optional<std::string>& system,
      const std::optional<std::string>& model) -> std::optional<std::string> = 0;

  virtual auto HealthCheck() -> bool = 0;

  virtual auto ListModels() -> std::vector<std::string> = 0;
};

}  // namespace gopilot::backend
