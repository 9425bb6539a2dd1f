#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "gopilot/backend/model_backend.hpp"

namespace gopilot::backend {

struct OllamaOptions {
  std::string host{"localhost"};
  std::uint16_t port{11434};
  std::string model{"codellama"};
  // Connect and read timeout for generation
  std::chrono::seconds timeout{30};
  // Timeout for health checks and model listing
  std::chrono::seconds probe_timeout{5};
};

// Ollama HTTP API client. Generation uses the streaming endpoint and folds
// the chunks; each call opens its own connection, so calls may run
// concurrently.
class OllamaClient : public ModelBackend {
 public:
  explicit OllamaClient(
      OllamaOptions options, std::shared_ptr<spdlog::logger> logger = nullptr);

  auto Generate(
      const std::string& prompt, const std::optional<std::string>& system,
      const std::optional<std::string>& model)
      -> std::optional<std::string> override;

  auto HealthCheck() -> bool override;

  auto ListModels() -> std::vector<std::string> override;

  [[nodiscard]] auto Options() const -> const OllamaOptions& {
    return options_;
  }

 private:
  OllamaOptions options_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace gopilot::backend
