#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace gopilot {

enum class ServerMode {
  kStdio,
  kTcp,
  kAgent,
};

auto ParseServerMode(std::string_view name) -> std::optional<ServerMode>;
auto ToString(ServerMode mode) -> std::string_view;

constexpr std::string_view kConfigFileName = ".gopilot.yaml";

// Runtime settings. Defaults, then a YAML file, then command-line flags.
struct Config {
  ServerMode mode{ServerMode::kStdio};
  std::string host{"127.0.0.1"};
  std::uint16_t port{2087};

  std::string ollama_host{"localhost"};
  std::uint16_t ollama_port{11434};
  std::string model{"codellama"};
  int ollama_timeout_seconds{30};

  std::string log_file{"/tmp/gopilot.log"};
  std::string log_level{"info"};

  // Empty means the current directory
  std::string repo_path;
  int context_lines{50};
  int git_timeout_seconds{30};

  // Overlays the keys present in a YAML file onto `base`. Returns
  // std::nullopt if the file is missing or unreadable; callers keep `base`.
  static auto LoadFromFile(
      const std::filesystem::path& path, const Config& base,
      std::shared_ptr<spdlog::logger> logger = nullptr) -> std::optional<Config>;

  // Applies `--key=value` flags (without the leading dashes as keys).
  // Unknown keys and malformed values are errors.
  auto ApplyFlags(const std::map<std::string, std::string>& flags)
      -> std::expected<void, std::string>;

  [[nodiscard]] auto RepositoryRoot() const -> std::filesystem::path;
};

}  // namespace gopilot
