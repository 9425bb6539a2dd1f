#include "gopilot/core/config.hpp"

#include <charconv>
#include <limits>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

namespace gopilot {

namespace {

auto ParseInt(std::string_view text) -> std::optional<int> {
  int value = 0;
  const auto* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (ec != std::errc() || ptr != end) {
    return std::nullopt;
  }
  return value;
}

auto ParsePort(std::string_view text) -> std::optional<std::uint16_t> {
  auto value = ParseInt(text);
  if (!value || *value < 0 || *value > std::numeric_limits<std::uint16_t>::max()) {
    return std::nullopt;
  }
  return static_cast<std::uint16_t>(*value);
}

auto ParsePositive(std::string_view text) -> std::optional<int> {
  auto value = ParseInt(text);
  if (!value || *value <= 0) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

auto ParseServerMode(std::string_view name) -> std::optional<ServerMode> {
  if (name == "stdio") {
    return ServerMode::kStdio;
  }
  if (name == "tcp") {
    return ServerMode::kTcp;
  }
  if (name == "agent") {
    return ServerMode::kAgent;
  }
  return std::nullopt;
}

auto ToString(ServerMode mode) -> std::string_view {
  switch (mode) {
    case ServerMode::kStdio:
      return "stdio";
    case ServerMode::kTcp:
      return "tcp";
    case ServerMode::kAgent:
      return "agent";
  }
  return "unknown";
}

auto Config::LoadFromFile(
    const std::filesystem::path& path, const Config& base,
    std::shared_ptr<spdlog::logger> logger) -> std::optional<Config> {
  if (!logger) {
    logger = spdlog::default_logger();
  }

  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    logger->debug("No configuration file at {}", path.string());
    return std::nullopt;
  }

  Config config = base;
  try {
    YAML::Node yaml = YAML::LoadFile(path.string());

    if (yaml["Mode"]) {
      const auto name = yaml["Mode"].as<std::string>();
      auto mode = ParseServerMode(name);
      if (!mode) {
        logger->warn("Ignoring unknown Mode '{}' in {}", name, path.string());
      } else {
        config.mode = *mode;
      }
    }
    if (yaml["Host"]) {
      config.host = yaml["Host"].as<std::string>();
    }
    if (yaml["Port"]) {
      config.port = yaml["Port"].as<std::uint16_t>();
    }

    if (const auto ollama = yaml["Ollama"]; ollama && ollama.IsMap()) {
      if (ollama["Host"]) {
        config.ollama_host = ollama["Host"].as<std::string>();
      }
      if (ollama["Port"]) {
        config.ollama_port = ollama["Port"].as<std::uint16_t>();
      }
      if (ollama["Model"]) {
        config.model = ollama["Model"].as<std::string>();
      }
      if (ollama["Timeout"]) {
        config.ollama_timeout_seconds = ollama["Timeout"].as<int>();
      }
    }

    if (yaml["LogFile"]) {
      config.log_file = yaml["LogFile"].as<std::string>();
    }
    if (yaml["LogLevel"]) {
      config.log_level = yaml["LogLevel"].as<std::string>();
    }
    if (yaml["RepoPath"]) {
      config.repo_path = yaml["RepoPath"].as<std::string>();
    }
    if (yaml["ContextLines"]) {
      config.context_lines = yaml["ContextLines"].as<int>();
    }
    if (yaml["GitTimeout"]) {
      config.git_timeout_seconds = yaml["GitTimeout"].as<int>();
    }

    logger->debug("Loaded configuration from {}", path.string());
    return config;
  } catch (const YAML::Exception& e) {
    logger->error("Error parsing configuration file {}: {}", path.string(), e.what());
    return std::nullopt;
  }
}

auto Config::ApplyFlags(const std::map<std::string, std::string>& flags)
    -> std::expected<void, std::string> {
  auto invalid = [](std::string_view key, std::string_view value) {
    return std::unexpected(
        fmt::format("Invalid value for --{}: '{}'", key, value));
  };

  for (const auto& [key, value] : flags) {
    if (key == "config") {
      // Consumed before the file is loaded
      continue;
    }
    if (key == "mode") {
      auto mode = ParseServerMode(value);
      if (!mode) {
        return invalid(key, value);
      }
      this->mode = *mode;
    } else if (key == "host") {
      host = value;
    } else if (key == "port") {
      auto parsed = ParsePort(value);
      if (!parsed) {
        return invalid(key, value);
      }
      port = *parsed;
    } else if (key == "ollama-host") {
      ollama_host = value;
    } else if (key == "ollama-port") {
      auto parsed = ParsePort(value);
      if (!parsed) {
        return invalid(key, value);
      }
      ollama_port = *parsed;
    } else if (key == "model") {
      model = value;
    } else if (key == "ollama-timeout") {
      auto parsed = ParsePositive(value);
      if (!parsed) {
        return invalid(key, value);
      }
      ollama_timeout_seconds = *parsed;
    } else if (key == "log-file") {
      log_file = value;
    } else if (key == "log-level") {
      log_level = value;
    } else if (key == "repo-path") {
      repo_path = value;
    } else if (key == "context-lines") {
      auto parsed = ParseInt(value);
      if (!parsed || *parsed < 0) {
        return invalid(key, value);
      }
      context_lines = *parsed;
    } else if (key == "git-timeout") {
      auto parsed = ParsePositive(value);
      if (!parsed) {
        return invalid(key, value);
      }
      git_timeout_seconds = *parsed;
    } else {
      return std::unexpected(fmt::format("Unknown option: --{}", key));
    }
  }
  return {};
}

auto Config::RepositoryRoot() const -> std::filesystem::path {
  if (repo_path.empty()) {
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    return ec ? std::filesystem::path(".") : cwd;
  }
  return std::filesystem::path(repo_path);
}

}  // namespace gopilot
