#include "app/app_setup.hpp"

#include <algorithm>
#include <array>
#include <cstdlib>
#include <string_view>
#include <unordered_map>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace app {

namespace {

constexpr std::string_view kLogPattern = "[%n][%L] %v";
constexpr std::string_view kFileLogPattern = "[%Y-%m-%d %H:%M:%S.%e][%n][%L] %v";
constexpr std::string_view kFlagPrefix = "--";

struct LoggerConfig {
  std::string_view name;
  spdlog::level::level_enum level;
};

auto ParseLogLevel(std::string_view level_str) -> spdlog::level::level_enum {
  static const std::unordered_map<std::string_view, spdlog::level::level_enum>
      kLevelMap = {
          {"trace", spdlog::level::trace}, {"debug", spdlog::level::debug},
          {"info", spdlog::level::info},   {"warn", spdlog::level::warn},
          {"error", spdlog::level::err},   {"off", spdlog::level::off},
      };

  if (auto it = kLevelMap.find(level_str); it != kLevelMap.end()) {
    return it->second;
  }
  return spdlog::level::info;
}

// SPDLOG_LEVEL wins over the configured level
auto ResolveLogLevel(const gopilot::Config& config)
    -> spdlog::level::level_enum {
  const char* env_level = std::getenv("SPDLOG_LEVEL");
  return ParseLogLevel(env_level != nullptr ? env_level : config.log_level);
}

auto MakeSink(const gopilot::Config& config) -> spdlog::sink_ptr {
  if (!config.log_file.empty() && config.log_file != "-") {
    try {
      auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
          config.log_file, false);
      sink->set_pattern(std::string(kFileLogPattern));
      return sink;
    } catch (const spdlog::spdlog_ex& e) {
      // Unwritable log file: keep logging, on stderr
      spdlog::sinks::stderr_color_sink_mt fallback;
      fallback.log(spdlog::details::log_msg(
          "gopilot", spdlog::level::warn, e.what()));
    }
  }
  auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  sink->set_pattern(std::string(kLogPattern));
  return sink;
}

void ConfigureLogger(
    const std::shared_ptr<spdlog::logger>& logger,
    spdlog::level::level_enum level) {
  logger->set_level(level);
  logger->flush_on(spdlog::level::info);
}

}  // namespace

auto ParseFlags(const std::vector<std::string>& args)
    -> std::expected<std::map<std::string, std::string>, std::string> {
  std::map<std::string, std::string> flags;
  for (std::size_t i = 1; i < args.size(); ++i) {
    std::string_view arg = args[i];
    const auto equals = arg.find('=');
    if (!arg.starts_with(kFlagPrefix) || equals == std::string_view::npos ||
        equals == kFlagPrefix.size()) {
      return std::unexpected("Unrecognized argument: " + args[i]);
    }
    flags.insert_or_assign(
        std::string(arg.substr(kFlagPrefix.size(), equals - kFlagPrefix.size())),
        std::string(arg.substr(equals + 1)));
  }
  return flags;
}

auto LoadConfig(
    const std::vector<std::string>& args,
    std::shared_ptr<spdlog::logger> logger)
    -> std::expected<gopilot::Config, std::string> {
  if (!logger) {
    logger = spdlog::default_logger();
  }

  auto flags = ParseFlags(args);
  if (!flags) {
    return std::unexpected(flags.error());
  }

  gopilot::Config config;

  // The repository path decides where the default config file lives
  std::filesystem::path config_path;
  if (auto it = flags->find("config"); it != flags->end()) {
    config_path = it->second;
    if (!std::filesystem::exists(config_path)) {
      return std::unexpected("Config file not found: " + it->second);
    }
  } else {
    gopilot::Config located;
    if (auto repo = flags->find("repo-path"); repo != flags->end()) {
      located.repo_path = repo->second;
    }
    config_path = located.RepositoryRoot() / gopilot::kConfigFileName;
  }

  if (auto loaded = gopilot::Config::LoadFromFile(config_path, config, logger)) {
    config = std::move(*loaded);
  }

  if (auto applied = config.ApplyFlags(*flags); !applied) {
    return std::unexpected(applied.error());
  }
  return config;
}

auto Usage() -> std::string {
  return "Usage: gopilot [--mode=stdio|tcp|agent] [--host=HOST] [--port=PORT]\n"
         "               [--ollama-host=HOST] [--ollama-port=PORT] [--model=NAME]\n"
         "               [--ollama-timeout=SECONDS] [--log-file=PATH|-]\n"
         "               [--log-level=trace|debug|info|warn|error|off]\n"
         "               [--repo-path=DIR] [--context-lines=N]\n"
         "               [--git-timeout=SECONDS] [--config=FILE]";
}

auto SetupLoggers(const gopilot::Config& config)
    -> std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> {
  const auto user_log_level = ResolveLogLevel(config);
  auto sink = MakeSink(config);

  constexpr std::array kLoggerConfigs = {
      LoggerConfig{.name = "transport", .level = spdlog::level::info},
      LoggerConfig{.name = "jsonrpc", .level = spdlog::level::info},
      LoggerConfig{.name = "gopilot", .level = spdlog::level::trace},
  };

  std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> loggers;

  for (const auto& config_entry : kLoggerConfigs) {
    const std::string name(config_entry.name);
    spdlog::drop(name);
    auto logger = std::make_shared<spdlog::logger>(name, sink);
    const auto level = (config_entry.name == "gopilot")
                           ? user_log_level
                           : std::max(config_entry.level, user_log_level);
    ConfigureLogger(logger, level);
    spdlog::register_logger(logger);
    loggers[name] = std::move(logger);
  }

  // Anything logging through the default logger lands in the same sink
  spdlog::set_default_logger(loggers["gopilot"]);
  return loggers;
}

}  // namespace app
