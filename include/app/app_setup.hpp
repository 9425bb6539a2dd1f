#pragma once

#include <expected>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include <spdlog/logger.h>

#include "gopilot/core/config.hpp"

namespace app {

/// Parse `--key=value` arguments after the program name into a key/value map
/// Returns an error message for any argument not in that form
auto ParseFlags(const std::vector<std::string>& args)
    -> std::expected<std::map<std::string, std::string>, std::string>;

/// Build the runtime configuration: defaults, then the YAML file named by
/// --config (or .gopilot.yaml in the repository), then the flags
auto LoadConfig(
    const std::vector<std::string>& args,
    std::shared_ptr<spdlog::logger> logger = nullptr)
    -> std::expected<gopilot::Config, std::string>;

/// Command line summary printed on argument errors
auto Usage() -> std::string;

/// Setup structured logging with named loggers
/// Returns loggers for transport, jsonrpc, and gopilot components. All of
/// them write to the configured log file, or stderr, never stdout.
auto SetupLoggers(const gopilot::Config& config)
    -> std::unordered_map<std::string, std::shared_ptr<spdlog::logger>>;

}  // namespace app
