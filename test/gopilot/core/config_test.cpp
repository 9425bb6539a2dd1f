#include "gopilot/core/config.hpp"

#include <filesystem>
#include <fstream>
#include <random>

#include <catch2/catch_all.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using gopilot::Config;
using gopilot::ServerMode;

namespace {

// YAML file in a temporary directory, removed on scope exit
class TempConfigFile {
 public:
  explicit TempConfigFile(const std::string& content) {
    std::random_device device;
    dir_ = std::filesystem::temp_directory_path() /
           fmt::format("gopilot-config-{:08x}", device());
    std::filesystem::create_directories(dir_);
    std::ofstream(Path()) << content;
  }

  TempConfigFile(const TempConfigFile&) = delete;
  auto operator=(const TempConfigFile&) -> TempConfigFile& = delete;

  ~TempConfigFile() {
    std::error_code ec;
    std::filesystem::remove_all(dir_, ec);
  }

  [[nodiscard]] auto Path() const -> std::filesystem::path {
    return dir_ / gopilot::kConfigFileName;
  }

 private:
  std::filesystem::path dir_;
};

}  // namespace

TEST_CASE("Defaults", "[config]") {
  Config config;
  REQUIRE(config.mode == ServerMode::kStdio);
  REQUIRE(config.host == "127.0.0.1");
  REQUIRE(config.port == 2087);
  REQUIRE(config.ollama_host == "localhost");
  REQUIRE(config.ollama_port == 11434);
  REQUIRE(config.model == "codellama");
  REQUIRE(config.ollama_timeout_seconds == 30);
  REQUIRE(config.log_file == "/tmp/gopilot.log");
  REQUIRE(config.context_lines == 50);
}

TEST_CASE("Server modes round trip through their names", "[config]") {
  for (auto mode : {ServerMode::kStdio, ServerMode::kTcp, ServerMode::kAgent}) {
    REQUIRE(gopilot::ParseServerMode(gopilot::ToString(mode)) == mode);
  }
  REQUIRE_FALSE(gopilot::ParseServerMode("http").has_value());
}

TEST_CASE("LoadFromFile overrides the keys it names", "[config]") {
  TempConfigFile file(R"(
Mode: tcp
Port: 9000
Ollama:
  Host: gpu-box
  Model: deepseek-coder
  Timeout: 90
ContextLines: 20
)");

  auto config = Config::LoadFromFile(file.Path(), Config{});
  REQUIRE(config.has_value());
  REQUIRE(config->mode == ServerMode::kTcp);
  REQUIRE(config->port == 9000);
  REQUIRE(config->ollama_host == "gpu-box");
  REQUIRE(config->ollama_port == 11434);
  REQUIRE(config->model == "deepseek-coder");
  REQUIRE(config->ollama_timeout_seconds == 90);
  REQUIRE(config->context_lines == 20);
  REQUIRE(config->host == "127.0.0.1");
}

TEST_CASE("LoadFromFile keeps the base for unknown modes", "[config]") {
  TempConfigFile file("Mode: carrier-pigeon\nLogLevel: debug\n");
  Config base;
  base.mode = ServerMode::kAgent;

  auto config = Config::LoadFromFile(file.Path(), base);
  REQUIRE(config.has_value());
  REQUIRE(config->mode == ServerMode::kAgent);
  REQUIRE(config->log_level == "debug");
}

TEST_CASE("LoadFromFile rejects missing and broken files", "[config]") {
  REQUIRE_FALSE(Config::LoadFromFile("/nonexistent/.gopilot.yaml", Config{}).has_value());

  TempConfigFile broken("Port: [not, a, number\n");
  REQUIRE_FALSE(Config::LoadFromFile(broken.Path(), Config{}).has_value());

  TempConfigFile wrong_type("Port: eighty\n");
  REQUIRE_FALSE(Config::LoadFromFile(wrong_type.Path(), Config{}).has_value());
}

TEST_CASE("ApplyFlags sets every option", "[config]") {
  Config config;
  auto applied = config.ApplyFlags({
      {"mode", "agent"},
      {"host", "0.0.0.0"},
      {"port", "3000"},
      {"ollama-host", "remote"},
      {"ollama-port", "8080"},
      {"model", "llama3"},
      {"ollama-timeout", "45"},
      {"log-file", "-"},
      {"log-level", "trace"},
      {"repo-path", "/src/project"},
      {"context-lines", "0"},
      {"git-timeout", "5"},
      {"config", "/ignored.yaml"},
  });

  REQUIRE(applied.has_value());
  REQUIRE(config.mode == ServerMode::kAgent);
  REQUIRE(config.host == "0.0.0.0");
  REQUIRE(config.port == 3000);
  REQUIRE(config.ollama_host == "remote");
  REQUIRE(config.ollama_port == 8080);
  REQUIRE(config.model == "llama3");
  REQUIRE(config.ollama_timeout_seconds == 45);
  REQUIRE(config.log_file == "-");
  REQUIRE(config.log_level == "trace");
  REQUIRE(config.RepositoryRoot() == std::filesystem::path("/src/project"));
  REQUIRE(config.context_lines == 0);
  REQUIRE(config.git_timeout_seconds == 5);
}

TEST_CASE("ApplyFlags rejects bad values", "[config]") {
  Config config;

  auto bad_port = config.ApplyFlags({{"port", "70000"}});
  REQUIRE_FALSE(bad_port.has_value());
  REQUIRE(bad_port.error() == "Invalid value for --port: '70000'");

  REQUIRE_FALSE(config.ApplyFlags({{"mode", "http"}}).has_value());
  REQUIRE_FALSE(config.ApplyFlags({{"ollama-timeout", "0"}}).has_value());
  REQUIRE_FALSE(config.ApplyFlags({{"context-lines", "-1"}}).has_value());
  REQUIRE_FALSE(config.ApplyFlags({{"git-timeout", "1s"}}).has_value());

  auto unknown = config.ApplyFlags({{"verbose", "1"}});
  REQUIRE_FALSE(unknown.has_value());
  REQUIRE(unknown.error() == "Unknown option: --verbose");
  REQUIRE(config.port == 2087);
}

TEST_CASE("RepositoryRoot defaults to the working directory", "[config]") {
  Config config;
  REQUIRE(config.RepositoryRoot() == std::filesystem::current_path());
}
