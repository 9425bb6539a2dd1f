#include <algorithm>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <asio.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "app/agent_cli.hpp"
#include "app/app_setup.hpp"
#include "gopilot/agent/agent.hpp"
#include "gopilot/backend/ollama_client.hpp"
#include "gopilot/core/gopilot_lsp_server.hpp"
#include "gopilot/core/session_state.hpp"
#include "gopilot/repository/git_repository.hpp"
#include "lsp/socket_driver.hpp"
#include "lsp/stdio_driver.hpp"

using gopilot::GopilotLspServer;
using gopilot::ServerMode;
using gopilot::backend::OllamaClient;
using gopilot::repository::CommandRunner;
using gopilot::repository::GitRepository;

namespace {

constexpr std::size_t kMinTcpThreads = 2;

auto MakeRepositoryFactory(
    std::chrono::seconds git_timeout, std::shared_ptr<spdlog::logger> logger)
    -> gopilot::RepositoryFactory {
  return [git_timeout, logger](const std::filesystem::path& root) {
    return std::make_shared<GitRepository>(
        root, CommandRunner(git_timeout, logger), logger);
  };
}

auto RunStdio(
    asio::io_context& io_context, GopilotLspServer& server,
    const std::shared_ptr<spdlog::logger>& logger) -> int {
  lsp::StdioDriver driver(io_context.get_executor(), server, logger);
  int exit_code = 0;

  asio::co_spawn(
      io_context,
      [&]() -> asio::awaitable<void> {
        auto result = co_await driver.Run();
        if (!result.has_value()) {
          logger->error("Server error: {}", result.error().Message());
          exit_code = 1;
        }
        io_context.stop();
      },
      asio::detached);

  io_context.run();
  return server.ExitCode().value_or(exit_code);
}

auto RunTcp(
    asio::io_context& io_context, GopilotLspServer& server,
    const gopilot::Config& config, const std::shared_ptr<spdlog::logger>& logger)
    -> int {
  lsp::SocketDriver driver(
      io_context.get_executor(), server, config.host, config.port, logger);
  auto endpoint = driver.Bind();
  if (!endpoint) {
    logger->error(
        "Cannot listen on {}:{}: {}", config.host, config.port,
        endpoint.error().Message());
    return 1;
  }
  logger->info(
      "Listening on {}:{}", endpoint->address().to_string(), endpoint->port());

  asio::signal_set signals(io_context, SIGINT, SIGTERM);
  signals.async_wait([&](const asio::error_code& ec, int signal_number) {
    if (!ec) {
      logger->info("Received signal {}, shutting down", signal_number);
      driver.Stop();
      io_context.stop();
    }
  });

  asio::co_spawn(io_context, driver.AcceptLoop(), asio::detached);

  const auto thread_count =
      std::max<std::size_t>(kMinTcpThreads, std::thread::hardware_concurrency());
  std::vector<std::jthread> workers;
  workers.reserve(thread_count - 1);
  for (std::size_t i = 1; i < thread_count; ++i) {
    workers.emplace_back([&io_context] { io_context.run(); });
  }
  io_context.run();
  workers.clear();

  return server.ExitCode().value_or(0);
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
  // stdout may carry the protocol: nothing logs there, before or after setup
  auto bootstrap = spdlog::stderr_color_mt("bootstrap");

  const std::vector<std::string> args(argv, argv + argc);
  auto config = app::LoadConfig(args, bootstrap);
  if (!config) {
    bootstrap->error("{}", config.error());
    std::cerr << app::Usage() << '\n';
    return 1;
  }

  auto loggers = app::SetupLoggers(*config);
  auto logger = loggers["gopilot"];
  logger->info(
      "Starting gopilot {} in {} mode (model {} at {}:{})",
      gopilot::kServerVersion, gopilot::ToString(config->mode), config->model,
      config->ollama_host, config->ollama_port);

  auto backend = std::make_shared<OllamaClient>(
      gopilot::backend::OllamaOptions{
          .host = config->ollama_host,
          .port = config->ollama_port,
          .model = config->model,
          .timeout = std::chrono::seconds(config->ollama_timeout_seconds),
      },
      logger);
  auto repository_factory = MakeRepositoryFactory(
      std::chrono::seconds(config->git_timeout_seconds), logger);

  if (config->mode == ServerMode::kAgent) {
    auto repository = repository_factory(config->RepositoryRoot());
    std::unique_ptr<gopilot::agent::Agent> agent;
    if (repository && repository->IsRepository()) {
      agent = std::make_unique<gopilot::agent::Agent>(backend, repository, logger);
    }
    return app::RunAgentCli(agent.get(), std::cin, std::cout);
  }

  auto session = std::make_shared<gopilot::SessionState>(logger);
  GopilotLspServer server(
      session, backend, repository_factory,
      gopilot::ServerOptions{.context_lines = config->context_lines}, logger,
      loggers["jsonrpc"]);
  server.BindRepository(config->RepositoryRoot());

  asio::io_context io_context;
  server.SetExitCallback([&io_context, logger](int code) {
    logger->info("Exit requested with code {}", code);
    io_context.stop();
  });

  if (config->mode == ServerMode::kTcp) {
    return RunTcp(io_context, server, *config, loggers["transport"]);
  }
  return RunStdio(io_context, server, loggers["transport"]);
}
