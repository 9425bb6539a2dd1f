#include "gopilot/backend/ollama_client.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "gopilot/backend/generate_stream.hpp"
#include "gopilot/utils/scoped_timer.hpp"

namespace gopilot::backend {

namespace {

constexpr auto kGeneratePath = "/api/generate";
constexpr auto kTagsPath = "/api/tags";

auto MakeClient(const OllamaOptions& options, std::chrono::seconds timeout)
    -> httplib::Client {
  httplib::Client client(options.host, options.port);
  client.set_connection_timeout(timeout);
  client.set_read_timeout(timeout);
  client.set_write_timeout(timeout);
  return client;
}

}  // namespace

OllamaClient::OllamaClient(
    OllamaOptions options, std::shared_ptr<spdlog::logger> logger)
    : options_(std::move(options)),
      logger_(logger ? logger : spdlog::default_logger()) {
  logger_->info(
      "Ollama client: http://{}:{}, model={}", options_.host, options_.port,
      options_.model);
}

auto OllamaClient::Generate(
    const std::string& prompt, const std::optional<std::string>& system,
    const std::optional<std::string>& model) -> std::optional<std::string> {
  utils::ScopedTimer timer("Ollama generate", logger_);

  nlohmann::json payload = {
      {"model", model.value_or(options_.model)},
      {"prompt", prompt},
      {"stream", true},
  };
  if (system && !system->empty()) {
    payload["system"] = *system;
  }

  auto client = MakeClient(options_, options_.timeout);
  GenerateStream stream;

  httplib::Request request;
  request.method = "POST";
  request.path = kGeneratePath;
  request.set_header("Content-Type", "application/json");
  request.body =
      payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  request.content_receiver = [&stream](
                                 const char* data, std::size_t length,
                                 std::uint64_t /*offset*/,
                                 std::uint64_t /*total*/) {
    return stream.Feed(std::string_view(data, length));
  };

  auto result = client.send(request);
  // Stopping the receiver early on `done` surfaces as a cancellation
  if (!result && !(result.error() == httplib::Error::Canceled &&
                   (stream.IsDone() || stream.IsTruncated()))) {
    logger_->error(
        "Ollama request failed: {}", httplib::to_string(result.error()));
    return std::nullopt;
  }
  if (result && result->status != 200) {
    logger_->error("Ollama HTTP error: {}", result->status);
    return std::nullopt;
  }

  stream.Finish();
  if (stream.IsTruncated()) {
    logger_->warn("Ollama response exceeded the size bound, truncated");
  }
  if (stream.SkippedLines() > 0) {
    logger_->debug("Skipped {} undecodable stream lines", stream.SkippedLines());
  }
  return stream.Text();
}

auto OllamaClient::HealthCheck() -> bool {
  auto client = MakeClient(options_, options_.probe_timeout);
  auto result = client.Get(kTagsPath);
  if (!result) {
    logger_->warn("Health check failed: {}", httplib::to_string(result.error()));
    return false;
  }
  return result->status == 200;
}

auto OllamaClient::ListModels() -> std::vector<std::string> {
  std::vector<std::string> models;
  auto client = MakeClient(options_, options_.probe_timeout);
  auto result = client.Get(kTagsPath);
  if (!result || result->status != 200) {
    logger_->error("Failed to list models");
    return models;
  }

  auto body = nlohmann::json::parse(result->body, nullptr, false);
  if (body.is_discarded() || !body.contains("models") ||
      !body["models"].is_array()) {
    logger_->error("Unexpected model listing payload");
    return models;
  }
  for (const auto& entry : body["models"]) {
    if (entry.contains("name") && entry["name"].is_string()) {
      models.push_back(entry["name"].get<std::string>());
    }
  }
  return models;
}

}  // namespace gopilot::backend
