#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

#include "gopilot/agent/agent.hpp"
#include "gopilot/context/context_assembler.hpp"
#include "gopilot/repository/repository_inspector.hpp"
#include "lsp/lifecycle.hpp"

namespace gopilot {

// The repository a session is bound to. `agent` is set only when the root
// is inside a work tree.
struct RepositoryBinding {
  std::shared_ptr<repository::RepositoryInspector> repository;
  std::shared_ptr<agent::Agent> agent;
};

// Open documents, lifecycle state and the repository binding, shared by
// every connection. All members are guarded by one mutex; readers get
// copies, never references into the store.
class SessionState {
 public:
  explicit SessionState(std::shared_ptr<spdlog::logger> logger = nullptr);

  // Replaces any previous text for `uri`
  void StoreDocument(const std::string& uri, std::string text);

  // No-op when `uri` isn't open
  void RemoveDocument(const std::string& uri);

  [[nodiscard]] auto GetDocument(const std::string& uri) const
      -> std::optional<std::string>;

  // Copy of every open document, ordered by URI
  [[nodiscard]] auto Documents() const -> context::DocumentSnapshot;

  [[nodiscard]] auto DocumentCount() const -> std::size_t;

  [[nodiscard]] auto State() const -> lsp::LifecycleState;
  void MarkInitializing();
  void MarkInitialized();
  void MarkShutdownRequested();
  // Returns the process exit code: 0 if shutdown came first, else 1
  auto MarkExited() -> int;

  void BindRepository(RepositoryBinding binding);
  [[nodiscard]] auto Binding() const -> RepositoryBinding;

 private:
  std::shared_ptr<spdlog::logger> logger_;
  mutable std::mutex mutex_;
  context::DocumentSnapshot documents_;
  lsp::LifecycleState state_{lsp::LifecycleState::kUninitialized};
  bool shutdown_requested_{false};
  RepositoryBinding binding_;
};

}  // namespace gopilot
