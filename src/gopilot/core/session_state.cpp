#include "gopilot/core/session_state.hpp"

namespace gopilot {

SessionState::SessionState(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()) {
}

void SessionState::StoreDocument(const std::string& uri, std::string text) {
  std::lock_guard lock(mutex_);
  logger_->debug("Stored {} ({} bytes)", uri, text.size());
  documents_.insert_or_assign(uri, std::move(text));
}

void SessionState::RemoveDocument(const std::string& uri) {
  std::lock_guard lock(mutex_);
  if (documents_.erase(uri) > 0) {
    logger_->debug("Removed {}", uri);
  }
}

auto SessionState::GetDocument(const std::string& uri) const
    -> std::optional<std::string> {
  std::lock_guard lock(mutex_);
  if (auto it = documents_.find(uri); it != documents_.end()) {
    return it->second;
  }
  return std::nullopt;
}

auto SessionState::Documents() const -> context::DocumentSnapshot {
  std::lock_guard lock(mutex_);
  return documents_;
}

auto SessionState::DocumentCount() const -> std::size_t {
  std::lock_guard lock(mutex_);
  return documents_.size();
}

auto SessionState::State() const -> lsp::LifecycleState {
  std::lock_guard lock(mutex_);
  return state_;
}

void SessionState::MarkInitializing() {
  std::lock_guard lock(mutex_);
  state_ = lsp::LifecycleState::kInitializing;
}

void SessionState::MarkInitialized() {
  std::lock_guard lock(mutex_);
  state_ = lsp::LifecycleState::kInitialized;
}

void SessionState::MarkShutdownRequested() {
  std::lock_guard lock(mutex_);
  shutdown_requested_ = true;
  state_ = lsp::LifecycleState::kShutdownRequested;
}

auto SessionState::MarkExited() -> int {
  std::lock_guard lock(mutex_);
  state_ = lsp::LifecycleState::kExited;
  return shutdown_requested_ ? 0 : 1;
}

void SessionState::BindRepository(RepositoryBinding binding) {
  std::lock_guard lock(mutex_);
  binding_ = std::move(binding);
}

auto SessionState::Binding() const -> RepositoryBinding {
  std::lock_guard lock(mutex_);
  return binding_;
}

}  // namespace gopilot
