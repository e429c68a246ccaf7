#include "ollacode/sessions/store.hpp"

#include "ollacode/observability/global.hpp"

#include <stdexcept>

namespace ollacode::sessions {

SessionStore::SessionStore(EngineFactory factory) : factory_(std::move(factory)) {
  if (!factory_) {
    throw std::invalid_argument("session store requires an engine factory");
  }
}

std::shared_ptr<agent::ConversationEngine> SessionStore::get_or_create(const std::int64_t user_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = sessions_.find(user_id);
  if (it != sessions_.end()) {
    return it->second;
  }
  auto engine = factory_(user_id);
  sessions_.emplace(user_id, engine);
  observability::record_metric(
      observability::ActiveSessionsMetric{.count = static_cast<std::uint64_t>(sessions_.size())});
  return engine;
}

std::shared_ptr<agent::ConversationEngine> SessionStore::find(const std::int64_t user_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = sessions_.find(user_id);
  return it == sessions_.end() ? nullptr : it->second;
}

bool SessionStore::reset(const std::int64_t user_id) {
  std::shared_ptr<agent::ConversationEngine> engine;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = sessions_.find(user_id);
    if (it == sessions_.end()) {
      return false;
    }
    engine = it->second;
  }
  engine->clear();
  return true;
}

bool SessionStore::erase(const std::int64_t user_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const bool erased = sessions_.erase(user_id) > 0;
  if (erased) {
    observability::record_metric(
        observability::ActiveSessionsMetric{.count = static_cast<std::uint64_t>(sessions_.size())});
  }
  return erased;
}

std::size_t SessionStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

} // namespace ollacode::sessions
