#pragma once

#include "ollacode/agent/engine.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace ollacode::sessions {

using EngineFactory = std::function<std::shared_ptr<agent::ConversationEngine>(std::int64_t)>;

/// Conversation engines keyed by user id. Owned by a transport.
class SessionStore {
public:
  explicit SessionStore(EngineFactory factory);

  /// The user's engine, created through the factory on first use.
  [[nodiscard]] std::shared_ptr<agent::ConversationEngine> get_or_create(std::int64_t user_id);
  [[nodiscard]] std::shared_ptr<agent::ConversationEngine> find(std::int64_t user_id) const;

  /// Clear the user's history. Returns false when there is no session.
  bool reset(std::int64_t user_id);
  bool erase(std::int64_t user_id);

  [[nodiscard]] std::size_t size() const;

private:
  EngineFactory factory_;
  mutable std::mutex mutex_;
  std::unordered_map<std::int64_t, std::shared_ptr<agent::ConversationEngine>> sessions_;
};

} // namespace ollacode::sessions
