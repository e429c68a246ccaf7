#include "test_framework.hpp"

#include "ollacode/sessions/store.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <memory>
#include <stdexcept>

namespace {

using ollacode::tests::require;

} // namespace

void register_sessions_tests(std::vector<ollacode::tests::TestCase> &tests) {
  tests.push_back({"session_store_creates_one_engine_per_user", [] {
                     ollacode::testing::TempWorkspace workspace;
                     auto backend = std::make_shared<ollacode::testing::ScriptedBackend>();
                     std::vector<std::int64_t> created;
                     ollacode::sessions::SessionStore store([&](std::int64_t user_id) {
                       created.push_back(user_id);
                       return std::make_shared<ollacode::agent::ConversationEngine>(
                           backend, workspace.path());
                     });

                     const auto first = store.get_or_create(1);
                     const auto again = store.get_or_create(1);
                     const auto other = store.get_or_create(2);
                     require(first == again, "same engine for the same user");
                     require(first != other, "users are isolated");
                     require(created == std::vector<std::int64_t>({1, 2}), "factory called once each");
                     require(store.size() == 2, "two sessions");
                     require(store.find(3) == nullptr, "find does not create");
                   }});

  tests.push_back({"session_store_reset_clears_only_that_user", [] {
                     ollacode::testing::TempWorkspace workspace;
                     auto backend = std::make_shared<ollacode::testing::ScriptedBackend>();
                     backend->push_reply("a");
                     backend->push_reply("b");
                     ollacode::sessions::SessionStore store([&](std::int64_t) {
                       return std::make_shared<ollacode::agent::ConversationEngine>(
                           backend, workspace.path());
                     });
                     require(store.get_or_create(1)->respond("hi").ok(), "user 1 turn");
                     require(store.get_or_create(2)->respond("hi").ok(), "user 2 turn");

                     require(store.reset(1), "existing session resets");
                     require(store.find(1)->message_count() == 0, "user 1 cleared");
                     require(store.find(2)->message_count() == 2, "user 2 untouched");
                     require(!store.reset(9), "unknown user");

                     require(store.erase(2), "erase existing");
                     require(!store.erase(2), "second erase is a no-op");
                     require(store.size() == 1, "one session left");
                   }});

  tests.push_back({"session_store_requires_factory", [] {
                     bool threw = false;
                     try {
                       ollacode::sessions::SessionStore store{ollacode::sessions::EngineFactory{}};
                     } catch (const std::invalid_argument &) {
                       threw = true;
                     }
                     require(threw, "empty factory rejected");
                   }});
}
