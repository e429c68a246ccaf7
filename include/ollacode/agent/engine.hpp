#pragma once

#include "ollacode/agent/message.hpp"
#include "ollacode/common/result.hpp"
#include "ollacode/config/schema.hpp"
#include "ollacode/providers/traits.hpp"
#include "ollacode/tools/executor.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace ollacode::agent {

inline constexpr std::size_t MAX_TOOL_ITERATIONS = 10;

struct EngineOptions {
  std::uint64_t max_context_tokens = 8192;
  bool compact_mode = true;
  std::size_t max_tool_iterations = MAX_TOOL_ITERATIONS;
  std::chrono::seconds command_timeout{60};
};

[[nodiscard]] EngineOptions engine_options(const config::Config &config);

/// Receives streamed text in order. Returning false cancels the turn.
using FragmentSink = std::function<bool(std::string_view)>;

struct StreamedTurn {
  /// Final assistant text, identical to what respond() would return.
  std::string text;
  bool cancelled = false;
};

/// One conversation: its history, a backend and a sandboxed tool executor.
/// Not thread-safe; a session is driven by one caller at a time.
class ConversationEngine {
public:
  ConversationEngine(std::shared_ptr<providers::ChatBackend> backend,
                     const std::filesystem::path &workspace, EngineOptions options = {});

  /// Run the tool loop for one user message and return the final assistant
  /// text. Backend failures are returned as errors; the user message stays in
  /// history.
  [[nodiscard]] common::Result<std::string> respond(const std::string &user_message);

  /// Streaming form of respond(). When `sink` returns false the in-flight
  /// request is aborted and history is restored to its state before the turn.
  [[nodiscard]] common::Result<StreamedTurn> respond_stream(const std::string &user_message,
                                                            const FragmentSink &sink);

  /// Drop everything but a freshly built system message.
  void clear();

  void set_approval_gate(std::shared_ptr<tools::ApprovalGate> gate);

  [[nodiscard]] const std::vector<Message> &history() const { return history_; }
  /// History length without the system message.
  [[nodiscard]] std::size_t message_count() const;
  [[nodiscard]] std::uint64_t estimated_tokens() const;
  [[nodiscard]] bool has_project_memory() const { return has_project_memory_; }

  [[nodiscard]] const EngineOptions &options() const { return options_; }
  [[nodiscard]] providers::ChatBackend &backend() { return *backend_; }
  [[nodiscard]] tools::ToolExecutor &tools() { return tools_; }

private:
  struct ToolRound {
    std::string follow_up;
    bool cancelled = false;
  };

  void begin_turn(const std::string &user_message);
  [[nodiscard]] std::vector<providers::ChatMessage> backend_messages() const;
  /// Executes every tool call in `assistant_text`; empty follow-up when there are none.
  [[nodiscard]] ToolRound run_tools(const std::string &assistant_text, const FragmentSink *sink);

  std::shared_ptr<providers::ChatBackend> backend_;
  tools::ToolExecutor tools_;
  std::filesystem::path workspace_;
  EngineOptions options_;
  std::vector<Message> history_;
  bool has_project_memory_ = false;
};

} // namespace ollacode::agent
