#include "ollacode/agent/engine.hpp"

#include "ollacode/agent/compactor.hpp"
#include "ollacode/agent/prompt.hpp"
#include "ollacode/agent/tool_call_parser.hpp"
#include "ollacode/common/utf8.hpp"
#include "ollacode/observability/global.hpp"

namespace ollacode::agent {

namespace {

constexpr std::size_t kInlineResultChars = 500;
constexpr std::string_view kResultSeparator = "\n\n---\n\n";
constexpr std::string_view kRetryInstruction =
    "\n\n⚠️ Some tools returned errors. Please analyze and attempt to fix.";
constexpr std::string_view kSummarizeInstruction =
    "\n\nPlease respond to the user based on the above results.";

std::chrono::milliseconds elapsed_since(const std::chrono::steady_clock::time_point started) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                               started);
}

} // namespace

EngineOptions engine_options(const config::Config &config) {
  return EngineOptions{
      .max_context_tokens = config.max_context_tokens,
      .compact_mode = config.compact_mode,
      .command_timeout = std::chrono::seconds(config.tools.command_timeout_secs),
  };
}

ConversationEngine::ConversationEngine(std::shared_ptr<providers::ChatBackend> backend,
                                       const std::filesystem::path &workspace,
                                       EngineOptions options)
    : backend_(std::move(backend)),
      tools_(workspace, tools::ExecutorOptions{.command_timeout = options.command_timeout}),
      workspace_(tools_.workspace().root()), options_(options) {
  clear();
}

void ConversationEngine::clear() {
  const std::string memory = load_project_memory(workspace_);
  has_project_memory_ = !memory.empty();
  history_.clear();
  history_.push_back(
      Message{.role = Role::System, .content = std::string(base_system_prompt()) + memory});
}

void ConversationEngine::set_approval_gate(std::shared_ptr<tools::ApprovalGate> gate) {
  tools_.set_approval_gate(std::move(gate));
}

std::size_t ConversationEngine::message_count() const {
  return history_.empty() ? 0 : history_.size() - 1;
}

std::uint64_t ConversationEngine::estimated_tokens() const {
  return estimate_history_tokens(history_);
}

void ConversationEngine::begin_turn(const std::string &user_message) {
  history_.push_back(Message{.role = Role::User, .content = user_message});
  maybe_compact(history_, CompactionOptions{.enabled = options_.compact_mode,
                                                  .max_context_tokens = options_.max_context_tokens});
}

std::vector<providers::ChatMessage> ConversationEngine::backend_messages() const {
  std::vector<providers::ChatMessage> messages;
  messages.reserve(history_.size());
  for (const auto &message : history_) {
    messages.push_back(providers::ChatMessage{.role = std::string(role_name(message.role)),
                                              .content = message.content});
  }
  return messages;
}

ConversationEngine::ToolRound ConversationEngine::run_tools(const std::string &assistant_text,
                                                            const FragmentSink *sink) {
  ToolRound round;
  const auto calls = parse_tool_calls(assistant_text);
  if (calls.empty()) {
    return round;
  }

  std::string results;
  bool has_error = false;
  for (const auto &call : calls) {
    if (sink != nullptr && !(*sink)("\n\n⚙️ *Running: " + call.name + "...*\n")) {
      round.cancelled = true;
      return round;
    }

    const auto result = tools_.execute(call.name, call.parameters);
    has_error = has_error || result.is_error;
    const std::string stored =
        options_.compact_mode ? compact_tool_result(call.name, result.text) : result.text;
    if (!results.empty()) {
      results += kResultSeparator;
    }
    results += "**[" + call.name + " result]**\n" + stored;

    if (sink != nullptr) {
      const std::size_t length = common::utf8_length(result.text);
      const std::string shown = length < kInlineResultChars
                                    ? "\n" + result.text + "\n"
                                    : "\n✅ " + call.name + " done (" + std::to_string(length) +
                                          " chars)\n";
      if (!(*sink)(shown)) {
        round.cancelled = true;
        return round;
      }
    }
  }

  round.follow_up = std::string(TOOL_RESULTS_HEADER) + "\n\n" + results +
                    std::string(has_error ? kRetryInstruction : kSummarizeInstruction);
  return round;
}

common::Result<std::string> ConversationEngine::respond(const std::string &user_message) {
  const auto started = std::chrono::steady_clock::now();
  begin_turn(user_message);
  observability::record_agent_start(backend_->model(), history_.size());

  std::string response;
  std::size_t iterations = 0;
  while (iterations < options_.max_tool_iterations) {
    ++iterations;
    auto reply = backend_->chat(backend_messages());
    if (!reply.ok()) {
      observability::record_error("engine", reply.error());
      observability::record_agent_end(elapsed_since(started), iterations);
      return common::Result<std::string>::failure(reply.error());
    }
    response = std::move(reply.value().content);
    history_.push_back(Message{.role = Role::Assistant, .content = response});

    auto round = run_tools(response, nullptr);
    if (round.follow_up.empty()) {
      break;
    }
    history_.push_back(Message{.role = Role::User, .content = std::move(round.follow_up)});
  }

  observability::record_agent_end(elapsed_since(started), iterations);
  return common::Result<std::string>::success(std::move(response));
}

common::Result<StreamedTurn> ConversationEngine::respond_stream(const std::string &user_message,
                                                                const FragmentSink &sink) {
  const auto started = std::chrono::steady_clock::now();
  const auto snapshot = history_;
  begin_turn(user_message);
  observability::record_agent_start(backend_->model(), history_.size());

  bool stopped = false;
  const FragmentSink guarded = [&](std::string_view fragment) {
    if (stopped) {
      return false;
    }
    if (!sink(fragment)) {
      stopped = true;
    }
    return !stopped;
  };

  const auto cancel = [&](std::size_t iterations) {
    history_ = snapshot;
    observability::record_agent_end(elapsed_since(started), iterations, true);
    return common::Result<StreamedTurn>::success(StreamedTurn{.cancelled = true});
  };

  StreamedTurn turn;
  std::size_t iterations = 0;
  while (iterations < options_.max_tool_iterations) {
    ++iterations;
    auto reply = backend_->chat_stream(backend_messages(), guarded);
    if (stopped || (!reply.ok() && providers::is_cancellation_error(reply.error()))) {
      return cancel(iterations);
    }
    if (!reply.ok()) {
      observability::record_error("engine", reply.error());
      observability::record_agent_end(elapsed_since(started), iterations);
      return common::Result<StreamedTurn>::failure(reply.error());
    }
    turn.text = std::move(reply.value().content);
    history_.push_back(Message{.role = Role::Assistant, .content = turn.text});

    auto round = run_tools(turn.text, &guarded);
    if (round.cancelled) {
      return cancel(iterations);
    }
    if (round.follow_up.empty()) {
      break;
    }
    history_.push_back(Message{.role = Role::User, .content = std::move(round.follow_up)});
    if (!guarded(kResultSeparator)) {
      return cancel(iterations);
    }
  }

  observability::record_agent_end(elapsed_since(started), iterations);
  return common::Result<StreamedTurn>::success(std::move(turn));
}

} // namespace ollacode::agent
