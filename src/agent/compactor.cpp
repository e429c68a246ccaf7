#include "ollacode/agent/compactor.hpp"

#include "ollacode/common/utf8.hpp"
#include "ollacode/observability/global.hpp"

namespace ollacode::agent {

namespace {

constexpr double kTriggerRatio = 0.8;
constexpr std::size_t kAssistantLineChars = 150;
constexpr std::size_t kUserChars = 100;
constexpr std::size_t kResultHeadChars = 300;
constexpr std::size_t kResultTailChars = 200;
constexpr std::size_t kResultTailMinimum = 500;

bool is_cjk(const char32_t cp) {
  return (cp >= 0x4E00 && cp <= 0x9FFF) || (cp >= 0xAC00 && cp <= 0xD7AF) ||
         (cp >= 0x3040 && cp <= 0x309F) || (cp >= 0x30A0 && cp <= 0x30FF);
}

std::string summarize(const Message &message) {
  switch (message.role) {
  case Role::Assistant: {
    const auto newline = message.content.find('\n');
    return "Assistant: " + common::utf8_prefix(message.content.substr(0, newline),
                                               kAssistantLineChars);
  }
  case Role::User:
    if (message.content.rfind(TOOL_RESULTS_HEADER, 0) == 0) {
      return "[tool results processed]";
    }
    return "User: " + common::utf8_prefix(message.content, kUserChars);
  case Role::System:
    break;
  }
  return "";
}

} // namespace

std::uint64_t estimate_tokens(const std::string_view text) {
  std::uint64_t cjk = 0;
  std::uint64_t other = 0;
  for (const char32_t cp : common::decode_utf8(text)) {
    if (is_cjk(cp)) {
      ++cjk;
    } else {
      ++other;
    }
  }
  return static_cast<std::uint64_t>(static_cast<double>(other) / 4.0 +
                                    static_cast<double>(cjk) / 1.5);
}

std::uint64_t estimate_history_tokens(const std::vector<Message> &history) {
  std::uint64_t total = 0;
  for (const auto &message : history) {
    total += estimate_tokens(message.content);
  }
  return total;
}

bool maybe_compact(std::vector<Message> &history, const CompactionOptions &options) {
  if (!options.enabled) {
    return false;
  }
  const std::uint64_t before = estimate_history_tokens(history);
  const auto threshold =
      static_cast<std::uint64_t>(static_cast<double>(options.max_context_tokens) * kTriggerRatio);
  if (before <= threshold || history.size() <= PRESERVE_RECENT + 1) {
    return false;
  }

  const std::size_t recent_begin = history.size() - PRESERVE_RECENT;
  std::vector<std::string> lines;
  for (std::size_t i = 1; i < recent_begin; ++i) {
    auto line = summarize(history[i]);
    if (!line.empty()) {
      lines.push_back(std::move(line));
    }
  }

  std::string summary = std::string(SUMMARY_HEADER) + "\n";
  const std::size_t first = lines.size() > MAX_SUMMARY_LINES ? lines.size() - MAX_SUMMARY_LINES : 0;
  for (std::size_t i = first; i < lines.size(); ++i) {
    if (i > first) {
      summary += "\n";
    }
    summary += lines[i];
  }

  const std::size_t messages_before = history.size();
  std::vector<Message> rebuilt;
  rebuilt.reserve(PRESERVE_RECENT + 2);
  rebuilt.push_back(std::move(history.front()));
  rebuilt.push_back(Message{.role = Role::User, .content = std::move(summary)});
  for (std::size_t i = recent_begin; i < history.size(); ++i) {
    rebuilt.push_back(std::move(history[i]));
  }
  history = std::move(rebuilt);

  observability::record_compaction(before, estimate_history_tokens(history), messages_before,
                                   history.size());
  return true;
}

std::string compact_tool_result(const std::string &tool_name, const std::string &result) {
  const std::size_t length = common::utf8_length(result);
  if (length <= RESULT_COMPACT_THRESHOLD) {
    return result;
  }
  const std::string tail =
      length > kResultTailMinimum ? common::utf8_suffix(result, kResultTailChars) : "";
  return "[" + tool_name + " result — " + std::to_string(length) + " chars, compressed]\n" +
         common::utf8_prefix(result, kResultHeadChars) + "\n... (truncated) ...\n" + tail;
}

} // namespace ollacode::agent
