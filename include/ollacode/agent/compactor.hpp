#pragma once

#include "ollacode/agent/message.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace ollacode::agent {

inline constexpr std::size_t PRESERVE_RECENT = 6;
inline constexpr std::size_t MAX_SUMMARY_LINES = 10;
inline constexpr std::size_t RESULT_COMPACT_THRESHOLD = 800;

/// Marker that opens every synthetic tool-result message.
inline constexpr std::string_view TOOL_RESULTS_HEADER = "[Tool execution results]";
inline constexpr std::string_view SUMMARY_HEADER = "[Previous conversation summary]";

/// Rough token count: one token per 1.5 CJK/Hangul/kana code points plus one per
/// four other code points.
[[nodiscard]] std::uint64_t estimate_tokens(std::string_view text);
[[nodiscard]] std::uint64_t estimate_history_tokens(const std::vector<Message> &history);

struct CompactionOptions {
  bool enabled = true;
  std::uint64_t max_context_tokens = 8192;
};

/// Summarize the middle of `history` when its estimate exceeds 80% of the
/// budget. Message 0 and the last PRESERVE_RECENT messages are kept verbatim.
/// Returns true when the history was rewritten.
bool maybe_compact(std::vector<Message> &history, const CompactionOptions &options);

/// Head and tail of a long tool result with a size note; short results are
/// returned unchanged.
[[nodiscard]] std::string compact_tool_result(const std::string &tool_name,
                                              const std::string &result);

} // namespace ollacode::agent
