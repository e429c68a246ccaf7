#pragma once

#include "ollacode/tools/tool.hpp"

#include <string>
#include <vector>

namespace ollacode::agent {

struct ToolCall {
  std::string name;
  tools::ToolParams parameters;
};

/// Tool calls embedded in generated text as ```tool fenced blocks, each holding
/// one JSON object with a "tool" key. Blocks that are not such an object are
/// skipped. Never throws.
[[nodiscard]] std::vector<ToolCall> parse_tool_calls(const std::string &text);

/// `text` with every ```tool block removed.
[[nodiscard]] std::string strip_tool_blocks(const std::string &text);

} // namespace ollacode::agent
