#include "ollacode/agent/tool_call_parser.hpp"

#include "ollacode/common/fs.hpp"
#include "ollacode/common/json_util.hpp"

#include <cctype>
#include <optional>

namespace ollacode::agent {

namespace {

constexpr std::string_view kOpenFence = "```tool";
constexpr std::string_view kCloseFence = "\n```";

struct BlockSpan {
  std::size_t begin = 0;      // start of the opening fence
  std::size_t body_begin = 0; // first character after the opening line
  std::size_t body_end = 0;   // the '\n' before the closing fence
  std::size_t end = 0;        // one past the closing fence
};

/// Next block at or after `from`. The opening fence may be followed by
/// whitespace, of which at least one character must be a newline; the body is
/// at least one character long.
std::optional<BlockSpan> next_block(const std::string &text, std::size_t from) {
  while (true) {
    const std::size_t open = text.find(kOpenFence, from);
    if (open == std::string::npos) {
      return std::nullopt;
    }
    std::size_t cursor = open + kOpenFence.size();
    std::size_t last_newline = std::string::npos;
    while (cursor < text.size() && std::isspace(static_cast<unsigned char>(text[cursor])) != 0) {
      if (text[cursor] == '\n') {
        last_newline = cursor;
      }
      ++cursor;
    }
    if (last_newline != std::string::npos) {
      const std::size_t body_begin = last_newline + 1;
      const std::size_t close = text.find(kCloseFence, body_begin + 1);
      if (close == std::string::npos) {
        return std::nullopt;
      }
      return BlockSpan{.begin = open,
                       .body_begin = body_begin,
                       .body_end = close,
                       .end = close + kCloseFence.size()};
    }
    from = open + 1;
  }
}

} // namespace

std::vector<ToolCall> parse_tool_calls(const std::string &text) {
  std::vector<ToolCall> calls;
  std::size_t cursor = 0;
  while (auto block = next_block(text, cursor)) {
    cursor = block->end;
    const std::string body =
        common::trim(text.substr(block->body_begin, block->body_end - block->body_begin));
    auto object = common::json_parse_object(body);
    if (!object.has_value()) {
      continue;
    }
    const auto tool = object->find("tool");
    if (tool == object->end()) {
      continue;
    }
    ToolCall call{.name = tool->second};
    object->erase(tool);
    call.parameters = std::move(*object);
    calls.push_back(std::move(call));
  }
  return calls;
}

std::string strip_tool_blocks(const std::string &text) {
  std::string out;
  std::size_t cursor = 0;
  while (auto block = next_block(text, cursor)) {
    out.append(text, cursor, block->begin - cursor);
    cursor = block->end;
  }
  out.append(text, cursor, std::string::npos);
  return out;
}

} // namespace ollacode::agent
