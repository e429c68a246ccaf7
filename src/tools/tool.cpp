#include "ollacode/tools/tool.hpp"

namespace ollacode::tools {

ToolResult ToolResult::failure(const std::string &message) {
  return ToolResult{.text = std::string(FAILURE_MARKER) + " " + message, .is_error = true};
}

ToolResult ToolResult::skip(const std::string &message) {
  return ToolResult{.text = std::string(SKIPPED_MARKER) + " " + message, .skipped = true};
}

ToolResult ToolResult::success(std::string text) { return ToolResult{.text = std::move(text)}; }

std::string param_or(const ToolParams &params, const std::string &key,
                     const std::string &fallback) {
  const auto it = params.find(key);
  return it == params.end() ? fallback : it->second;
}

} // namespace ollacode::tools
