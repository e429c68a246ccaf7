#pragma once

#include <string>
#include <string_view>
#include <unordered_map>

namespace ollacode::tools {

/// Every failure result starts with this glyph; backend prompts key on it.
inline constexpr std::string_view FAILURE_MARKER = "❌";
/// Approval-denied results start with this glyph. Denial is not an error.
inline constexpr std::string_view SKIPPED_MARKER = "⏭️";
inline constexpr std::string_view SUCCESS_MARKER = "✅";

/// Tool parameters as parsed from a tool block. Non-string JSON values keep
/// their JSON text.
using ToolParams = std::unordered_map<std::string, std::string>;

struct ToolResult {
  std::string text;
  bool is_error = false;
  bool skipped = false;

  /// Prefixes `message` with FAILURE_MARKER.
  [[nodiscard]] static ToolResult failure(const std::string &message);
  /// Prefixes `message` with SKIPPED_MARKER.
  [[nodiscard]] static ToolResult skip(const std::string &message);
  [[nodiscard]] static ToolResult success(std::string text);
};

/// Parameter value or `fallback` when absent.
[[nodiscard]] std::string param_or(const ToolParams &params, const std::string &key,
                                   const std::string &fallback = "");

} // namespace ollacode::tools
