#pragma once

#include "ollacode/tools/approval.hpp"
#include "ollacode/tools/tool.hpp"
#include "ollacode/tools/workspace.hpp"

#include <chrono>

namespace ollacode::tools {

/// What a handler may touch: the sandbox, the approval gate (null approves)
/// and the subprocess time limit.
struct ToolContext {
  const Workspace &workspace;
  ApprovalGate *gate = nullptr;
  std::chrono::seconds command_timeout{60};
};

namespace builtin {

/// path, start_line (default 1), end_line (default 200).
[[nodiscard]] ToolResult read_file(const ToolContext &ctx, const ToolParams &params);
/// path, content. Gated; the prompt carries a diff when the file exists.
[[nodiscard]] ToolResult write_file(const ToolContext &ctx, const ToolParams &params);
/// path, search, replace. `search` must occur exactly once. Gated.
[[nodiscard]] ToolResult edit_file(const ToolContext &ctx, const ToolParams &params);
[[nodiscard]] ToolResult list_directory(const ToolContext &ctx, const ToolParams &params);
/// pattern (glob, default "*"), path (default ".").
[[nodiscard]] ToolResult search_files(const ToolContext &ctx, const ToolParams &params);
/// query (case-insensitive substring), path (default ".").
[[nodiscard]] ToolResult grep_search(const ToolContext &ctx, const ToolParams &params);
/// command, run through /bin/sh in the workspace root. Gated.
[[nodiscard]] ToolResult run_command(const ToolContext &ctx, const ToolParams &params);

} // namespace builtin

} // namespace ollacode::tools
