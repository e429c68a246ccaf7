#include "ollacode/tools/executor.hpp"

#include "ollacode/observability/global.hpp"
#include "ollacode/tools/builtin.hpp"
#include "ollacode/tools/tool_kind.hpp"

#include <stdexcept>

namespace ollacode::tools {

namespace {

ToolResult dispatch(const ToolKind kind, const ToolContext &ctx, const ToolParams &params) {
  switch (kind) {
  case ToolKind::ReadFile:
    return builtin::read_file(ctx, params);
  case ToolKind::WriteFile:
    return builtin::write_file(ctx, params);
  case ToolKind::EditFile:
    return builtin::edit_file(ctx, params);
  case ToolKind::ListDirectory:
    return builtin::list_directory(ctx, params);
  case ToolKind::SearchFiles:
    return builtin::search_files(ctx, params);
  case ToolKind::GrepSearch:
    return builtin::grep_search(ctx, params);
  case ToolKind::RunCommand:
    return builtin::run_command(ctx, params);
  }
  throw std::logic_error("unhandled tool kind");
}

} // namespace

ToolExecutor::ToolExecutor(const std::filesystem::path &workspace_root, ExecutorOptions options)
    : workspace_(workspace_root), options_(options) {}

void ToolExecutor::set_approval_gate(std::shared_ptr<ApprovalGate> gate) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  gate_ = std::move(gate);
}

std::shared_ptr<ApprovalGate> ToolExecutor::approval_gate() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return gate_;
}

ToolResult ToolExecutor::execute(const std::string &tool_name, const ToolParams &params) {
  const auto kind = tool_kind_from_name(tool_name);
  if (!kind.has_value()) {
    return ToolResult::failure("Unknown tool: " + tool_name);
  }

  const auto gate = approval_gate();
  const ToolContext ctx{
      .workspace = workspace_,
      .gate = gate.get(),
      .command_timeout = options_.command_timeout,
  };

  const auto started = std::chrono::steady_clock::now();
  ToolResult result;
  try {
    result = dispatch(*kind, ctx, params);
  } catch (const std::exception &ex) {
    observability::record_error("tools", tool_name + ": " + ex.what());
    result = ToolResult::failure("Tool error (" + tool_name + "): " + ex.what());
  }
  observability::record_tool_call(
      tool_name,
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                            started),
      !result.is_error);
  return result;
}

} // namespace ollacode::tools
