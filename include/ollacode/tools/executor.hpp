#pragma once

#include "ollacode/tools/approval.hpp"
#include "ollacode/tools/tool.hpp"
#include "ollacode/tools/workspace.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

namespace ollacode::tools {

struct ExecutorOptions {
  std::chrono::seconds command_timeout{60};
};

/// Runs named tools inside one workspace. Never throws: unknown names and
/// handler exceptions come back as failure results.
class ToolExecutor {
public:
  explicit ToolExecutor(const std::filesystem::path &workspace_root, ExecutorOptions options = {});

  void set_approval_gate(std::shared_ptr<ApprovalGate> gate);
  [[nodiscard]] std::shared_ptr<ApprovalGate> approval_gate() const;

  [[nodiscard]] const Workspace &workspace() const { return workspace_; }

  [[nodiscard]] ToolResult execute(const std::string &tool_name, const ToolParams &params);

private:
  Workspace workspace_;
  ExecutorOptions options_;
  mutable std::mutex state_mutex_;
  std::shared_ptr<ApprovalGate> gate_;
};

} // namespace ollacode::tools
