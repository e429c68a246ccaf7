#pragma once

#include <array>
#include <optional>
#include <string_view>

namespace ollacode::tools {

enum class ToolKind {
  ReadFile,
  WriteFile,
  EditFile,
  ListDirectory,
  SearchFiles,
  GrepSearch,
  RunCommand,
};

inline constexpr std::array<ToolKind, 7> ALL_TOOL_KINDS = {
    ToolKind::ReadFile,    ToolKind::WriteFile,  ToolKind::EditFile,   ToolKind::ListDirectory,
    ToolKind::SearchFiles, ToolKind::GrepSearch, ToolKind::RunCommand,
};

[[nodiscard]] std::optional<ToolKind> tool_kind_from_name(std::string_view name);
[[nodiscard]] std::string_view tool_kind_name(ToolKind kind);

/// File creation/overwrite, edits and command execution go through the approval gate.
[[nodiscard]] bool requires_approval(ToolKind kind);

} // namespace ollacode::tools
