#include "ollacode/tools/tool_kind.hpp"

namespace ollacode::tools {

std::string_view tool_kind_name(const ToolKind kind) {
  switch (kind) {
  case ToolKind::ReadFile:
    return "read_file";
  case ToolKind::WriteFile:
    return "write_file";
  case ToolKind::EditFile:
    return "edit_file";
  case ToolKind::ListDirectory:
    return "list_directory";
  case ToolKind::SearchFiles:
    return "search_files";
  case ToolKind::GrepSearch:
    return "grep_search";
  case ToolKind::RunCommand:
    return "run_command";
  }
  return "";
}

std::optional<ToolKind> tool_kind_from_name(const std::string_view name) {
  for (const ToolKind kind : ALL_TOOL_KINDS) {
    if (tool_kind_name(kind) == name) {
      return kind;
    }
  }
  return std::nullopt;
}

bool requires_approval(const ToolKind kind) {
  switch (kind) {
  case ToolKind::WriteFile:
  case ToolKind::EditFile:
  case ToolKind::RunCommand:
    return true;
  case ToolKind::ReadFile:
  case ToolKind::ListDirectory:
  case ToolKind::SearchFiles:
  case ToolKind::GrepSearch:
    return false;
  }
  return true;
}

} // namespace ollacode::tools
