#include "ollacode/tools/builtin.hpp"

#include "file_support.hpp"

#include "ollacode/common/fs.hpp"
#include "ollacode/common/utf8.hpp"
#include "ollacode/tools/diff.hpp"
#include "ollacode/tools/tool_kind.hpp"

namespace ollacode::tools::builtin {

ToolResult write_file(const ToolContext &ctx, const ToolParams &params) {
  const auto resolved = ctx.workspace.resolve(param_or(params, "path"));
  if (!resolved.ok()) {
    return ToolResult::failure(resolved.error());
  }
  const auto &path = resolved.value();
  const std::string content = param_or(params, "content");

  std::error_code ec;
  const bool existed = std::filesystem::exists(path, ec);
  if (existed && std::filesystem::is_directory(path, ec)) {
    return ToolResult::failure("Not a file: " + path.string());
  }

  const std::string action = existed ? "modify" : "create";
  const std::string summary =
      file_name(path) + " (" + std::to_string(count_lines(content)) + " lines)";
  std::string description = "📝 File " + action + ": " + summary;
  if (existed) {
    const auto old_bytes = common::read_file_bytes(path);
    if (!old_bytes.ok()) {
      return ToolResult::failure("Cannot read file: " + path.string());
    }
    description +=
        "\n" + diff_preview(common::utf8_sanitize(old_bytes.value()), content, file_name(path));
  }

  if (!consult(ctx.gate, std::string(tool_kind_name(ToolKind::WriteFile)), description)) {
    return ToolResult::skip("User rejected file write.");
  }

  if (auto dir = common::ensure_dir(path.parent_path()); !dir.ok()) {
    return ToolResult::failure(dir.error());
  }
  if (auto written = common::write_file_bytes(path, content); !written.ok()) {
    return ToolResult::failure(written.error());
  }
  return ToolResult::success(std::string(SUCCESS_MARKER) + " File " + action + " done: " + summary);
}

} // namespace ollacode::tools::builtin
