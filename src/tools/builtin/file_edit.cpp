#include "ollacode/tools/builtin.hpp"

#include "file_support.hpp"

#include "ollacode/common/fs.hpp"
#include "ollacode/tools/diff.hpp"
#include "ollacode/tools/tool_kind.hpp"

namespace ollacode::tools::builtin {

namespace {

std::size_t count_occurrences(const std::string &haystack, const std::string &needle) {
  std::size_t count = 0;
  std::size_t pos = haystack.find(needle);
  while (pos != std::string::npos) {
    ++count;
    pos = haystack.find(needle, pos + needle.size());
  }
  return count;
}

std::string similar_lines_hint(const std::string &content, const std::string &search) {
  const std::string first_line = search.substr(0, search.find('\n'));
  const auto matches = close_matches(first_line, common::split(content, '\n'));
  if (matches.empty()) {
    return "";
  }
  std::string hint = "\nSimilar lines:";
  for (const auto &line : matches) {
    hint += "\n  → " + line;
  }
  return hint;
}

} // namespace

ToolResult edit_file(const ToolContext &ctx, const ToolParams &params) {
  const auto resolved = ctx.workspace.resolve(param_or(params, "path"));
  if (!resolved.ok()) {
    return ToolResult::failure(resolved.error());
  }
  const auto &path = resolved.value();

  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return ToolResult::failure("File not found: " + path.string());
  }
  if (!std::filesystem::is_regular_file(path, ec)) {
    return ToolResult::failure("Not a file: " + path.string());
  }

  const std::string search = param_or(params, "search");
  const std::string replace = param_or(params, "replace");
  if (search.empty()) {
    return ToolResult::failure("'search' parameter is required.");
  }

  const auto content = read_text_file(path);
  if (!content.has_value()) {
    return ToolResult::failure("Cannot edit binary file: " + path.string());
  }

  const std::size_t count = count_occurrences(*content, search);
  if (count == 0) {
    return ToolResult::failure("Search string not found." + similar_lines_hint(*content, search));
  }
  if (count > 1) {
    return ToolResult::failure("Search string found " + std::to_string(count) +
                               " times. Please be more specific.");
  }

  std::string updated = *content;
  updated.replace(updated.find(search), search.size(), replace);

  const std::string name = file_name(path);
  const std::string description =
      "✏️ Edit file: " + name + "\n" + diff_preview(*content, updated, name);
  if (!consult(ctx.gate, std::string(tool_kind_name(ToolKind::EditFile)), description)) {
    return ToolResult::skip("User rejected edit.");
  }

  if (auto written = common::write_file_bytes(path, updated); !written.ok()) {
    return ToolResult::failure(written.error());
  }
  return ToolResult::success(std::string(SUCCESS_MARKER) + " File edited: " + name +
                             " (1 change applied)");
}

} // namespace ollacode::tools::builtin
