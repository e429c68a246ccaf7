#include "ollacode/tools/builtin.hpp"

#include "file_support.hpp"

#include "ollacode/common/fs.hpp"

#include <algorithm>
#include <cstdio>
#include <sstream>

namespace ollacode::tools::builtin {

namespace {

constexpr std::int64_t DEFAULT_WINDOW_END = 200;

} // namespace

ToolResult read_file(const ToolContext &ctx, const ToolParams &params) {
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

  const auto content = read_text_file(path);
  if (!content.has_value()) {
    return ToolResult::failure("Cannot read binary file: " + path.string());
  }

  const auto lines = common::split(*content, '\n');
  const auto line_count = static_cast<std::int64_t>(lines.size());
  const std::int64_t start = std::max<std::int64_t>(1, int_param(params, "start_line", 1)) - 1;
  const std::int64_t end = std::clamp(int_param(params, "end_line", DEFAULT_WINDOW_END), start,
                                      std::max(start, line_count));

  std::ostringstream numbered;
  for (std::int64_t i = start; i < end; ++i) {
    if (i > start) {
      numbered << "\n";
    }
    char number[32];
    std::snprintf(number, sizeof(number), "%4lld", static_cast<long long>(i + 1));
    numbered << number << " | " << lines[static_cast<std::size_t>(i)];
  }

  std::ostringstream out;
  out << "📄 **" << file_name(path) << "** (" << line_count << " lines";
  if (line_count > end) {
    out << ", showing L" << start + 1 << "-" << end << ")\n```\n"
        << numbered.str() << "\n```\n... (" << line_count - end << " more lines)";
  } else {
    out << ")\n```\n" << numbered.str() << "\n```";
  }
  return ToolResult::success(out.str());
}

} // namespace ollacode::tools::builtin
