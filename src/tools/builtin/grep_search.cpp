#include "ollacode/tools/builtin.hpp"

#include "file_support.hpp"

#include "ollacode/common/fs.hpp"
#include "ollacode/common/utf8.hpp"

#include <algorithm>
#include <unordered_set>
#include <vector>

namespace ollacode::tools::builtin {

namespace {

constexpr std::size_t MAX_FILES = 500;
constexpr std::size_t MAX_MATCHES = 20;
constexpr std::size_t MAX_LINE_CHARS = 120;

const std::unordered_set<std::string> &skipped_directories() {
  static const std::unordered_set<std::string> names = {"node_modules", "__pycache__", ".git",
                                                        "venv", ".venv"};
  return names;
}

/// Files of `dir` first, then each subdirectory, both in name order. Hidden
/// entries and dependency/VCS directories are skipped; symlinked directories
/// are not entered.
void walk(const std::filesystem::path &dir, const Workspace &workspace,
          std::vector<std::filesystem::path> &files) {
  std::vector<std::filesystem::path> local_files;
  std::vector<std::filesystem::path> subdirs;
  std::error_code ec;
  for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    const std::string name = it->path().filename().string();
    if (name.empty() || name.front() == '.') {
      continue;
    }
    std::error_code entry_ec;
    if (it->is_directory(entry_ec)) {
      if (!it->is_symlink(entry_ec) && skipped_directories().count(name) == 0) {
        subdirs.push_back(it->path());
      }
      continue;
    }
    if (workspace.contains(it->path())) {
      local_files.push_back(it->path());
    }
  }
  std::sort(local_files.begin(), local_files.end());
  std::sort(subdirs.begin(), subdirs.end());

  files.insert(files.end(), local_files.begin(), local_files.end());
  for (const auto &subdir : subdirs) {
    if (files.size() >= MAX_FILES) {
      return;
    }
    walk(subdir, workspace, files);
  }
}

} // namespace

ToolResult grep_search(const ToolContext &ctx, const ToolParams &params) {
  const std::string query = param_or(params, "query");
  const auto resolved = ctx.workspace.resolve(param_or(params, "path", "."));
  if (!resolved.ok()) {
    return ToolResult::failure(resolved.error());
  }
  const auto &base = resolved.value();

  if (query.empty()) {
    return ToolResult::failure("'query' parameter is required.");
  }
  std::error_code ec;
  if (!std::filesystem::exists(base, ec)) {
    return ToolResult::failure("Path not found: " + base.string());
  }

  std::vector<std::filesystem::path> files;
  if (std::filesystem::is_regular_file(base, ec)) {
    files.push_back(base);
  } else {
    walk(base, ctx.workspace, files);
  }
  if (files.size() > MAX_FILES) {
    files.resize(MAX_FILES);
  }

  const std::string needle = common::to_lower(query);
  std::vector<std::string> results;
  for (const auto &file : files) {
    const auto content = read_text_file(file);
    if (!content.has_value()) {
      continue;
    }
    const auto lines = common::split(*content, '\n');
    for (std::size_t i = 0; i < lines.size() && results.size() < MAX_MATCHES; ++i) {
      if (common::to_lower(lines[i]).find(needle) == std::string::npos) {
        continue;
      }
      results.push_back("  " + ctx.workspace.relative(file) + ":" + std::to_string(i + 1) + ": " +
                        common::utf8_prefix(common::trim(lines[i]), MAX_LINE_CHARS));
    }
    if (results.size() >= MAX_MATCHES) {
      break;
    }
  }

  if (results.empty()) {
    return ToolResult::success("🔍 '" + query + "' not found.");
  }
  std::string out = "🔍 '" + query + "' results (" + std::to_string(results.size()) + " matches)";
  for (const auto &line : results) {
    out += "\n" + line;
  }
  return ToolResult::success(std::move(out));
}

} // namespace ollacode::tools::builtin
