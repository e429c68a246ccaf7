#include "ollacode/tools/builtin.hpp"

#include "ollacode/common/fs.hpp"

#include <algorithm>
#include <fnmatch.h>
#include <set>
#include <vector>

namespace ollacode::tools::builtin {

namespace {

constexpr std::size_t MAX_LISTED = 50;

bool has_wildcard(const std::string &component) {
  return component.find_first_of("*?[") != std::string::npos;
}

bool is_hidden(const std::filesystem::path &path) {
  const auto name = path.filename().string();
  return !name.empty() && name.front() == '.';
}

/// Non-hidden directories below `dir`, depth first. Symlinked directories are
/// listed but not entered.
void collect_subdirs(const std::filesystem::path &dir, std::vector<std::filesystem::path> &out) {
  std::error_code ec;
  for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code entry_ec;
    if (is_hidden(it->path()) || !it->is_directory(entry_ec)) {
      continue;
    }
    out.push_back(it->path());
    if (!it->is_symlink(entry_ec)) {
      collect_subdirs(it->path(), out);
    }
  }
}

void collect_descendants(const std::filesystem::path &dir, std::set<std::string> &out) {
  std::error_code ec;
  for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    if (is_hidden(it->path())) {
      continue;
    }
    out.insert(it->path().string());
    std::error_code entry_ec;
    if (it->is_directory(entry_ec) && !it->is_symlink(entry_ec)) {
      collect_descendants(it->path(), out);
    }
  }
}

/// Match `parts[index..]` below `dir`, shell-glob style: `*` and `?` never match
/// a leading dot, `**` spans zero or more directories.
void glob_from(const std::filesystem::path &dir, const std::vector<std::string> &parts,
               const std::size_t index, std::set<std::string> &out) {
  if (index == parts.size()) {
    return;
  }
  const std::string &part = parts[index];
  const bool last = index + 1 == parts.size();

  if (part == "**") {
    if (last) {
      collect_descendants(dir, out);
      return;
    }
    std::vector<std::filesystem::path> anchors{dir};
    collect_subdirs(dir, anchors);
    for (const auto &anchor : anchors) {
      glob_from(anchor, parts, index + 1, out);
    }
    return;
  }

  std::error_code ec;
  if (!has_wildcard(part)) {
    const auto candidate = dir / part;
    if (!std::filesystem::exists(std::filesystem::symlink_status(candidate, ec))) {
      return;
    }
    if (last) {
      out.insert(candidate.string());
    } else if (std::filesystem::is_directory(candidate, ec)) {
      glob_from(candidate, parts, index + 1, out);
    }
    return;
  }

  for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    const std::string name = it->path().filename().string();
    if (::fnmatch(part.c_str(), name.c_str(), FNM_PERIOD) != 0) {
      continue;
    }
    if (last) {
      out.insert(it->path().string());
      continue;
    }
    std::error_code entry_ec;
    if (it->is_directory(entry_ec)) {
      glob_from(it->path(), parts, index + 1, out);
    }
  }
}

std::vector<std::string> pattern_parts(const std::string &pattern) {
  std::vector<std::string> parts;
  for (auto &part : common::split(pattern, '/')) {
    if (!part.empty() && part != ".") {
      parts.push_back(std::move(part));
    }
  }
  return parts;
}

} // namespace

ToolResult search_files(const ToolContext &ctx, const ToolParams &params) {
  const std::string pattern = param_or(params, "pattern", "*");
  const auto resolved = ctx.workspace.resolve(param_or(params, "path", "."));
  if (!resolved.ok()) {
    return ToolResult::failure(resolved.error());
  }
  const auto &base = resolved.value();

  std::error_code ec;
  if (!std::filesystem::exists(base, ec)) {
    return ToolResult::failure("Path not found: " + base.string());
  }

  // An absolute pattern replaces the base instead of being searched below it.
  std::set<std::string> found;
  if (!pattern.empty() && pattern.front() == '/') {
    glob_from(std::filesystem::path("/"), pattern_parts(pattern), 0, found);
  } else {
    auto parts = pattern_parts(pattern);
    parts.insert(parts.begin(), "**");
    glob_from(base, parts, 0, found);
  }

  std::vector<std::string> matches;
  for (const auto &match : found) {
    if (ctx.workspace.contains(match)) {
      matches.push_back(match);
    }
  }

  if (matches.empty()) {
    return ToolResult::success("🔍 No files matching '" + pattern + "'.");
  }

  std::string out = "🔍 '" + pattern + "' results (" + std::to_string(matches.size()) + " files)";
  if (matches.size() > MAX_LISTED) {
    out += " — showing first " + std::to_string(MAX_LISTED);
  }
  const std::size_t shown = std::min(matches.size(), MAX_LISTED);
  for (std::size_t i = 0; i < shown; ++i) {
    out += "\n  📄 " +
           ctx.workspace.relative(std::filesystem::path(matches[i]).lexically_normal());
  }
  return ToolResult::success(std::move(out));
}

} // namespace ollacode::tools::builtin
