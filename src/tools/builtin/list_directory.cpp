#include "ollacode/tools/builtin.hpp"

#include "file_support.hpp"

#include <algorithm>
#include <cstdio>
#include <optional>
#include <vector>

namespace ollacode::tools::builtin {

namespace {

constexpr std::size_t MAX_ENTRIES = 100;

struct Entry {
  std::string name;
  bool is_dir = false;
  std::optional<std::uintmax_t> size;
};

std::string human_size(const std::uintmax_t bytes) {
  char buffer[64];
  if (bytes < 1024) {
    std::snprintf(buffer, sizeof(buffer), "%juB", bytes);
  } else if (bytes < 1024 * 1024) {
    std::snprintf(buffer, sizeof(buffer), "%.1fKB", static_cast<double>(bytes) / 1024.0);
  } else {
    std::snprintf(buffer, sizeof(buffer), "%.1fMB",
                  static_cast<double>(bytes) / (1024.0 * 1024.0));
  }
  return buffer;
}

} // namespace

ToolResult list_directory(const ToolContext &ctx, const ToolParams &params) {
  const auto resolved = ctx.workspace.resolve(param_or(params, "path", "."));
  if (!resolved.ok()) {
    return ToolResult::failure(resolved.error());
  }
  const auto &path = resolved.value();

  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return ToolResult::failure("Directory not found: " + path.string());
  }
  if (!std::filesystem::is_directory(path, ec)) {
    return ToolResult::failure("Not a directory: " + path.string());
  }

  std::vector<Entry> entries;
  for (std::filesystem::directory_iterator it(path, ec), end; !ec && it != end; it.increment(ec)) {
    Entry entry{.name = it->path().filename().string()};
    if (entry.name.empty() || entry.name.front() == '.') {
      continue;
    }
    std::error_code entry_ec;
    entry.is_dir = it->is_directory(entry_ec);
    if (!entry.is_dir && it->is_regular_file(entry_ec)) {
      const auto bytes = it->file_size(entry_ec);
      if (!entry_ec) {
        entry.size = bytes;
      }
    }
    entries.push_back(std::move(entry));
  }
  if (ec) {
    return ToolResult::failure("Cannot list directory: " + path.string() + " (" + ec.message() +
                               ")");
  }

  std::sort(entries.begin(), entries.end(), [](const Entry &a, const Entry &b) {
    if (a.is_dir != b.is_dir) {
      return a.is_dir;
    }
    return a.name < b.name;
  });

  std::string out = "📂 **" + file_name(path) + "** (" + std::to_string(entries.size()) + " items)";
  if (path == path.root_path()) {
    out = "📂 **/** (" + std::to_string(entries.size()) + " items)";
  }
  out += "\n";
  const std::size_t shown = std::min(entries.size(), MAX_ENTRIES);
  for (std::size_t i = 0; i < shown; ++i) {
    const auto &entry = entries[i];
    if (i > 0) {
      out += "\n";
    }
    out += "  ";
    out += entry.is_dir ? "📁 " : "📄 ";
    out += entry.name;
    if (entry.size.has_value()) {
      out += " (" + human_size(*entry.size) + ")";
    }
  }
  return ToolResult::success(std::move(out));
}

} // namespace ollacode::tools::builtin
