#pragma once

#include "ollacode/tools/tool.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace ollacode::tools::builtin {

/// File contents when they decode as UTF-8; nullopt for binary or unreadable files.
[[nodiscard]] std::optional<std::string> read_text_file(const std::filesystem::path &path);

/// Integer parameter. Accepts integral JSON numbers and numeric strings; a
/// fractional value is truncated. Throws std::invalid_argument otherwise.
[[nodiscard]] std::int64_t int_param(const ToolParams &params, const std::string &key,
                                     std::int64_t fallback);

/// Number of '\n'-separated lines, counting a trailing empty line.
[[nodiscard]] std::size_t count_lines(const std::string &text);

[[nodiscard]] std::string file_name(const std::filesystem::path &path);

} // namespace ollacode::tools::builtin
