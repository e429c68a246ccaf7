#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace ollacode::agent {

inline constexpr std::string_view PROJECT_MEMORY_FILE = "OLLACODE.md";

/// Base system prompt: role, the seven tools and the tool-block format.
[[nodiscard]] std::string_view base_system_prompt();

/// Project rules from OLLACODE.md in the workspace, formatted for appending to
/// the system prompt. Empty when the file is missing, unreadable or blank.
[[nodiscard]] std::string load_project_memory(const std::filesystem::path &workspace);

} // namespace ollacode::agent
