#pragma once

#include "ollacode/common/result.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace ollacode::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] std::string rtrim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] bool ends_with(const std::string &value, const std::string &suffix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::vector<std::string> split(const std::string &value, char delimiter);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

/// Component-wise prefix test. Both paths are expected to be normalized.
[[nodiscard]] bool is_subpath(const std::filesystem::path &candidate,
                             const std::filesystem::path &parent);

/// Read a whole file as raw bytes.
[[nodiscard]] Result<std::string> read_file_bytes(const std::filesystem::path &path);

/// Replace the contents of a file, creating it if needed.
[[nodiscard]] Status write_file_bytes(const std::filesystem::path &path, const std::string &data);

} // namespace ollacode::common
