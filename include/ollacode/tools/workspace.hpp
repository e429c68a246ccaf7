#pragma once

#include "ollacode/common/result.hpp"

#include <filesystem>
#include <string>

namespace ollacode::tools {

/// The directory boundary for every tool operation. The root is made absolute
/// and canonical once, at construction.
class Workspace {
public:
  explicit Workspace(const std::filesystem::path &root);

  [[nodiscard]] const std::filesystem::path &root() const { return root_; }

  /// Resolve `requested` (relative to the root, or absolute) and check that the
  /// result stays at or under the root. Paths outside are an error, never clamped.
  [[nodiscard]] common::Result<std::filesystem::path> resolve(const std::string &requested) const;

  [[nodiscard]] bool contains(const std::filesystem::path &absolute) const;

  /// Path of `absolute` relative to the root, with '/' separators.
  [[nodiscard]] std::string relative(const std::filesystem::path &absolute) const;

private:
  std::filesystem::path root_;
};

} // namespace ollacode::tools
