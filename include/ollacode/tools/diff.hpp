#pragma once

#include "ollacode/common/result.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace ollacode::tools {

/// Line-based unified diff (`--- a/<name>`, `+++ b/<name>`, `@@` hunks with
/// `context` lines around each change). A final line without a newline is
/// followed by `\ No newline at end of file`. Empty when the texts are equal.
[[nodiscard]] std::string unified_diff(const std::string &old_text, const std::string &new_text,
                                       const std::string &filename, std::size_t context = 3);

/// Diff for approval prompts: "(no changes)" when equal, otherwise the diff
/// cut to 1000 characters and wrapped in a ```diff fence.
[[nodiscard]] std::string diff_preview(const std::string &old_text, const std::string &new_text,
                                       const std::string &filename);

/// Apply a diff produced by unified_diff. Fails when a context or removed line
/// does not match `original`.
[[nodiscard]] common::Result<std::string> apply_unified_diff(const std::string &original,
                                                             const std::string &diff);

/// 2*M/T similarity over code points, where M counts characters in matching blocks.
[[nodiscard]] double similarity_ratio(std::u32string_view a, std::u32string_view b);

/// Up to `limit` candidates scoring at least `cutoff` against `word`, best first.
[[nodiscard]] std::vector<std::string> close_matches(const std::string &word,
                                                     const std::vector<std::string> &candidates,
                                                     std::size_t limit = 3, double cutoff = 0.6);

} // namespace ollacode::tools
