#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace ollacode::common {

/// Code point used in place of bytes that do not form valid UTF-8.
inline constexpr char32_t kReplacementChar = 0xFFFD;

[[nodiscard]] bool is_valid_utf8(std::string_view text);

/// Decode to code points. Invalid sequences decode as U+FFFD, one per offending byte.
[[nodiscard]] std::u32string decode_utf8(std::string_view text);

[[nodiscard]] std::string encode_utf8(char32_t code_point);
[[nodiscard]] std::string encode_utf8(std::u32string_view code_points);

/// Lossy conversion: invalid sequences are replaced by U+FFFD.
[[nodiscard]] std::string utf8_sanitize(std::string_view text);

/// Number of code points, counting each invalid byte as one.
[[nodiscard]] std::size_t utf8_length(std::string_view text);

/// First `count` code points of `text`.
[[nodiscard]] std::string utf8_prefix(std::string_view text, std::size_t count);

/// Last `count` code points of `text`.
[[nodiscard]] std::string utf8_suffix(std::string_view text, std::size_t count);

} // namespace ollacode::common
