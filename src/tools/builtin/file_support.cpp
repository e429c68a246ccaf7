#include "file_support.hpp"

#include "ollacode/common/fs.hpp"
#include "ollacode/common/utf8.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace ollacode::tools::builtin {

std::optional<std::string> read_text_file(const std::filesystem::path &path) {
  auto bytes = common::read_file_bytes(path);
  if (!bytes.ok() || !common::is_valid_utf8(bytes.value())) {
    return std::nullopt;
  }
  return std::move(bytes.value());
}

std::int64_t int_param(const ToolParams &params, const std::string &key,
                       const std::int64_t fallback) {
  const auto it = params.find(key);
  if (it == params.end()) {
    return fallback;
  }
  const std::string text = common::trim(it->second);
  std::int64_t value = 0;
  const auto *first = text.data();
  const auto *last = first + text.size();
  if (auto [ptr, ec] = std::from_chars(first, last, value); ec == std::errc() && ptr == last) {
    return value;
  }
  char *end = nullptr;
  const double real = std::strtod(text.c_str(), &end);
  // 2^63 is exact as a double; anything at or beyond it does not fit.
  constexpr double kLimit = 9223372036854775808.0;
  if (!text.empty() && end == text.c_str() + text.size() && std::isfinite(real) &&
      real > -kLimit && real < kLimit) {
    return static_cast<std::int64_t>(real);
  }
  throw std::invalid_argument("invalid integer for '" + key + "': " + it->second);
}

std::size_t count_lines(const std::string &text) {
  return static_cast<std::size_t>(std::count(text.begin(), text.end(), '\n')) + 1;
}

std::string file_name(const std::filesystem::path &path) {
  const std::string name = path.filename().string();
  return name.empty() ? path.string() : name;
}

} // namespace ollacode::tools::builtin
