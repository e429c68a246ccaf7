#pragma once

#include "ollacode/common/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ollacode::common {

/// Flat view of a TOML file: `[section]` headers are folded into dotted keys and
/// every value keeps its raw text until a typed getter reads it.
struct TomlDocument {
  std::unordered_map<std::string, std::string> values;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
  [[nodiscard]] std::optional<std::int64_t> get_i64(const std::string &key) const;
  [[nodiscard]] std::uint64_t get_u64(const std::string &key, std::uint64_t fallback) const;
  [[nodiscard]] double get_double(const std::string &key, double fallback) const;
  [[nodiscard]] std::vector<std::string> get_array(const std::string &key) const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);

/// Decode a TOML scalar string: basic ("..."), literal ('...') or bare text.
[[nodiscard]] std::string toml_unquote(const std::string &raw);

} // namespace ollacode::common
