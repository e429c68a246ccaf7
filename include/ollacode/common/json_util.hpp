#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ollacode::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Decode the body of a JSON string literal (without the quotes).
/// Handles all standard escapes including \uXXXX and surrogate pairs.
[[nodiscard]] std::string json_unescape(const std::string &raw);

[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Top-level members of a JSON object. String members are decoded; every other
/// member keeps its JSON text ("12", "true", "null", "{...}", "[...]").
using JsonFlatMap = std::unordered_map<std::string, std::string>;

/// Strict parse of a complete JSON object. Returns nullopt on any syntax error,
/// on trailing content, or when the document is not an object.
[[nodiscard]] std::optional<JsonFlatMap> json_parse_object(const std::string &json);

/// True when `json` is exactly one well-formed JSON value.
[[nodiscard]] bool json_is_valid(const std::string &json);

/// Split a JSON array of objects into individual object strings.
[[nodiscard]] std::vector<std::string> json_split_top_level_objects(const std::string &array_json);

/// Convenience lookup on a parsed object: value of `key` or `fallback`.
[[nodiscard]] std::string json_member(const JsonFlatMap &object, const std::string &key,
                                      const std::string &fallback = "");

} // namespace ollacode::common
