#include "ollacode/common/toml.hpp"

#include "ollacode/common/fs.hpp"

#include <charconv>
#include <sstream>

namespace ollacode::common {

namespace {

// Drops a trailing `# comment`, ignoring '#' inside quoted strings.
std::string strip_comment(const std::string &line) {
  char quote = '\0';
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if (quote != '\0') {
      if (quote == '"' && ch == '\\') {
        ++i;
      } else if (ch == quote) {
        quote = '\0';
      }
      continue;
    }
    if (ch == '"' || ch == '\'') {
      quote = ch;
    } else if (ch == '#') {
      return line.substr(0, i);
    }
  }
  return line;
}

std::vector<std::string> split_array_elements(const std::string &body) {
  std::vector<std::string> elements;
  std::string current;
  char quote = '\0';
  for (std::size_t i = 0; i < body.size(); ++i) {
    const char ch = body[i];
    if (quote != '\0') {
      current.push_back(ch);
      if (quote == '"' && ch == '\\' && i + 1 < body.size()) {
        current.push_back(body[++i]);
      } else if (ch == quote) {
        quote = '\0';
      }
      continue;
    }
    if (ch == '"' || ch == '\'') {
      quote = ch;
      current.push_back(ch);
    } else if (ch == ',') {
      elements.push_back(trim(current));
      current.clear();
    } else {
      current.push_back(ch);
    }
  }
  if (!trim(current).empty()) {
    elements.push_back(trim(current));
  }
  return elements;
}

} // namespace

std::string toml_unquote(const std::string &raw) {
  const std::string value = trim(raw);
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  if (value.size() < 2 || value.front() != '"' || value.back() != '"') {
    return value;
  }

  std::string out;
  for (std::size_t i = 1; i + 1 < value.size(); ++i) {
    const char ch = value[i];
    if (ch != '\\' || i + 2 >= value.size()) {
      out.push_back(ch);
      continue;
    }
    const char esc = value[++i];
    switch (esc) {
    case 'n':
      out.push_back('\n');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'r':
      out.push_back('\r');
      break;
    default:
      out.push_back(esc);
      break;
    }
  }
  return out;
}

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  return it == values.end() ? fallback : toml_unquote(it->second);
}

bool TomlDocument::get_bool(const std::string &key, const bool fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string normalized = to_lower(trim(it->second));
  if (normalized == "true") {
    return true;
  }
  if (normalized == "false") {
    return false;
  }
  return fallback;
}

std::optional<std::int64_t> TomlDocument::get_i64(const std::string &key) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return std::nullopt;
  }
  const std::string normalized = trim(it->second);
  std::int64_t parsed = 0;
  const auto *first = normalized.data();
  const auto *last = first + normalized.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return parsed;
}

std::uint64_t TomlDocument::get_u64(const std::string &key, const std::uint64_t fallback) const {
  const auto value = get_i64(key);
  if (!value.has_value() || *value < 0) {
    return fallback;
  }
  return static_cast<std::uint64_t>(*value);
}

double TomlDocument::get_double(const std::string &key, const double fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string normalized = trim(it->second);
  std::size_t consumed = 0;
  try {
    const double parsed = std::stod(normalized, &consumed);
    return consumed == normalized.size() ? parsed : fallback;
  } catch (const std::exception &) {
    return fallback;
  }
}

std::vector<std::string> TomlDocument::get_array(const std::string &key) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return {};
  }
  const std::string raw = trim(it->second);
  if (raw.size() < 2 || raw.front() != '[' || raw.back() != ']') {
    return {};
  }
  std::vector<std::string> out;
  for (const auto &element : split_array_elements(raw.substr(1, raw.size() - 2))) {
    if (!element.empty()) {
      out.push_back(toml_unquote(element));
    }
  }
  return out;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string section;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string clean = trim(strip_comment(line));
    if (clean.empty()) {
      continue;
    }

    if (clean.front() == '[' && clean.back() == ']') {
      section = trim(clean.substr(1, clean.size() - 2));
      if (section.empty()) {
        return Result<TomlDocument>::failure("Invalid empty section at line " +
                                             std::to_string(line_number));
      }
      continue;
    }

    const std::size_t equals = clean.find('=');
    if (equals == std::string::npos) {
      return Result<TomlDocument>::failure("Invalid key/value at line " +
                                           std::to_string(line_number));
    }
    const std::string key = toml_unquote(clean.substr(0, equals));
    if (key.empty()) {
      return Result<TomlDocument>::failure("Missing key at line " + std::to_string(line_number));
    }
    document.values[section.empty() ? key : section + "." + key] =
        trim(clean.substr(equals + 1));
  }

  return Result<TomlDocument>::success(std::move(document));
}

} // namespace ollacode::common
