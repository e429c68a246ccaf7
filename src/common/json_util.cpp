#include "ollacode/common/json_util.hpp"

#include "ollacode/common/utf8.hpp"

#include <cctype>
#include <cstdio>

namespace ollacode::common {

namespace {

constexpr std::size_t kMaxDepth = 256;

int hex_value(const char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

std::optional<char32_t> read_hex4(const std::string &text, const std::size_t pos) {
  if (pos + 4 > text.size()) {
    return std::nullopt;
  }
  char32_t value = 0;
  for (std::size_t i = 0; i < 4; ++i) {
    const int digit = hex_value(text[pos + i]);
    if (digit < 0) {
      return std::nullopt;
    }
    value = (value << 4) | static_cast<char32_t>(digit);
  }
  return value;
}

bool is_json_ws(const char ch) { return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r'; }

class JsonCursor {
public:
  explicit JsonCursor(const std::string &text) : text_(text) {}

  [[nodiscard]] bool at_end() {
    skip_ws();
    return pos_ >= text_.size();
  }

  bool parse_value(std::string *out, const std::size_t depth) {
    if (depth > kMaxDepth) {
      return false;
    }
    skip_ws();
    if (pos_ >= text_.size()) {
      return false;
    }
    const std::size_t start = pos_;
    bool ok = false;
    switch (text_[pos_]) {
    case '"':
      return parse_string(out);
    case '{':
      ok = parse_object(nullptr, depth + 1);
      break;
    case '[':
      ok = parse_array(depth + 1);
      break;
    case 't':
      ok = consume_literal("true");
      break;
    case 'f':
      ok = consume_literal("false");
      break;
    case 'n':
      ok = consume_literal("null");
      break;
    default:
      ok = parse_number();
      break;
    }
    if (ok && out != nullptr) {
      *out = text_.substr(start, pos_ - start);
    }
    return ok;
  }

  bool parse_object(JsonFlatMap *members, const std::size_t depth) {
    if (depth > kMaxDepth || !consume('{')) {
      return false;
    }
    skip_ws();
    if (consume('}')) {
      return true;
    }
    while (true) {
      skip_ws();
      std::string key;
      if (pos_ >= text_.size() || text_[pos_] != '"' || !parse_string(&key)) {
        return false;
      }
      skip_ws();
      if (!consume(':')) {
        return false;
      }
      std::string value;
      if (!parse_value(members != nullptr ? &value : nullptr, depth)) {
        return false;
      }
      if (members != nullptr) {
        (*members)[key] = std::move(value);
      }
      skip_ws();
      if (consume(',')) {
        continue;
      }
      return consume('}');
    }
  }

private:
  void skip_ws() {
    while (pos_ < text_.size() && is_json_ws(text_[pos_])) {
      ++pos_;
    }
  }

  bool consume(const char ch) {
    if (pos_ < text_.size() && text_[pos_] == ch) {
      ++pos_;
      return true;
    }
    return false;
  }

  bool consume_literal(const std::string &literal) {
    if (text_.compare(pos_, literal.size(), literal) != 0) {
      return false;
    }
    pos_ += literal.size();
    return true;
  }

  bool consume_digits() {
    const std::size_t start = pos_;
    while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_])) != 0) {
      ++pos_;
    }
    return pos_ > start;
  }

  bool parse_number() {
    consume('-');
    if (consume('0')) {
      // no leading zeros
    } else if (!consume_digits()) {
      return false;
    }
    if (consume('.') && !consume_digits()) {
      return false;
    }
    if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
      ++pos_;
      if (!consume('+')) {
        consume('-');
      }
      if (!consume_digits()) {
        return false;
      }
    }
    return true;
  }

  bool parse_array(const std::size_t depth) {
    if (!consume('[')) {
      return false;
    }
    skip_ws();
    if (consume(']')) {
      return true;
    }
    while (true) {
      if (!parse_value(nullptr, depth)) {
        return false;
      }
      skip_ws();
      if (consume(',')) {
        continue;
      }
      return consume(']');
    }
  }

  bool parse_string(std::string *out) {
    if (!consume('"')) {
      return false;
    }
    const std::size_t start = pos_;
    while (pos_ < text_.size()) {
      const auto ch = static_cast<unsigned char>(text_[pos_]);
      if (ch == '"') {
        if (out != nullptr) {
          *out = json_unescape(text_.substr(start, pos_ - start));
        }
        ++pos_;
        return true;
      }
      if (ch < 0x20) {
        return false;
      }
      if (ch == '\\') {
        if (pos_ + 1 >= text_.size()) {
          return false;
        }
        const char esc = text_[pos_ + 1];
        if (esc == 'u') {
          if (!read_hex4(text_, pos_ + 2).has_value()) {
            return false;
          }
          pos_ += 6;
          continue;
        }
        if (esc != '"' && esc != '\\' && esc != '/' && esc != 'b' && esc != 'f' && esc != 'n' &&
            esc != 'r' && esc != 't') {
          return false;
        }
        pos_ += 2;
        continue;
      }
      ++pos_;
    }
    return false;
  }

  const std::string &text_;
  std::size_t pos_ = 0;
};

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    case '\b':
      escaped += "\\b";
      break;
    case '\f':
      escaped += "\\f";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(ch));
        escaped += buffer;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char esc = raw[++i];
    switch (esc) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u': {
      const auto high = read_hex4(raw, i + 1);
      if (!high.has_value()) {
        out.push_back('u');
        break;
      }
      i += 4;
      char32_t cp = *high;
      if (cp >= 0xD800 && cp <= 0xDBFF) {
        const bool has_low = i + 2 < raw.size() && raw[i + 1] == '\\' && raw[i + 2] == 'u';
        const auto low = has_low ? read_hex4(raw, i + 3) : std::nullopt;
        if (low.has_value() && *low >= 0xDC00 && *low <= 0xDFFF) {
          cp = 0x10000 + ((cp - 0xD800) << 10) + (*low - 0xDC00);
          i += 6;
        } else {
          cp = kReplacementChar;
        }
      } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
        cp = kReplacementChar;
      }
      out += encode_utf8(cp);
      break;
    }
    default:
      out.push_back(esc);
      break;
    }
  }
  return out;
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && is_json_ws(text[pos])) {
    ++pos;
  }
  return pos;
}

std::optional<JsonFlatMap> json_parse_object(const std::string &json) {
  JsonCursor cursor(json);
  JsonFlatMap members;
  if (cursor.at_end()) {
    return std::nullopt;
  }
  if (!cursor.parse_object(&members, 1) || !cursor.at_end()) {
    return std::nullopt;
  }
  return members;
}

bool json_is_valid(const std::string &json) {
  JsonCursor cursor(json);
  return cursor.parse_value(nullptr, 0) && cursor.at_end();
}

std::vector<std::string> json_split_top_level_objects(const std::string &array_json) {
  std::vector<std::string> out;
  const std::size_t first = json_skip_ws(array_json, 0);
  if (first >= array_json.size() || array_json[first] != '[') {
    return out;
  }

  bool in_string = false;
  bool escaped = false;
  std::size_t depth = 0;
  std::size_t current_start = std::string::npos;
  for (std::size_t i = first + 1; i < array_json.size(); ++i) {
    const char ch = array_json[i];
    if (in_string) {
      if (escaped) {
        escaped = false;
      } else if (ch == '\\') {
        escaped = true;
      } else if (ch == '"') {
        in_string = false;
      }
      continue;
    }
    if (ch == '"') {
      in_string = true;
    } else if (ch == '{') {
      if (depth == 0) {
        current_start = i;
      }
      ++depth;
    } else if (ch == '}' && depth > 0) {
      --depth;
      if (depth == 0 && current_start != std::string::npos) {
        out.push_back(array_json.substr(current_start, i - current_start + 1));
        current_start = std::string::npos;
      }
    } else if (ch == ']' && depth == 0) {
      break;
    }
  }
  return out;
}

std::string json_member(const JsonFlatMap &object, const std::string &key,
                        const std::string &fallback) {
  const auto it = object.find(key);
  return it == object.end() ? fallback : it->second;
}

} // namespace ollacode::common
