#include "ollacode/common/utf8.hpp"

namespace ollacode::common {

namespace {

// Returns the length of the sequence at `pos`, or 0 when it is not valid UTF-8.
std::size_t decode_one(const std::string_view text, const std::size_t pos, char32_t &out) {
  const auto lead = static_cast<unsigned char>(text[pos]);
  if (lead < 0x80) {
    out = lead;
    return 1;
  }

  std::size_t length = 0;
  char32_t value = 0;
  char32_t minimum = 0;
  if ((lead & 0xE0) == 0xC0) {
    length = 2;
    value = lead & 0x1F;
    minimum = 0x80;
  } else if ((lead & 0xF0) == 0xE0) {
    length = 3;
    value = lead & 0x0F;
    minimum = 0x800;
  } else if ((lead & 0xF8) == 0xF0) {
    length = 4;
    value = lead & 0x07;
    minimum = 0x10000;
  } else {
    return 0;
  }

  if (pos + length > text.size()) {
    return 0;
  }
  for (std::size_t i = 1; i < length; ++i) {
    const auto byte = static_cast<unsigned char>(text[pos + i]);
    if ((byte & 0xC0) != 0x80) {
      return 0;
    }
    value = (value << 6) | (byte & 0x3F);
  }

  if (value < minimum || value > 0x10FFFF || (value >= 0xD800 && value <= 0xDFFF)) {
    return 0;
  }
  out = value;
  return length;
}

} // namespace

bool is_valid_utf8(const std::string_view text) {
  std::size_t pos = 0;
  char32_t cp = 0;
  while (pos < text.size()) {
    const auto consumed = decode_one(text, pos, cp);
    if (consumed == 0) {
      return false;
    }
    pos += consumed;
  }
  return true;
}

std::u32string decode_utf8(const std::string_view text) {
  std::u32string out;
  out.reserve(text.size());
  std::size_t pos = 0;
  while (pos < text.size()) {
    char32_t cp = 0;
    const auto consumed = decode_one(text, pos, cp);
    if (consumed == 0) {
      out.push_back(kReplacementChar);
      ++pos;
    } else {
      out.push_back(cp);
      pos += consumed;
    }
  }
  return out;
}

std::string encode_utf8(const char32_t code_point) {
  std::string out;
  if (code_point < 0x80) {
    out.push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else if (code_point < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else if (code_point <= 0x10FFFF) {
    out.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else {
    return encode_utf8(kReplacementChar);
  }
  return out;
}

std::string encode_utf8(const std::u32string_view code_points) {
  std::string out;
  out.reserve(code_points.size());
  for (const char32_t cp : code_points) {
    out += encode_utf8(cp);
  }
  return out;
}

std::string utf8_sanitize(const std::string_view text) {
  if (is_valid_utf8(text)) {
    return std::string(text);
  }
  return encode_utf8(decode_utf8(text));
}

std::size_t utf8_length(const std::string_view text) {
  std::size_t count = 0;
  std::size_t pos = 0;
  while (pos < text.size()) {
    char32_t cp = 0;
    const auto consumed = decode_one(text, pos, cp);
    pos += consumed == 0 ? 1 : consumed;
    ++count;
  }
  return count;
}

std::string utf8_prefix(const std::string_view text, const std::size_t count) {
  std::size_t pos = 0;
  std::size_t taken = 0;
  while (pos < text.size() && taken < count) {
    char32_t cp = 0;
    const auto consumed = decode_one(text, pos, cp);
    pos += consumed == 0 ? 1 : consumed;
    ++taken;
  }
  return std::string(text.substr(0, pos));
}

std::string utf8_suffix(const std::string_view text, const std::size_t count) {
  const std::size_t total = utf8_length(text);
  if (count >= total) {
    return std::string(text);
  }
  std::size_t skip = total - count;
  std::size_t pos = 0;
  while (pos < text.size() && skip > 0) {
    char32_t cp = 0;
    const auto consumed = decode_one(text, pos, cp);
    pos += consumed == 0 ? 1 : consumed;
    --skip;
  }
  return std::string(text.substr(pos));
}

} // namespace ollacode::common
