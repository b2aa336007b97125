#include "text_encoding.hpp"
#include "pager_exceptions.hpp"
#include <algorithm>
#include <cctype>

namespace logpager {

namespace {

bool isContinuation(unsigned char b) { return (b & 0xC0) == 0x80; }

bool isHighSurrogate(char32_t u) { return u >= 0xD800 && u <= 0xDBFF; }

bool isLowSurrogate(char32_t u) { return u >= 0xDC00 && u <= 0xDFFF; }

char32_t readUnit16(const unsigned char *p, bool bigEndian) {
  return bigEndian ? static_cast<char32_t>((p[0] << 8) | p[1])
                   : static_cast<char32_t>((p[1] << 8) | p[0]);
}

char32_t readUnit32(const unsigned char *p, bool bigEndian) {
  if (bigEndian) {
    return (static_cast<char32_t>(p[0]) << 24) |
           (static_cast<char32_t>(p[1]) << 16) |
           (static_cast<char32_t>(p[2]) << 8) | static_cast<char32_t>(p[3]);
  }
  return (static_cast<char32_t>(p[3]) << 24) |
         (static_cast<char32_t>(p[2]) << 16) |
         (static_cast<char32_t>(p[1]) << 8) | static_cast<char32_t>(p[0]);
}

} // namespace

std::string TextEncoding::name() const {
  switch (kind_) {
  case Kind::Utf8:
    return "utf-8";
  case Kind::Utf16LE:
    return "utf-16le";
  case Kind::Utf16BE:
    return "utf-16be";
  case Kind::Utf32LE:
    return "utf-32le";
  case Kind::Utf32BE:
    return "utf-32be";
  }
  return "utf-8";
}

std::size_t TextEncoding::codeUnitSize() const {
  switch (kind_) {
  case Kind::Utf16LE:
  case Kind::Utf16BE:
    return 2;
  case Kind::Utf32LE:
  case Kind::Utf32BE:
    return 4;
  default:
    return 1;
  }
}

std::string TextEncoding::preamble() const {
  switch (kind_) {
  case Kind::Utf8:
    return std::string("\xEF\xBB\xBF", 3);
  case Kind::Utf16LE:
    return std::string("\xFF\xFE", 2);
  case Kind::Utf16BE:
    return std::string("\xFE\xFF", 2);
  case Kind::Utf32LE:
    return std::string("\xFF\xFE\x00\x00", 4);
  case Kind::Utf32BE:
    return std::string("\x00\x00\xFE\xFF", 4);
  }
  return {};
}

std::size_t TextEncoding::decodeOne(const unsigned char *data, std::size_t len,
                                    bool final, char32_t &out) const {
  if (len == 0) {
    return 0;
  }
  switch (kind_) {
  case Kind::Utf16LE:
  case Kind::Utf16BE:
    return decodeUtf16(data, len, final, out);
  case Kind::Utf32LE:
  case Kind::Utf32BE:
    return decodeUtf32(data, len, final, out);
  default:
    return decodeUtf8(data, len, final, out);
  }
}

std::size_t TextEncoding::decodeUtf8(const unsigned char *data, std::size_t len,
                                     bool final, char32_t &out) const {
  const unsigned char lead = data[0];
  if (lead < 0x80) {
    out = lead;
    return 1;
  }

  std::size_t need;
  char32_t cp;
  if (lead >= 0xC2 && lead <= 0xDF) {
    need = 2;
    cp = lead & 0x1F;
  } else if (lead >= 0xE0 && lead <= 0xEF) {
    need = 3;
    cp = lead & 0x0F;
  } else if (lead >= 0xF0 && lead <= 0xF4) {
    need = 4;
    cp = lead & 0x07;
  } else {
    out = kReplacementChar;
    return 1;
  }

  for (std::size_t i = 1; i < need; ++i) {
    if (i >= len) {
      if (!final) {
        return 0;
      }
      out = kReplacementChar;
      return i;
    }

    const unsigned char b = data[i];
    // Second byte ranges exclude overlongs, surrogates and > U+10FFFF
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;
    if (i == 1) {
      if (lead == 0xE0)
        lo = 0xA0;
      else if (lead == 0xED)
        hi = 0x9F;
      else if (lead == 0xF0)
        lo = 0x90;
      else if (lead == 0xF4)
        hi = 0x8F;
    }
    if (b < lo || b > hi) {
      out = kReplacementChar;
      return i;
    }
    cp = (cp << 6) | (b & 0x3F);
  }

  out = cp;
  return need;
}

std::size_t TextEncoding::decodeUtf16(const unsigned char *data,
                                      std::size_t len, bool final,
                                      char32_t &out) const {
  const bool bigEndian = kind_ == Kind::Utf16BE;
  if (len < 2) {
    if (!final) {
      return 0;
    }
    out = kReplacementChar;
    return len;
  }

  char32_t unit = readUnit16(data, bigEndian);
  if (isLowSurrogate(unit)) {
    out = kReplacementChar;
    return 2;
  }
  if (!isHighSurrogate(unit)) {
    out = unit;
    return 2;
  }

  if (len < 4) {
    if (!final) {
      return 0;
    }
    out = kReplacementChar;
    return 2;
  }

  char32_t low = readUnit16(data + 2, bigEndian);
  if (!isLowSurrogate(low)) {
    out = kReplacementChar;
    return 2;
  }
  out = 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00);
  return 4;
}

std::size_t TextEncoding::decodeUtf32(const unsigned char *data,
                                      std::size_t len, bool final,
                                      char32_t &out) const {
  if (len < 4) {
    if (!final) {
      return 0;
    }
    out = kReplacementChar;
    return len;
  }

  char32_t cp = readUnit32(data, kind_ == Kind::Utf32BE);
  if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
    cp = kReplacementChar;
  }
  out = cp;
  return 4;
}

void TextEncoding::decode(const unsigned char *data, std::size_t len,
                          std::u32string &out,
                          std::vector<std::uint32_t> *offsets) const {
  out.reserve(out.size() + maxCharCount(len));
  std::size_t pos = 0;
  while (pos < len) {
    char32_t cp = kReplacementChar;
    std::size_t consumed = decodeOne(data + pos, len - pos, true, cp);
    if (offsets) {
      offsets->push_back(static_cast<std::uint32_t>(pos));
    }
    out.push_back(cp);
    pos += consumed;
  }
  if (offsets) {
    offsets->push_back(static_cast<std::uint32_t>(pos));
  }
}

std::size_t TextEncoding::byteCount(const char32_t *chars,
                                    std::size_t count) const {
  std::size_t total = 0;
  for (std::size_t i = 0; i < count; ++i) {
    const char32_t cp = chars[i];
    switch (kind_) {
    case Kind::Utf8:
      total += cp < 0x80 ? 1 : cp < 0x800 ? 2 : cp < 0x10000 ? 3 : 4;
      break;
    case Kind::Utf16LE:
    case Kind::Utf16BE:
      total += cp >= 0x10000 ? 4 : 2;
      break;
    default:
      total += 4;
      break;
    }
  }
  return total;
}

std::size_t TextEncoding::maxCharCount(std::size_t byteCount) const {
  // Every code point consumes at least one code unit; a trailing partial
  // unit yields one more replacement character.
  const std::size_t unit = codeUnitSize();
  return byteCount / unit + 1;
}

std::size_t TextEncoding::continuationLength(const unsigned char *data,
                                             std::size_t len) const {
  switch (kind_) {
  case Kind::Utf8: {
    std::size_t n = 0;
    while (n < len && n < 3 && isContinuation(data[n])) {
      ++n;
    }
    return n;
  }
  case Kind::Utf16LE:
  case Kind::Utf16BE:
    if (len >= 2 && isLowSurrogate(readUnit16(data, kind_ == Kind::Utf16BE))) {
      return 2;
    }
    return 0;
  default:
    return 0;
  }
}

std::optional<PreambleMatch>
TextEncoding::detectFromPreamble(const unsigned char *data, std::size_t len) {
  if (len < 2) {
    return std::nullopt;
  }
  if (data[0] == 0xFE && data[1] == 0xFF) {
    return PreambleMatch{TextEncoding(Kind::Utf16BE), 2};
  }
  if (data[0] == 0xFF && data[1] == 0xFE) {
    if (len >= 4 && data[2] == 0x00 && data[3] == 0x00) {
      return PreambleMatch{TextEncoding(Kind::Utf32LE), 4};
    }
    return PreambleMatch{TextEncoding(Kind::Utf16LE), 2};
  }
  if (len >= 3 && data[0] == 0xEF && data[1] == 0xBB && data[2] == 0xBF) {
    return PreambleMatch{TextEncoding(Kind::Utf8), 3};
  }
  if (len >= 4 && data[0] == 0x00 && data[1] == 0x00 && data[2] == 0xFE &&
      data[3] == 0xFF) {
    return PreambleMatch{TextEncoding(Kind::Utf32BE), 4};
  }
  return std::nullopt;
}

TextEncoding TextEncoding::fromName(const std::string &name) {
  std::string key;
  for (char c : name) {
    if (c != '-' && c != '_' && c != ' ') {
      key += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
  }

  if (key == "utf8") {
    return TextEncoding(Kind::Utf8);
  }
  if (key == "utf16le" || key == "utf16" || key == "unicode") {
    return TextEncoding(Kind::Utf16LE);
  }
  if (key == "utf16be" || key == "bigendianunicode") {
    return TextEncoding(Kind::Utf16BE);
  }
  if (key == "utf32le" || key == "utf32") {
    return TextEncoding(Kind::Utf32LE);
  }
  if (key == "utf32be") {
    return TextEncoding(Kind::Utf32BE);
  }

  throw ValidationException(ErrorCode::INVALID_INPUT,
                            "Unsupported text encoding: " + name, "encoding",
                            name);
}

void TextEncoding::appendUtf8(std::string &out, char32_t cp) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

std::string TextEncoding::toUtf8(const char32_t *chars, std::size_t count) {
  std::string out;
  out.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    appendUtf8(out, chars[i]);
  }
  return out;
}

} // namespace logpager
