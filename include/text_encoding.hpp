#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace logpager {

struct PreambleMatch;

/**
 * TextEncoding - Byte <-> code point conversion for the encodings a log file
 * may be stored in.
 *
 * Ill-formed input never throws: each maximal invalid subsequence decodes to
 * U+FFFD. Decoded text is handed to callers as UTF-8.
 */
class TextEncoding {
public:
  enum class Kind { Utf8, Utf16LE, Utf16BE, Utf32LE, Utf32BE };

  static constexpr char32_t kReplacementChar = 0xFFFD;

  TextEncoding() = default;
  constexpr explicit TextEncoding(Kind kind) : kind_(kind) {}

  Kind kind() const { return kind_; }
  std::string name() const;

  // Width of one code unit in bytes (1, 2 or 4)
  std::size_t codeUnitSize() const;

  // Byte order mark for this encoding
  std::string preamble() const;

  /**
   * Decode one code point from the front of [data, data + len).
   *
   * @return Bytes consumed. Zero means the sequence is incomplete and more
   * input is needed; never zero when @p final is true and len > 0.
   */
  std::size_t decodeOne(const unsigned char *data, std::size_t len, bool final,
                        char32_t &out) const;

  /**
   * Decode a complete chunk, appending code points to @p out. When @p offsets
   * is given it receives the byte offset of every appended code point plus
   * one trailing entry for the end of the chunk.
   */
  void decode(const unsigned char *data, std::size_t len, std::u32string &out,
              std::vector<std::uint32_t> *offsets = nullptr) const;

  // Encoded size of the given code points
  std::size_t byteCount(const char32_t *chars, std::size_t count) const;
  std::size_t byteCount(const std::u32string &chars) const {
    return byteCount(chars.data(), chars.size());
  }

  // Upper bound of code points produced by decoding byteCount bytes
  std::size_t maxCharCount(std::size_t byteCount) const;

  // Leading bytes of a chunk that finish a code point begun before it
  std::size_t continuationLength(const unsigned char *data,
                                 std::size_t len) const;

  static std::optional<PreambleMatch>
  detectFromPreamble(const unsigned char *data, std::size_t len);

  // Parses names such as "utf-8", "UTF16-LE", "utf_32be"
  static TextEncoding fromName(const std::string &name);

  static void appendUtf8(std::string &out, char32_t cp);
  static std::string toUtf8(const char32_t *chars, std::size_t count);
  static std::string toUtf8(const std::u32string &chars) {
    return toUtf8(chars.data(), chars.size());
  }

  bool operator==(const TextEncoding &other) const {
    return kind_ == other.kind_;
  }
  bool operator!=(const TextEncoding &other) const {
    return !(*this == other);
  }

private:
  Kind kind_ = Kind::Utf8;

  std::size_t decodeUtf8(const unsigned char *data, std::size_t len,
                         bool final, char32_t &out) const;
  std::size_t decodeUtf16(const unsigned char *data, std::size_t len,
                          bool final, char32_t &out) const;
  std::size_t decodeUtf32(const unsigned char *data, std::size_t len,
                          bool final, char32_t &out) const;
};

struct PreambleMatch {
  TextEncoding encoding;
  std::size_t length = 0;
};

} // namespace logpager
