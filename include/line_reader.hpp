#pragma once

#include "text_encoding.hpp"
#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <string>

namespace logpager {

enum class SeekOrigin { Begin, Current, End };

struct LineReaderOptions {
  TextEncoding encoding;
  bool detectEncoding = true;
  std::size_t bufferSize = 1024;
};

/**
 * LineReader - Whole-line access to a seekable byte stream.
 *
 * position() is the byte offset a subsequent readLine() starts from, so a
 * caller can remember it and seek() back later with any reader.
 */
class LineReader {
public:
  virtual ~LineReader() = default;

  // Next line without its terminator; std::nullopt once the stream is done
  virtual std::optional<std::string> readLine() = 0;
  virtual bool endOfStream() = 0;

  virtual std::int64_t position() const = 0;
  virtual std::int64_t seek(std::int64_t offset, SeekOrigin origin) = 0;

  const TextEncoding &currentEncoding() const { return encoding_; }
  std::int64_t length() const { return length_; }

protected:
  LineReader(std::unique_ptr<std::istream> stream, LineReaderOptions options);

  static std::unique_ptr<std::istream> openFile(const std::string &path);

  // Resolves origin + offset, clamped to the stream length
  std::int64_t resolveSeek(std::int64_t offset, SeekOrigin origin) const;

  // Re-reads the head of the stream and adopts a detected byte order mark
  void probePreamble();

  // Number of BOM bytes at the front of a chunk read from offset 0
  std::size_t preambleLength(const unsigned char *data, std::size_t len);

  // Reads up to len bytes at offset, returns the count read
  std::size_t readAt(std::int64_t offset, char *buffer, std::size_t len);

  std::unique_ptr<std::istream> stream_;
  TextEncoding encoding_;
  bool detectEncoding_;
  std::size_t bufferSize_;
  std::int64_t length_ = 0;
};

} // namespace logpager
