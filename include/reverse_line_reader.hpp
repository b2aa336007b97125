#pragma once

#include "line_reader.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace logpager {

/**
 * ReverseLineReader - Produces the lines of a stream walking from the current
 * position toward the start.
 *
 * The stream is consumed in fixed-size chunks read from behind the cursor.
 * Each chunk is decoded on its own; its start is moved forward to the next
 * code point boundary so no character straddles two chunks. `\r\n`, `\r` and
 * `\n` each end a line.
 *
 * A new reader is positioned at the end of the stream.
 */
class ReverseLineReader : public LineReader {
public:
  explicit ReverseLineReader(std::unique_ptr<std::istream> stream,
                             LineReaderOptions options = {});
  explicit ReverseLineReader(const std::string &path,
                             LineReaderOptions options = {});

  std::optional<std::string> readLine() override;
  bool endOfStream() override;

  std::int64_t position() const override;
  std::int64_t seek(std::int64_t offset, SeekOrigin origin) override;

  std::size_t bufferSize() const { return bufferSize_; }
  // Last refill got fewer bytes than the stream length promised
  bool isBlocked() const { return isBlocked_; }

  // Character and block reads are not available in reverse
  int read();
  std::size_t read(char32_t *buffer, std::size_t count);
  int peek();
  std::string readToEnd();
  std::size_t readBlock(char32_t *buffer, std::size_t count);

private:
  std::size_t readBuffer();

  std::vector<char> byteBuffer_;
  std::u32string charBuffer_;
  std::vector<std::uint32_t> charOffsets_;
  std::size_t charPos_ = 0;
  std::int64_t chunkStart_ = 0;
  std::int64_t streamPos_ = 0;
  bool isBlocked_ = false;
};

} // namespace logpager
