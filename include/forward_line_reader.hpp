#pragma once

#include "line_reader.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace logpager {

/**
 * ForwardLineReader - Top-to-bottom counterpart of ReverseLineReader with the
 * same position()/seek() contract.
 *
 * Incomplete trailing sequences stay in the byte buffer until the next fill,
 * so position() is always exact.
 */
class ForwardLineReader : public LineReader {
public:
  explicit ForwardLineReader(std::unique_ptr<std::istream> stream,
                             LineReaderOptions options = {});
  explicit ForwardLineReader(const std::string &path,
                             LineReaderOptions options = {});

  std::optional<std::string> readLine() override;
  bool endOfStream() override;

  std::int64_t position() const override;
  std::int64_t seek(std::int64_t offset, SeekOrigin origin) override;

private:
  // Width of the next code point without consuming it; zero at end of stream
  std::size_t decodeNext(char32_t &out);
  bool fill();

  std::vector<char> byteBuffer_;
  std::size_t bytePos_ = 0;
  std::size_t byteLen_ = 0;
  std::int64_t streamPos_ = 0;
  bool eof_ = false;
  bool atStart_ = true;
};

} // namespace logpager
