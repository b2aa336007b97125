#include "forward_line_reader.hpp"
#include <algorithm>
#include <cstring>

namespace logpager {

ForwardLineReader::ForwardLineReader(std::unique_ptr<std::istream> stream,
                                     LineReaderOptions options)
    : LineReader(std::move(stream), options) {
  byteBuffer_.resize(bufferSize_);
}

ForwardLineReader::ForwardLineReader(const std::string &path,
                                     LineReaderOptions options)
    : ForwardLineReader(openFile(path), options) {}

bool ForwardLineReader::fill() {
  if (eof_) {
    return false;
  }

  // Carry the undecoded tail to the front of the buffer
  const std::size_t remaining = byteLen_ - bytePos_;
  if (remaining > 0 && bytePos_ > 0) {
    std::memmove(byteBuffer_.data(), byteBuffer_.data() + bytePos_, remaining);
  }
  bytePos_ = 0;
  byteLen_ = remaining;

  const std::size_t got = readAt(streamPos_, byteBuffer_.data() + byteLen_,
                                 byteBuffer_.size() - byteLen_);
  if (got == 0) {
    eof_ = true;
    return false;
  }
  streamPos_ += static_cast<std::int64_t>(got);
  byteLen_ += got;

  if (atStart_) {
    atStart_ = false;
    bytePos_ = preambleLength(
        reinterpret_cast<const unsigned char *>(byteBuffer_.data()), byteLen_);
  }
  return true;
}

std::size_t ForwardLineReader::decodeNext(char32_t &out) {
  while (true) {
    if (bytePos_ < byteLen_) {
      const std::size_t n = encoding_.decodeOne(
          reinterpret_cast<const unsigned char *>(byteBuffer_.data()) +
              bytePos_,
          byteLen_ - bytePos_, eof_, out);
      if (n > 0) {
        return n;
      }
    }
    if (!fill() && bytePos_ >= byteLen_) {
      return 0;
    }
  }
}

std::optional<std::string> ForwardLineReader::readLine() {
  std::string line;
  char32_t c = 0;

  std::size_t n = decodeNext(c);
  if (n == 0) {
    return std::nullopt;
  }

  while (n > 0) {
    bytePos_ += n;
    if (c == U'\n') {
      break;
    }
    if (c == U'\r') {
      char32_t next = 0;
      if (const std::size_t m = decodeNext(next); m > 0 && next == U'\n') {
        bytePos_ += m;
      }
      break;
    }
    TextEncoding::appendUtf8(line, c);
    n = decodeNext(c);
  }

  return line;
}

bool ForwardLineReader::endOfStream() {
  char32_t c = 0;
  return decodeNext(c) == 0;
}

std::int64_t ForwardLineReader::position() const {
  return streamPos_ - static_cast<std::int64_t>(byteLen_ - bytePos_);
}

std::int64_t ForwardLineReader::seek(std::int64_t offset, SeekOrigin origin) {
  const std::int64_t target = resolveSeek(offset, origin);

  bytePos_ = 0;
  byteLen_ = 0;
  streamPos_ = target;
  eof_ = false;
  atStart_ = target == 0;

  if (origin == SeekOrigin::Begin && offset == 0) {
    probePreamble();
  }
  return target;
}

} // namespace logpager
