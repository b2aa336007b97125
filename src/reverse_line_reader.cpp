#include "reverse_line_reader.hpp"
#include "logger.hpp"
#include "pager_exceptions.hpp"
#include <algorithm>

namespace logpager {

ReverseLineReader::ReverseLineReader(std::unique_ptr<std::istream> stream,
                                     LineReaderOptions options)
    : LineReader(std::move(stream), options) {
  byteBuffer_.resize(bufferSize_);
  charBuffer_.reserve(encoding_.maxCharCount(bufferSize_));
  charOffsets_.reserve(charBuffer_.capacity() + 1);
  streamPos_ = length_;
  chunkStart_ = length_;
}

ReverseLineReader::ReverseLineReader(const std::string &path,
                                     LineReaderOptions options)
    : ReverseLineReader(openFile(path), options) {}

// Loads the chunk that ends at streamPos_. Returns the number of decoded
// characters, zero once the start of the stream has been consumed.
std::size_t ReverseLineReader::readBuffer() {
  charBuffer_.clear();
  charOffsets_.clear();
  charPos_ = 0;

  while (charBuffer_.empty()) {
    if (streamPos_ <= 0) {
      return 0;
    }

    const auto capacity = static_cast<std::int64_t>(bufferSize_);
    std::int64_t n = std::min(streamPos_, capacity);
    std::int64_t start = streamPos_ - n;

    const auto unit = static_cast<std::int64_t>(encoding_.codeUnitSize());
    if (start > 0 && start % unit != 0) {
      const std::int64_t adjust = unit - start % unit;
      start += adjust;
      n -= adjust;
    }

    const std::size_t bytesRead =
        readAt(start, byteBuffer_.data(), static_cast<std::size_t>(n));
    if (bytesRead == 0) {
      throw SystemException(ErrorCode::FILE_ERROR,
                            "Unexpected end of stream at offset " +
                                std::to_string(start),
                            "ReverseLineReader");
    }
    isBlocked_ = bytesRead < static_cast<std::size_t>(n);

    const auto *bytes = reinterpret_cast<const unsigned char *>(
        byteBuffer_.data());
    std::size_t skip = 0;
    if (start == 0) {
      const auto before = encoding_;
      skip = preambleLength(bytes, bytesRead);
      if (encoding_ != before) {
        charBuffer_.reserve(encoding_.maxCharCount(bufferSize_));
      }
    } else {
      // Bytes that complete a character belonging to the previous chunk
      skip = encoding_.continuationLength(bytes, bytesRead);
      if (skip >= bytesRead) {
        skip = 0;
      }
    }

    streamPos_ = start == 0 ? 0 : start + static_cast<std::int64_t>(skip);
    chunkStart_ = start + static_cast<std::int64_t>(skip);
    encoding_.decode(bytes + skip, bytesRead - skip, charBuffer_,
                     &charOffsets_);
    charPos_ = charBuffer_.size();
  }

  return charPos_;
}

std::optional<std::string> ReverseLineReader::readLine() {
  if (charPos_ == 0 && readBuffer() == 0) {
    return std::nullopt;
  }

  // Terminator of the line being read sits directly before the cursor
  const char32_t last = charBuffer_[charPos_ - 1];
  if (last == U'\n') {
    --charPos_;
    if (charPos_ == 0 && readBuffer() == 0) {
      return std::string();
    }
    if (charBuffer_[charPos_ - 1] == U'\r') {
      --charPos_;
    }
  } else if (last == U'\r') {
    --charPos_;
  }

  std::u32string fragment;
  while (true) {
    std::size_t j = charPos_;
    while (j > 0 && charBuffer_[j - 1] != U'\n' && charBuffer_[j - 1] != U'\r') {
      --j;
    }

    fragment.insert(0, charBuffer_, j, charPos_ - j);
    charPos_ = j;
    if (j > 0) {
      break;
    }
    if (readBuffer() == 0) {
      break;
    }
  }

  return TextEncoding::toUtf8(fragment);
}

bool ReverseLineReader::endOfStream() {
  if (charPos_ > 0) {
    return false;
  }
  return readBuffer() == 0;
}

std::int64_t ReverseLineReader::position() const {
  if (charPos_ == 0) {
    return streamPos_;
  }
  return chunkStart_ + charOffsets_[charPos_];
}

std::int64_t ReverseLineReader::seek(std::int64_t offset, SeekOrigin origin) {
  const std::int64_t target = resolveSeek(offset, origin);

  charBuffer_.clear();
  charOffsets_.clear();
  charPos_ = 0;
  streamPos_ = target;
  chunkStart_ = target;

  if (origin == SeekOrigin::Begin && offset == 0) {
    probePreamble();
  }
  return target;
}

int ReverseLineReader::read() { throw UnsupportedOperationException("read"); }

std::size_t ReverseLineReader::read(char32_t *, std::size_t) {
  throw UnsupportedOperationException("read(buffer)");
}

int ReverseLineReader::peek() { throw UnsupportedOperationException("peek"); }

std::string ReverseLineReader::readToEnd() {
  throw UnsupportedOperationException("readToEnd");
}

std::size_t ReverseLineReader::readBlock(char32_t *, std::size_t) {
  throw UnsupportedOperationException("readBlock");
}

} // namespace logpager
