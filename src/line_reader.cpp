#include "line_reader.hpp"
#include "logger.hpp"
#include "pager_exceptions.hpp"
#include <algorithm>
#include <fstream>

namespace logpager {

namespace {
constexpr std::size_t kMinBufferSize = 128;
} // namespace

LineReader::LineReader(std::unique_ptr<std::istream> stream,
                       LineReaderOptions options)
    : stream_(std::move(stream)), encoding_(options.encoding),
      detectEncoding_(options.detectEncoding) {
  if (!stream_) {
    throw ValidationException(ErrorCode::INVALID_INPUT,
                              "Line reader requires a stream", "stream");
  }

  // Whole code units of every supported encoding
  bufferSize_ = std::max(options.bufferSize, kMinBufferSize);
  bufferSize_ = (bufferSize_ + 3) & ~static_cast<std::size_t>(3);

  stream_->seekg(0, std::ios::end);
  const auto end = stream_->tellg();
  if (!*stream_ || end < 0) {
    throw SystemException(ErrorCode::FILE_ERROR,
                          "Unable to determine stream length", "LineReader");
  }
  length_ = static_cast<std::int64_t>(end);

  probePreamble();
}

std::unique_ptr<std::istream> LineReader::openFile(const std::string &path) {
  auto file = std::make_unique<std::ifstream>(path, std::ios::binary);
  if (!file->is_open()) {
    READER_LOG_ERROR("Failed to open file: {}", path);
    throw SystemException(ErrorCode::FILE_ERROR, "Failed to open file: " + path,
                          "LineReader", {{"path", path}});
  }
  return file;
}

std::int64_t LineReader::resolveSeek(std::int64_t offset,
                                     SeekOrigin origin) const {
  std::int64_t base = 0;
  switch (origin) {
  case SeekOrigin::Begin:
    base = 0;
    break;
  case SeekOrigin::Current:
    base = position();
    break;
  case SeekOrigin::End:
    base = length_;
    break;
  }

  const std::int64_t target = base + offset;
  if (target < 0) {
    throw ValidationException(ErrorCode::INVALID_RANGE,
                              "Seek before start of stream", "offset",
                              std::to_string(target));
  }
  return std::min(target, length_);
}

void LineReader::probePreamble() {
  if (!detectEncoding_) {
    return;
  }
  unsigned char head[4] = {};
  const std::size_t n =
      readAt(0, reinterpret_cast<char *>(head), sizeof(head));
  if (auto match = TextEncoding::detectFromPreamble(head, n)) {
    if (match->encoding != encoding_) {
      READER_LOG_DEBUG("Detected {} byte order mark",
                       match->encoding.name());
    }
    encoding_ = match->encoding;
  }
}

std::size_t LineReader::preambleLength(const unsigned char *data,
                                       std::size_t len) {
  if (detectEncoding_) {
    if (auto match = TextEncoding::detectFromPreamble(data, len)) {
      encoding_ = match->encoding;
      return match->length;
    }
    return 0;
  }

  const std::string bom = encoding_.preamble();
  if (len >= bom.size() &&
      std::equal(bom.begin(), bom.end(), data,
                 [](char a, unsigned char b) {
                   return static_cast<unsigned char>(a) == b;
                 })) {
    return bom.size();
  }
  return 0;
}

std::size_t LineReader::readAt(std::int64_t offset, char *buffer,
                               std::size_t len) {
  stream_->clear();
  stream_->seekg(offset, std::ios::beg);
  if (!*stream_) {
    throw SystemException(ErrorCode::FILE_ERROR,
                          "Seek failed at offset " + std::to_string(offset),
                          "LineReader");
  }
  stream_->read(buffer, static_cast<std::streamsize>(len));
  if (stream_->bad()) {
    throw SystemException(ErrorCode::FILE_ERROR,
                          "Read failed at offset " + std::to_string(offset),
                          "LineReader");
  }
  const auto got = static_cast<std::size_t>(stream_->gcount());
  stream_->clear();
  return got;
}

} // namespace logpager
