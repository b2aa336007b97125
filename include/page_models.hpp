#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace logpager {

/**
 * PageOffset - Byte offset framing a page, or Boundary when there is no
 * further data in that direction.
 */
class PageOffset {
public:
  // Default-constructed offsets are Boundary
  PageOffset() = default;

  static PageOffset boundary() { return PageOffset(); }
  static PageOffset at(std::int64_t offset) { return PageOffset(offset); }

  // Start of file reports as Boundary
  static PageOffset top(std::int64_t offset) {
    return offset <= 0 ? boundary() : at(offset);
  }

  // End of file reports as Boundary
  static PageOffset bottom(std::int64_t offset, std::int64_t fileLength) {
    return offset >= fileLength ? boundary() : at(offset);
  }

  bool isBoundary() const { return !offset_.has_value(); }
  std::int64_t value() const { return offset_.value(); }
  std::int64_t valueOr(std::int64_t fallback) const {
    return offset_.value_or(fallback);
  }

  bool operator==(const PageOffset &other) const {
    return offset_ == other.offset_;
  }
  bool operator!=(const PageOffset &other) const {
    return !(*this == other);
  }

private:
  explicit PageOffset(std::int64_t offset) : offset_(offset) {}

  std::optional<std::int64_t> offset_;
};

// Request and response of one navigation step
struct PageData {
  std::string id;
  int count = 0;
  PageOffset top;
  PageOffset bottom;
  std::vector<std::string> lines;
};

// Physical read request handed to the file repository
struct PageContext {
  std::string path;
  int count = 0;
  bool backward = false;
  std::int64_t top = 0;
  std::int64_t bottom = 0;
  std::vector<std::string> lines;
};

struct FileEntry {
  std::string name;
  std::int64_t length = 0;
};

enum class PageMove { First, Last, Next, Prev };

enum class PageOrder { Natural, MostRecentFirst };

} // namespace logpager
