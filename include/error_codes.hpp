#pragma once

#include <functional> // Needed for std::hash
#include <string>
#include <type_traits>
#include <unordered_map>

namespace logpager {

// Error codes organized by category
enum class ErrorCode {
  // Validation errors (1000-1999)
  INVALID_INPUT = 1000, // Malformed parameter, negative count, bad encoding
  INVALID_RANGE = 1001, // Offset or page size outside accepted bounds

  // System errors (3000-3999)
  FILE_ERROR = 3000,          // Open, seek, read or listing failure
  CONFIGURATION_ERROR = 3001, // Config file missing, unparsable or invalid
  INTERNAL_ERROR = 3002,      // Unexpected failures

  // Paging errors (4000-4999)
  FILE_NOT_FOUND = 4000,        // No file with the requested id
  UNSUPPORTED_OPERATION = 4001, // Non-line read on the reverse reader
};

// Error code metadata for enhanced error handling
struct ErrorCodeInfo {
  std::string description;
  std::string category;
  bool isRetryable;
  int defaultHttpStatus;
};

// Error code information mapping
const std::unordered_map<ErrorCode, ErrorCodeInfo> &getErrorCodeInfo();

} // namespace logpager

// Hash support for ErrorCode keys in unordered_map
namespace std {
template <> struct hash<logpager::ErrorCode> {
  size_t operator()(const logpager::ErrorCode code) const noexcept {
    using Underlying = std::underlying_type_t<logpager::ErrorCode>;
    return std::hash<Underlying>{}(static_cast<Underlying>(code));
  }
};
} // namespace std

namespace logpager {
// Utility functions
const char *getErrorCodeDescription(ErrorCode code);
std::string getErrorCategory(ErrorCode code);
bool isRetryableError(ErrorCode code);
int getDefaultHttpStatus(ErrorCode code);
std::string errorCodeToString(ErrorCode code);
} // namespace logpager
