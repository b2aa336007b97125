#include "error_codes.hpp"

namespace logpager {

const std::unordered_map<ErrorCode, ErrorCodeInfo> &getErrorCodeInfo() {
  static const std::unordered_map<ErrorCode, ErrorCodeInfo> errorInfo = {
      // Validation errors
      {ErrorCode::INVALID_INPUT,
       {"Invalid input data or format", "Validation",
        false, // Not retryable - client error
        400}}, // Bad Request
      {ErrorCode::INVALID_RANGE,
       {"Value is outside acceptable range", "Validation", false, 400}},

      // System errors
      {ErrorCode::FILE_ERROR,
       {"File system operation failed", "System", false, 500}},
      {ErrorCode::CONFIGURATION_ERROR,
       {"Configuration loading or parsing failed", "System",
        false, // Usually requires manual intervention
        500}},
      {ErrorCode::INTERNAL_ERROR,
       {"Unexpected internal error", "System", false, 500}},

      // Paging errors
      {ErrorCode::FILE_NOT_FOUND,
       {"Requested file does not exist", "Paging", false,
        404}}, // Not Found
      {ErrorCode::UNSUPPORTED_OPERATION,
       {"Operation is not supported by this reader", "Paging", false, 500}}};

  return errorInfo;
}

const char *getErrorCodeDescription(ErrorCode code) {
  const auto &info = getErrorCodeInfo();
  auto it = info.find(code);
  return (it != info.end()) ? it->second.description.c_str()
                            : "Unknown error";
}

std::string getErrorCategory(ErrorCode code) {
  const auto &info = getErrorCodeInfo();
  auto it = info.find(code);
  return (it != info.end()) ? it->second.category : "Unknown";
}

bool isRetryableError(ErrorCode code) {
  const auto &info = getErrorCodeInfo();
  auto it = info.find(code);
  return (it != info.end()) ? it->second.isRetryable : false;
}

int getDefaultHttpStatus(ErrorCode code) {
  const auto &info = getErrorCodeInfo();
  auto it = info.find(code);
  return (it != info.end()) ? it->second.defaultHttpStatus : 500;
}

std::string errorCodeToString(ErrorCode code) {
  switch (code) {
  case ErrorCode::INVALID_INPUT:
    return "INVALID_INPUT";
  case ErrorCode::INVALID_RANGE:
    return "INVALID_RANGE";
  case ErrorCode::FILE_ERROR:
    return "FILE_ERROR";
  case ErrorCode::CONFIGURATION_ERROR:
    return "CONFIGURATION_ERROR";
  case ErrorCode::INTERNAL_ERROR:
    return "INTERNAL_ERROR";
  case ErrorCode::FILE_NOT_FOUND:
    return "FILE_NOT_FOUND";
  case ErrorCode::UNSUPPORTED_OPERATION:
    return "UNSUPPORTED_OPERATION";
  default:
    return "UNKNOWN_ERROR";
  }
}

} // namespace logpager
