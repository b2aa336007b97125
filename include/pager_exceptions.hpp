#pragma once

#include "error_codes.hpp"
#include <chrono>
#include <exception>
#include <string>
#include <unordered_map>

namespace logpager {

// Error context for additional debugging information
using ErrorContext = std::unordered_map<std::string, std::string>;

// Base pager exception class with error context and correlation ID support
class PagerException : public std::exception {
public:
  PagerException(ErrorCode code, std::string message, ErrorContext context = {});

  PagerException(const PagerException &other) = default;
  PagerException &operator=(const PagerException &other) = default;
  PagerException(PagerException &&other) noexcept = default;
  PagerException &operator=(PagerException &&other) noexcept = default;

  virtual ~PagerException() = default;

  // Accessors
  ErrorCode getCode() const { return errorCode_; }
  const std::string &getMessage() const { return message_; }
  const ErrorContext &getContext() const { return context_; }
  const std::string &getCorrelationId() const { return correlationId_; }
  std::chrono::system_clock::time_point getTimestamp() const {
    return timestamp_;
  }

  const char *what() const noexcept override { return message_.c_str(); }

  // Serialization for logging and HTTP error bodies
  virtual std::string toLogString() const;
  std::string toJsonString() const;

  void addContext(const std::string &key, const std::string &value);
  void setCorrelationId(const std::string &correlationId);

protected:
  ErrorCode errorCode_;
  std::string message_;
  ErrorContext context_;
  std::string correlationId_;
  std::chrono::system_clock::time_point timestamp_;

  static std::string generateCorrelationId();
};

// Invalid caller input: negative counts, malformed parameters, bad seeks
class ValidationException : public PagerException {
public:
  ValidationException(ErrorCode code, std::string message,
                      std::string field = "", std::string value = "",
                      ErrorContext context = {});

  const std::string &getField() const { return field_; }
  const std::string &getValue() const { return value_; }

  std::string toLogString() const override;

private:
  std::string field_;
  std::string value_;
};

// Underlying I/O and infrastructure failures
class SystemException : public PagerException {
public:
  SystemException(ErrorCode code, std::string message,
                  std::string component = "", ErrorContext context = {});

  const std::string &getComponent() const { return component_; }

  std::string toLogString() const override;

private:
  std::string component_;
};

// Requested file id does not resolve to a file in the root directory
class NotFoundException : public PagerException {
public:
  explicit NotFoundException(std::string resourceId, ErrorContext context = {});

  const std::string &getResourceId() const { return resourceId_; }

  std::string toLogString() const override;

private:
  std::string resourceId_;
};

// Read primitive the reader cannot honour
class UnsupportedOperationException : public PagerException {
public:
  explicit UnsupportedOperationException(std::string operation,
                                         ErrorContext context = {});

  const std::string &getOperation() const { return operation_; }

  std::string toLogString() const override;

private:
  std::string operation_;
};

} // namespace logpager
