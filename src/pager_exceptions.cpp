#include "pager_exceptions.hpp"
#include <iomanip>
#include <nlohmann/json.hpp>
#include <random>
#include <sstream>

namespace logpager {

std::string PagerException::generateCorrelationId() {
  thread_local std::mt19937 gen(std::random_device{}());
  std::uniform_int_distribution<> dis(0, 15);

  std::stringstream ss;
  for (int i = 0; i < 8; ++i) {
    ss << std::hex << dis(gen);
  }
  return ss.str();
}

PagerException::PagerException(ErrorCode code, std::string message,
                               ErrorContext context)
    : errorCode_(code), message_(std::move(message)),
      context_(std::move(context)), correlationId_(generateCorrelationId()),
      timestamp_(std::chrono::system_clock::now()) {}

std::string PagerException::toLogString() const {
  std::stringstream ss;
  ss << "[" << correlationId_ << "] "
     << "ErrorCode=" << errorCodeToString(errorCode_) << " "
     << "Message=\"" << message_ << "\"";

  if (!context_.empty()) {
    ss << " Context={";
    bool first = true;
    for (const auto &[key, value] : context_) {
      if (!first)
        ss << ", ";
      ss << key << "=\"" << value << "\"";
      first = false;
    }
    ss << "}";
  }

  return ss.str();
}

std::string PagerException::toJsonString() const {
  nlohmann::json json = {
      {"correlationId", correlationId_},
      {"errorCode", static_cast<int>(errorCode_)},
      {"code", errorCodeToString(errorCode_)},
      {"message", message_},
      {"timestamp", std::chrono::duration_cast<std::chrono::milliseconds>(
                        timestamp_.time_since_epoch())
                        .count()}};

  if (!context_.empty()) {
    json["context"] = context_;
  }

  return json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void PagerException::addContext(const std::string &key,
                                const std::string &value) {
  context_[key] = value;
}

void PagerException::setCorrelationId(const std::string &correlationId) {
  correlationId_ = correlationId;
}

ValidationException::ValidationException(ErrorCode code, std::string message,
                                         std::string field, std::string value,
                                         ErrorContext context)
    : PagerException(code, std::move(message), std::move(context)),
      field_(std::move(field)), value_(std::move(value)) {
  if (!field_.empty()) {
    addContext("field", field_);
  }
  if (!value_.empty()) {
    addContext("value", value_);
  }
}

std::string ValidationException::toLogString() const {
  std::stringstream ss;
  ss << "[VALIDATION] " << PagerException::toLogString();
  if (!field_.empty()) {
    ss << " Field=\"" << field_ << "\"";
  }
  return ss.str();
}

SystemException::SystemException(ErrorCode code, std::string message,
                                 std::string component, ErrorContext context)
    : PagerException(code, std::move(message), std::move(context)),
      component_(std::move(component)) {
  if (!component_.empty()) {
    addContext("component", component_);
  }
}

std::string SystemException::toLogString() const {
  std::stringstream ss;
  ss << "[SYSTEM] " << PagerException::toLogString();
  if (!component_.empty()) {
    ss << " Component=\"" << component_ << "\"";
  }
  return ss.str();
}

NotFoundException::NotFoundException(std::string resourceId,
                                     ErrorContext context)
    : PagerException(ErrorCode::FILE_NOT_FOUND,
                     "File not found: " + resourceId, std::move(context)),
      resourceId_(std::move(resourceId)) {
  addContext("id", resourceId_);
}

std::string NotFoundException::toLogString() const {
  return "[NOT_FOUND] " + PagerException::toLogString();
}

UnsupportedOperationException::UnsupportedOperationException(
    std::string operation, ErrorContext context)
    : PagerException(ErrorCode::UNSUPPORTED_OPERATION,
                     "Operation not supported: " + operation,
                     std::move(context)),
      operation_(std::move(operation)) {
  addContext("operation", operation_);
}

std::string UnsupportedOperationException::toLogString() const {
  return "[UNSUPPORTED] " + PagerException::toLogString();
}

} // namespace logpager
