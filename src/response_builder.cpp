#include "response_builder.hpp"
#include <random>
#include <sstream>

namespace logpager {

ResponseBuilder::ResponseBuilder() : ResponseBuilder(ResponseConfig()) {}

ResponseBuilder::ResponseBuilder(ResponseConfig config)
    : config_(std::move(config)) {
  resetState();
}

ResponseBuilder &ResponseBuilder::setStatus(http::status status) {
  currentStatus_ = status;
  return *this;
}

ResponseBuilder &ResponseBuilder::setHeader(const std::string &name,
                                            const std::string &value) {
  currentHeaders_[name] = value;
  return *this;
}

ResponseBuilder &ResponseBuilder::setKeepAlive(bool keepAlive) {
  currentKeepAlive_ = keepAlive;
  return *this;
}

ResponseBuilder &ResponseBuilder::setVersion(unsigned version) {
  currentVersion_ = version;
  return *this;
}

http::response<http::string_body>
ResponseBuilder::successJson(const nlohmann::json &body) {
  currentStatus_ = http::status::ok;
  return buildResponse(body.dump(config_.prettyPrintJson ? 2 : -1, ' ', false,
                                 nlohmann::json::error_handler_t::replace));
}

http::response<http::string_body>
ResponseBuilder::error(http::status status, const std::string &code,
                       const std::string &message,
                       const std::string &correlationId) {
  currentStatus_ = status;
  nlohmann::json body = {{"error",
                          {{"code", code},
                           {"message", message},
                           {"correlationId", correlationId}}}};
  // Messages may echo raw request bytes
  return buildResponse(
      body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

http::response<http::string_body>
ResponseBuilder::badRequest(const std::string &message) {
  return error(http::status::bad_request, "INVALID_INPUT", message,
               generateRequestId());
}

http::response<http::string_body>
ResponseBuilder::notFound(const std::string &resource) {
  return error(http::status::not_found, "NOT_FOUND", resource + " not found",
               generateRequestId());
}

http::response<http::string_body>
ResponseBuilder::methodNotAllowed(const std::string &method,
                                  const std::string &endpoint) {
  setHeader("allow", "GET");
  return error(http::status::method_not_allowed, "METHOD_NOT_ALLOWED",
               "Method " + method + " not allowed for " + endpoint,
               generateRequestId());
}

http::response<http::string_body>
ResponseBuilder::internalServerError(const std::string &message) {
  return error(http::status::internal_server_error, "INTERNAL_ERROR", message,
               generateRequestId());
}

http::response<http::string_body>
ResponseBuilder::fromException(const PagerException &ex) {
  const auto status =
      http::int_to_status(static_cast<unsigned>(getDefaultHttpStatus(ex.getCode())));
  return error(status == http::status::unknown
                   ? http::status::internal_server_error
                   : status,
               errorCodeToString(ex.getCode()), ex.getMessage(),
               ex.getCorrelationId());
}

http::response<http::string_body>
ResponseBuilder::fromStandardException(const std::exception &ex) {
  return internalServerError(ex.what());
}

http::response<http::string_body>
ResponseBuilder::buildResponse(const std::string &body) {
  http::response<http::string_body> response{currentStatus_, currentVersion_};
  applyDefaultHeaders(response);
  applySecurityHeaders(response);

  for (const auto &[name, value] : currentHeaders_) {
    response.set(name, value);
  }

  response.keep_alive(currentKeepAlive_);
  response.body() = body;
  response.prepare_payload();

  resetState();
  return response;
}

void ResponseBuilder::applyDefaultHeaders(
    http::response<http::string_body> &response) {
  response.set(http::field::server, config_.serverName);
  response.set(http::field::content_type, "application/json");
  response.set(http::field::cache_control, "no-store");

  if (config_.enableCors) {
    response.set(http::field::access_control_allow_origin,
                 config_.allowOrigin);
    response.set(http::field::access_control_allow_methods, "GET");
  }
}

void ResponseBuilder::applySecurityHeaders(
    http::response<http::string_body> &response) {
  response.set("x-content-type-options", "nosniff");
  response.set("x-frame-options", "DENY");
}

void ResponseBuilder::resetState() {
  currentStatus_ = http::status::ok;
  currentHeaders_.clear();
  currentKeepAlive_ = false;
  currentVersion_ = 11;
}

std::string ResponseBuilder::generateRequestId() {
  thread_local std::mt19937 gen(std::random_device{}());
  std::uniform_int_distribution<> dis(0, 15);

  std::ostringstream ss;
  for (int i = 0; i < 8; ++i) {
    ss << std::hex << dis(gen);
  }
  return ss.str();
}

} // namespace logpager
