#pragma once

#include "pager_exceptions.hpp"
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>

namespace logpager {

namespace http = boost::beast::http;

/**
 * @brief HTTP response builder for the JSON API
 *
 * Fluent setters configure the next response; each terminal method builds it
 * and resets the builder. Error bodies always have the form
 * {"error":{"code","message","correlationId"}}.
 */
class ResponseBuilder {
public:
  struct ResponseConfig {
    std::string serverName = "LogPager";
    bool enableCors = true;
    std::string allowOrigin = "*";
    bool prettyPrintJson = false;
  };

  ResponseBuilder();
  explicit ResponseBuilder(ResponseConfig config);

  ResponseBuilder &setStatus(http::status status);
  ResponseBuilder &setHeader(const std::string &name, const std::string &value);
  ResponseBuilder &setKeepAlive(bool keepAlive);
  ResponseBuilder &setVersion(unsigned version);

  http::response<http::string_body> successJson(const nlohmann::json &body);

  http::response<http::string_body> error(http::status status,
                                          const std::string &code,
                                          const std::string &message,
                                          const std::string &correlationId);
  http::response<http::string_body> badRequest(const std::string &message);
  http::response<http::string_body>
  notFound(const std::string &resource = "Resource");
  http::response<http::string_body>
  methodNotAllowed(const std::string &method, const std::string &endpoint);
  http::response<http::string_body>
  internalServerError(const std::string &message = "Internal server error");

  http::response<http::string_body> fromException(const PagerException &ex);
  http::response<http::string_body>
  fromStandardException(const std::exception &ex);

  const ResponseConfig &getConfig() const { return config_; }

  static std::string generateRequestId();

private:
  ResponseConfig config_;

  http::status currentStatus_ = http::status::ok;
  std::unordered_map<std::string, std::string> currentHeaders_;
  bool currentKeepAlive_ = false;
  unsigned currentVersion_ = 11;

  http::response<http::string_body> buildResponse(const std::string &body);
  void applyDefaultHeaders(http::response<http::string_body> &response);
  void applySecurityHeaders(http::response<http::string_body> &response);
  void resetState();
};

} // namespace logpager
