#pragma once

#include "config_manager.hpp"
#include "logger.hpp"
#include "page_models.hpp"
#include "page_reader.hpp"
#include "response_builder.hpp"
#include <boost/beast/http.hpp>
#include <string>
#include <string_view>
#include <unordered_map>

namespace logpager {

namespace http = boost::beast::http;

using QueryParams = std::unordered_map<std::string, std::string,
                                       TransparentStringHash, std::equal_to<>>;

/**
 * RequestHandler - Routes the JSON API onto a PageReader.
 *
 *   GET /api/health
 *   GET /api/files
 *   GET /api/pages/{first|last|next|prev}?id=&count=&top=&bottom=&view=
 *
 * view=log serves the most-recent-first ordering. Errors are mapped to JSON
 * bodies with the status of their error code.
 */
class RequestHandler {
public:
  explicit RequestHandler(PageReader reader);

  // Never throws; failures become JSON error responses
  http::response<http::string_body>
  handleRequest(const http::request<http::string_body> &req) const;

  static QueryParams extractQueryParams(std::string_view target);
  static std::string urlDecode(std::string_view text);

private:
  PageReader reader_;

  // Error-mapping body of handleRequest
  http::response<http::string_body>
  dispatch(const http::request<http::string_body> &req) const;
  http::response<http::string_body>
  route(const http::request<http::string_body> &req) const;
  http::response<http::string_body>
  handleHealth(const http::request<http::string_body> &req) const;
  http::response<http::string_body>
  handleFiles(const http::request<http::string_body> &req) const;
  http::response<http::string_body>
  handlePage(const http::request<http::string_body> &req,
             std::string_view action) const;

  PageData parsePageRequest(const QueryParams &params) const;
  static PageOrder parseView(const QueryParams &params);
};

} // namespace logpager
