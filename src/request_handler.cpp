#include "request_handler.hpp"
#include "logger.hpp"
#include "page_json.hpp"
#include "pager_exceptions.hpp"
#include <charconv>

namespace logpager {

namespace {

constexpr std::string_view kPagesPrefix = "/api/pages/";

std::string_view targetView(boost::beast::string_view target) {
  return std::string_view(target.data(), target.size());
}

std::string_view stripQuery(std::string_view target) {
  return target.substr(0, target.find('?'));
}

int hexValue(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

std::string paramOr(const QueryParams &params, const std::string &key,
                    const std::string &fallback = "") {
  if (auto it = params.find(key); it != params.end()) {
    return it->second;
  }
  return fallback;
}

} // namespace

RequestHandler::RequestHandler(PageReader reader) : reader_(std::move(reader)) {}

http::response<http::string_body>
RequestHandler::handleRequest(const http::request<http::string_body> &req) const {
  try {
    return dispatch(req);
  } catch (const std::exception &ex) {
    REQ_LOG_ERROR("Failed to build error response: {}", ex.what());
  }

  http::response<http::string_body> response{
      http::status::internal_server_error, req.version()};
  response.set(http::field::content_type, "application/json");
  response.body() = R"({"error":{"code":"INTERNAL_ERROR",)"
                    R"("message":"Internal server error","correlationId":""}})";
  response.keep_alive(false);
  response.prepare_payload();
  return response;
}

http::response<http::string_body>
RequestHandler::dispatch(const http::request<http::string_body> &req) const {
  REQ_LOG_DEBUG("Received request: {} {}", std::string(req.method_string()),
                std::string(req.target()));

  ResponseBuilder builder;
  builder.setKeepAlive(req.keep_alive()).setVersion(req.version());

  try {
    auto response = route(req);
    response.keep_alive(req.keep_alive());
    return response;
  } catch (const PagerException &ex) {
    const int status = getDefaultHttpStatus(ex.getCode());
    if (status >= 500) {
      REQ_LOG_ERROR("Request failed: {}", ex.toLogString());
    } else {
      REQ_LOG_WARN("Request rejected: {}", ex.toLogString());
    }
    return builder.fromException(ex);
  } catch (const std::exception &ex) {
    REQ_LOG_ERROR("Unexpected error handling {}: {}",
                  std::string(req.target()), ex.what());
    return builder.fromStandardException(ex);
  }
}

http::response<http::string_body>
RequestHandler::route(const http::request<http::string_body> &req) const {
  const std::string path(stripQuery(targetView(req.target())));

  const bool known = path == "/api/health" || path == "/api/files" ||
                     path.rfind(kPagesPrefix, 0) == 0;
  if (!known) {
    return ResponseBuilder().setVersion(req.version()).notFound("Endpoint " +
                                                                path);
  }

  if (req.method() != http::verb::get) {
    return ResponseBuilder()
        .setVersion(req.version())
        .methodNotAllowed(std::string(req.method_string()), path);
  }

  if (path == "/api/health") {
    return handleHealth(req);
  }
  if (path == "/api/files") {
    return handleFiles(req);
  }
  return handlePage(req, std::string_view(path).substr(kPagesPrefix.size()));
}

http::response<http::string_body> RequestHandler::handleHealth(
    const http::request<http::string_body> &req) const {
  return ResponseBuilder().setVersion(req.version()).successJson(
      {{"status", "ok"}});
}

http::response<http::string_body>
RequestHandler::handleFiles(const http::request<http::string_body> &req) const {
  nlohmann::json files = reader_.listFiles();
  return ResponseBuilder().setVersion(req.version()).successJson(files);
}

http::response<http::string_body>
RequestHandler::handlePage(const http::request<http::string_body> &req,
                           std::string_view action) const {
  PageMove move;
  if (action == "first") {
    move = PageMove::First;
  } else if (action == "last") {
    move = PageMove::Last;
  } else if (action == "next") {
    move = PageMove::Next;
  } else if (action == "prev") {
    move = PageMove::Prev;
  } else {
    return ResponseBuilder().setVersion(req.version()).notFound(
        "Page action '" + std::string(action) + "'");
  }

  const auto params = extractQueryParams(targetView(req.target()));
  PageData page = parsePageRequest(params);
  const PageOrder order = parseView(params);

  reader_.navigate(page, move, order);

  nlohmann::json body = page;
  body["controls"] = pageControls(page);
  return ResponseBuilder().setVersion(req.version()).successJson(body);
}

PageData RequestHandler::parsePageRequest(const QueryParams &params) const {
  const auto &config = reader_.config();

  PageData page;
  page.id = paramOr(params, "id");
  if (page.id.empty()) {
    throw ValidationException(ErrorCode::INVALID_INPUT,
                              "Query parameter 'id' is required", "id");
  }

  const std::string countText = paramOr(params, "count");
  if (countText.empty()) {
    page.count = config.defaultPageSize;
  } else {
    int count = 0;
    const char *last = countText.data() + countText.size();
    auto [ptr, ec] = std::from_chars(countText.data(), last, count);
    if (ec != std::errc() || ptr != last) {
      throw ValidationException(ErrorCode::INVALID_INPUT,
                                "count must be an integer", "count",
                                countText);
    }
    if (count < 0 || count > config.maxPageSize) {
      throw ValidationException(
          ErrorCode::INVALID_RANGE,
          "count must be between 0 and " + std::to_string(config.maxPageSize),
          "count", countText);
    }
    page.count = count;
  }

  page.top = parseOffset(paramOr(params, "top"), "top");
  page.bottom = parseOffset(paramOr(params, "bottom"), "bottom");
  return page;
}

PageOrder RequestHandler::parseView(const QueryParams &params) {
  const std::string view = paramOr(params, "view", "forward");
  if (view == "forward") {
    return PageOrder::Natural;
  }
  if (view == "log") {
    return PageOrder::MostRecentFirst;
  }
  throw ValidationException(ErrorCode::INVALID_INPUT,
                            "view must be 'forward' or 'log'", "view", view);
}

QueryParams RequestHandler::extractQueryParams(std::string_view target) {
  QueryParams params;
  const size_t queryPos = target.find('?');
  if (queryPos == std::string_view::npos) {
    return params;
  }

  std::string_view query = target.substr(queryPos + 1);
  while (!query.empty()) {
    const size_t amp = query.find('&');
    const std::string_view pair = query.substr(0, amp);
    query = amp == std::string_view::npos ? std::string_view()
                                          : query.substr(amp + 1);
    if (pair.empty()) {
      continue;
    }

    const size_t eq = pair.find('=');
    std::string key = urlDecode(pair.substr(0, eq));
    std::string value = eq == std::string_view::npos
                            ? std::string()
                            : urlDecode(pair.substr(eq + 1));
    params[std::move(key)] = std::move(value);
  }
  return params;
}

std::string RequestHandler::urlDecode(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (c == '+') {
      out += ' ';
    } else if (c == '%' && i + 2 < text.size() &&
               hexValue(text[i + 1]) >= 0 && hexValue(text[i + 2]) >= 0) {
      out += static_cast<char>(hexValue(text[i + 1]) * 16 +
                               hexValue(text[i + 2]));
      i += 2;
    } else {
      out += c;
    }
  }
  return out;
}

} // namespace logpager
