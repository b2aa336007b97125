#include "page_json.hpp"
#include "pager_exceptions.hpp"
#include <charconv>

namespace logpager {

void to_json(nlohmann::json &json, const PageOffset &offset) {
  if (offset.isBoundary()) {
    json = nullptr;
  } else {
    json = offset.value();
  }
}

void from_json(const nlohmann::json &json, PageOffset &offset) {
  if (json.is_null()) {
    offset = PageOffset::boundary();
    return;
  }
  if (!json.is_number_integer() || json.get<std::int64_t>() < 0) {
    throw ValidationException(ErrorCode::INVALID_INPUT,
                              "Offset must be null or a non-negative integer",
                              "offset", json.dump());
  }
  offset = PageOffset::at(json.get<std::int64_t>());
}

void to_json(nlohmann::json &json, const PageData &page) {
  json = nlohmann::json{{"id", page.id},
                        {"count", page.count},
                        {"top", page.top},
                        {"bottom", page.bottom},
                        {"lines", page.lines}};
}

void from_json(const nlohmann::json &json, PageData &page) {
  page.id = json.value("id", std::string());
  page.count = json.value("count", 0);
  page.top = json.contains("top") ? json.at("top").get<PageOffset>()
                                  : PageOffset::boundary();
  page.bottom = json.contains("bottom") ? json.at("bottom").get<PageOffset>()
                                        : PageOffset::boundary();
  page.lines = json.value("lines", std::vector<std::string>());
}

void to_json(nlohmann::json &json, const FileEntry &entry) {
  json = nlohmann::json{{"name", entry.name}, {"length", entry.length}};
}

PageOffset parseOffset(const std::string &text, const std::string &field) {
  if (text.empty() || text == "null") {
    return PageOffset::boundary();
  }

  std::int64_t value = 0;
  const char *first = text.data();
  const char *last = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last || value < 0) {
    throw ValidationException(ErrorCode::INVALID_INPUT,
                              field + " must be a non-negative integer", field,
                              text);
  }
  return PageOffset::at(value);
}

nlohmann::json pageControls(const PageData &page) {
  const bool canGoUp = !page.top.isBoundary();
  const bool canGoDown = !page.bottom.isBoundary();
  return {{"first", canGoUp},
          {"prev", canGoUp},
          {"next", canGoDown},
          {"last", canGoDown}};
}

} // namespace logpager
