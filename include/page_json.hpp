#pragma once

#include "page_models.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace logpager {

// Boundary <-> null; any number is an exact offset, 0 included
void to_json(nlohmann::json &json, const PageOffset &offset);
void from_json(const nlohmann::json &json, PageOffset &offset);

void to_json(nlohmann::json &json, const PageData &page);
void from_json(const nlohmann::json &json, PageData &page);

void to_json(nlohmann::json &json, const FileEntry &entry);

// Query-string form of an offset: empty and "null" are Boundary
PageOffset parseOffset(const std::string &text, const std::string &field);

// Enabled state of the first/prev/next/last controls
nlohmann::json pageControls(const PageData &page);

} // namespace logpager
