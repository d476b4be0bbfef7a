// File: include/readlog/core/util/json_fields.hpp
#pragma once

#include <string>

#include <json/json.h>

#include "readlog/core/status.hpp"
#include "readlog/core/types.hpp"

namespace readlog {

// Strict parse of one JSON document. parse_error with the reader's message on failure.
Result<Json::Value> parse_json(const std::string& text);

// Text form of a JSON value as a field value: strings as-is, numbers and booleans printed,
// null as empty, arrays and objects as compact JSON.
std::string json_field_text(const Json::Value& v);

// Copies the members of `obj` into `out` (later keys overwrite). Non-objects add nothing.
void flatten_json_fields(const Json::Value& obj, FieldMap& out);

}  // namespace readlog
