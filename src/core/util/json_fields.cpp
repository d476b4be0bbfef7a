// File: src/core/util/json_fields.cpp
#include "readlog/core/util/json_fields.hpp"

#include <memory>
#include <utility>

namespace readlog {

Result<Json::Value> parse_json(const std::string& text) {
  Json::CharReaderBuilder b;
  b["collectComments"] = false;
  const std::unique_ptr<Json::CharReader> reader(b.newCharReader());

  Json::Value v;
  std::string errs;
  if (!reader->parse(text.data(), text.data() + text.size(), &v, &errs)) {
    return Result<Json::Value>::err(Status::parse_error("bad JSON: " + errs));
  }
  return Result<Json::Value>::ok(std::move(v));
}

std::string json_field_text(const Json::Value& v) {
  switch (v.type()) {
    case Json::nullValue:
      return {};
    case Json::stringValue:
      return v.asString();
    case Json::intValue:
      return std::to_string(v.asLargestInt());
    case Json::uintValue:
      return std::to_string(v.asLargestUInt());
    case Json::booleanValue:
      return v.asBool() ? "true" : "false";
    case Json::realValue: {
      // Whole numbers print without a fraction so integer fields still decode.
      const double d = v.asDouble();
      if (v.isInt64()) return std::to_string(v.asInt64());
      Json::StreamWriterBuilder w;
      w["indentation"] = "";
      return Json::writeString(w, Json::Value(d));
    }
    case Json::arrayValue:
    case Json::objectValue: {
      Json::StreamWriterBuilder w;
      w["indentation"] = "";
      return Json::writeString(w, v);
    }
  }
  return {};
}

void flatten_json_fields(const Json::Value& obj, FieldMap& out) {
  if (!obj.isObject()) return;
  for (const auto& key : obj.getMemberNames()) {
    out[key] = json_field_text(obj[key]);
  }
}

}  // namespace readlog
