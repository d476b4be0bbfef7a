// File: src/adapters/jsonl/jsonl_row_source.cpp
#include "readlog/adapters/jsonl/jsonl_row_source.hpp"

#include <fstream>
#include <utility>

#include <spdlog/spdlog.h>

#include "readlog/core/util/json_fields.hpp"
#include "readlog/core/util/time_format.hpp"

namespace readlog {
namespace {

constexpr const char* kBookType = "Book";

bool is_blank(const std::string& s) {
  for (const char c : s) {
    if (c != ' ' && c != '\t' && c != '\r') return false;
  }
  return true;
}

void decode_time(const Json::Value& v, RawEvent& e) {
  if (v.isString()) {
    auto t = parse_timestamp(v.asString());
    if (t.ok()) {
      e.timestamp = t.value();
    } else {
      e.fields["Timestamp"] = v.asString();
    }
    return;
  }
  // Seconds since the epoch; values outside the int64 ns range keep their text.
  if (v.isNumeric() && seconds_in_range(v.asDouble())) {
    e.timestamp = at_seconds(v.asDouble());
    return;
  }
  if (!v.isNull()) e.fields["Timestamp"] = json_field_text(v);
}

}  // namespace

JsonlRowSource::JsonlRowSource(std::string path) : path_(std::move(path)) {}

Status JsonlRowSource::open() {
  if (path_.empty()) return Status::invalid_argument("JsonlRowSource: path is empty");

  std::ifstream f(path_);
  if (!f.is_open()) return Status::missing_source("cannot open event log: " + path_);

  events_.clear();
  books_.clear();

  std::string line;
  std::size_t line_no = 0;
  while (std::getline(f, line)) {
    ++line_no;
    if (is_blank(line)) continue;
    parse_line(line, line_no);
  }
  if (f.bad()) return Status::io_error("failed reading " + path_);

  opened_ = true;
  spdlog::info("jsonl: loaded {} events, {} books from {}", events_.size(), books_.size(), path_);
  return Status::ok_status();
}

Status JsonlRowSource::ensure_open() {
  if (opened_) return Status::ok_status();
  return open();
}

void JsonlRowSource::parse_line(const std::string& line, std::size_t line_no) {
  auto doc = parse_json(line);
  if (!doc.ok() || !doc.value().isObject()) {
    spdlog::debug("jsonl: {}:{}: not a JSON object", path_, line_no);
    RawEvent e;
    e.id = "line:" + std::to_string(line_no);
    e.fields["line"] = line;
    events_.push_back(std::move(e));
    return;
  }

  const Json::Value& v = doc.value();
  const std::string type = v.get("type", "").isString() ? v.get("type", "").asString() : "";

  if (type == kBookType) {
    Book b;
    b.id = json_field_text(v.get("book_id", Json::Value()));
    b.title = json_field_text(v.get("title", Json::Value()));
    b.authors = json_field_text(v.get("authors", Json::Value()));
    if (!b.id.empty()) books_.push_back(std::move(b));
    return;
  }

  RawEvent e;
  e.id = json_field_text(v.get("id", Json::Value()));
  if (e.id.empty()) e.id = "line:" + std::to_string(line_no);
  e.type_tag = type;

  const std::string book = json_field_text(v.get("book_id", Json::Value()));
  if (!book.empty()) e.book_id = book;

  flatten_json_fields(v.get("fields", Json::Value()), e.fields);
  decode_time(v.get("timestamp", Json::Value()), e);
  events_.push_back(std::move(e));
}

Result<std::vector<RawEvent>> JsonlRowSource::read_events(const TagSet& /*tags*/) {
  using R = Result<std::vector<RawEvent>>;
  const Status st = ensure_open();
  if (!st.ok()) return R::err(st);

  std::vector<RawEvent> out = events_;
  for (std::size_t i = 0; i < out.size(); ++i) out[i].row_index = i;
  return R::ok(std::move(out));
}

Result<std::vector<Book>> JsonlRowSource::read_books() {
  using R = Result<std::vector<Book>>;
  const Status st = ensure_open();
  if (!st.ok()) return R::err(st);
  return R::ok(books_);
}

}  // namespace readlog
