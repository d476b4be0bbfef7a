// File: src/adapters/kobo_sqlite/kobo_sqlite_source.cpp
#include "readlog/adapters/kobo_sqlite/kobo_sqlite_source.hpp"

#include <optional>
#include <set>
#include <utility>

#include <spdlog/spdlog.h>

#include "readlog/core/util/json_fields.hpp"
#include "readlog/core/util/time_format.hpp"

namespace readlog {
namespace {

constexpr const char* kBookmarkTag = "BookmarkAdded";

// Session markers are the only events that describe a book by title and author.
constexpr const char* kOpenContent = "OpenContent";
constexpr const char* kLeaveContent = "LeaveContent";

// An undecodable value leaves the timestamp empty and keeps the text for diagnostics.
void decode_time(const std::optional<std::string>& text, RawEvent& e) {
  if (!text) return;
  auto t = parse_timestamp(*text);
  if (t.ok()) {
    e.timestamp = t.value();
  } else {
    e.fields["Timestamp"] = *text;
  }
}

// Unparseable JSON leaves the fields empty; the classifier reports the row.
void add_json_column(const std::optional<std::string>& text, const std::string& row_id,
                     FieldMap& fields) {
  if (!text || text->empty()) return;
  auto doc = parse_json(*text);
  if (!doc.ok()) {
    spdlog::debug("kobo_sqlite: row {}: {}", row_id, doc.status().message());
    return;
  }
  flatten_json_fields(doc.value(), fields);
}

const std::string* non_empty(const FieldMap& f, const char* key) {
  const auto it = f.find(key);
  if (it == f.end() || it->second.empty()) return nullptr;
  return &it->second;
}

std::string placeholders(std::size_t n) {
  std::string out;
  for (std::size_t i = 0; i < n; ++i) {
    if (i) out += ", ";
    out += "?" + std::to_string(i + 1);
  }
  return out;
}

}  // namespace

KoboSqliteSource::KoboSqliteSource(std::string db_path) : db_path_(std::move(db_path)) {}

Status KoboSqliteSource::open() {
  if (db_path_.empty()) return Status::invalid_argument("KoboSqliteSource: path is empty");

  auto db = SqliteDb::open_read_only(db_path_);
  if (!db.ok()) return db.status();

  auto has = db.value()->has_table("AnalyticsEvents");
  if (!has.ok()) {
    return Status::missing_source("not a readable database: " + db_path_ + " (" +
                                  has.status().message() + ")");
  }
  if (!has.value()) {
    return Status::missing_source("no AnalyticsEvents table in " + db_path_);
  }

  db_ = db.take_value();
  spdlog::info("kobo_sqlite: opened {} read-only", db_path_);
  return Status::ok_status();
}

Status KoboSqliteSource::ensure_open() {
  if (db_) return Status::ok_status();
  return open();
}

Result<std::vector<RawEvent>> KoboSqliteSource::read_events(const TagSet& tags) {
  using R = Result<std::vector<RawEvent>>;

  const Status st = ensure_open();
  if (!st.ok()) return R::err(st);

  std::vector<RawEvent> out;
  const Status a = read_analytics(tags, out);
  if (!a.ok()) return R::err(a);

  if (tags.count(kBookmarkTag) != 0) {
    const Status b = read_bookmarks(out);
    if (!b.ok()) return R::err(b);
  }

  for (std::size_t i = 0; i < out.size(); ++i) out[i].row_index = i;
  spdlog::debug("kobo_sqlite: {} rows for {} tags", out.size(), tags.size());
  return R::ok(std::move(out));
}

Status KoboSqliteSource::read_analytics(const TagSet& tags, std::vector<RawEvent>& out) {
  // Bookmarks live in their own table.
  std::vector<std::string> types;
  for (const auto& t : tags) {
    if (t != kBookmarkTag) types.push_back(t);
  }
  if (types.empty()) return Status::ok_status();

  const std::string sql =
      "SELECT Id, Type, Timestamp, Attributes, Metrics FROM AnalyticsEvents WHERE Type IN (" +
      placeholders(types.size()) + ") ORDER BY Timestamp ASC, rowid ASC;";
  auto stmt = db_->prepare(sql);
  if (!stmt.ok()) return stmt.status();
  for (std::size_t i = 0; i < types.size(); ++i) {
    READLOG_RETURN_IF_ERROR(stmt->bind_text(static_cast<int>(i + 1), types[i]));
  }

  for (;;) {
    auto row = stmt->step();
    if (!row.ok()) return row.status();
    if (!row.value()) break;

    RawEvent e;
    e.id = stmt->column_text(0).value_or("");
    e.type_tag = stmt->column_text(1).value_or("");
    decode_time(stmt->column_text(2), e);
    add_json_column(stmt->column_text(3), e.id, e.fields);
    add_json_column(stmt->column_text(4), e.id, e.fields);

    if (const std::string* author = non_empty(e.fields, "attribution")) {
      e.fields["author"] = *author;
    }
    if (const std::string* vol = non_empty(e.fields, "volumeid")) {
      e.book_id = *vol;
    } else if (const std::string* title = non_empty(e.fields, "title")) {
      e.book_id = *title;
    }
    out.push_back(std::move(e));
  }
  return Status::ok_status();
}

Status KoboSqliteSource::read_bookmarks(std::vector<RawEvent>& out) {
  auto has = db_->has_table("Bookmark");
  if (!has.ok()) return has.status();
  if (!has.value()) {
    spdlog::info("kobo_sqlite: no Bookmark table in {}", db_path_);
    return Status::ok_status();
  }

  auto stmt = db_->prepare(
      "SELECT BookmarkID, Text, VolumeID, Color, ChapterProgress, DateCreated FROM Bookmark "
      "WHERE Text IS NOT NULL AND Text != '' ORDER BY DateCreated ASC, rowid ASC;");
  if (!stmt.ok()) return stmt.status();

  for (;;) {
    auto row = stmt->step();
    if (!row.ok()) return row.status();
    if (!row.value()) break;

    RawEvent e;
    e.id = stmt->column_text(0).value_or("");
    e.type_tag = kBookmarkTag;
    e.fields["note"] = stmt->column_text(1).value_or("");
    if (auto vol = stmt->column_text(2)) {
      if (!vol->empty()) e.book_id = std::move(*vol);
    }
    if (auto color = stmt->column_text(3)) e.fields["color"] = std::move(*color);
    e.fields["location"] = stmt->column_text(4).value_or("");
    decode_time(stmt->column_text(5), e);
    out.push_back(std::move(e));
  }
  return Status::ok_status();
}

Result<std::vector<Book>> KoboSqliteSource::read_books() {
  using R = Result<std::vector<Book>>;

  const Status st = ensure_open();
  if (!st.ok()) return R::err(st);

  std::vector<Book> out;
  const Status c = read_content_books(out);
  if (!c.ok()) return R::err(c);
  const Status a = read_attribute_books(out);
  if (!a.ok()) return R::err(a);

  spdlog::debug("kobo_sqlite: {} books", out.size());
  return R::ok(std::move(out));
}

Status KoboSqliteSource::read_content_books(std::vector<Book>& out) {
  auto has = db_->has_table("content");
  if (!has.ok()) return has.status();
  if (!has.value()) {
    spdlog::warn("kobo_sqlite: no content table in {}, book titles unavailable", db_path_);
    return Status::ok_status();
  }

  auto stmt = db_->prepare(
      "SELECT BookID, ContentID, Title, Attribution FROM content WHERE ContentType = 6;");
  if (!stmt.ok()) return stmt.status();

  for (;;) {
    auto row = stmt->step();
    if (!row.ok()) return row.status();
    if (!row.value()) break;

    Book b;
    b.id = stmt->column_text(0).value_or("");
    if (b.id.empty()) b.id = stmt->column_text(1).value_or("");
    if (b.id.empty()) continue;
    b.title = stmt->column_text(2).value_or("");
    b.authors = stmt->column_text(3).value_or("");
    out.push_back(std::move(b));
  }
  return Status::ok_status();
}

// Side-loaded books have no content row; their session markers carry title and attribution
// without a volume id. Such books are keyed by title.
Status KoboSqliteSource::read_attribute_books(std::vector<Book>& out) {
  std::set<BookId> known;
  for (const auto& b : out) known.insert(b.id);

  auto stmt = db_->prepare(
      "SELECT Id, Attributes FROM AnalyticsEvents WHERE Type IN (?1, ?2) "
      "ORDER BY Timestamp ASC, rowid ASC;");
  if (!stmt.ok()) return stmt.status();
  READLOG_RETURN_IF_ERROR(stmt->bind_text(1, kOpenContent));
  READLOG_RETURN_IF_ERROR(stmt->bind_text(2, kLeaveContent));

  for (;;) {
    auto row = stmt->step();
    if (!row.ok()) return row.status();
    if (!row.value()) break;

    FieldMap attrs;
    add_json_column(stmt->column_text(1), stmt->column_text(0).value_or(""), attrs);
    if (non_empty(attrs, "volumeid")) continue;

    const std::string* title = non_empty(attrs, "title");
    const std::string* author = non_empty(attrs, "attribution");
    if (!title || !author || !known.insert(*title).second) continue;
    out.push_back(Book{*title, *title, *author});
  }
  return Status::ok_status();
}

}  // namespace readlog
