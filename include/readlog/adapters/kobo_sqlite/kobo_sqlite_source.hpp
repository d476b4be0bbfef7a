// File: include/readlog/adapters/kobo_sqlite/kobo_sqlite_source.hpp
#pragma once

#include <memory>
#include <string>
#include <vector>

#include "readlog/adapters/kobo_sqlite/sqlite_db.hpp"
#include "readlog/core/io/row_source.hpp"

namespace readlog {

// Row source over the reader's KoboReader.sqlite, opened read-only.
//
// AnalyticsEvents rows become RawEvents: the Attributes and Metrics JSON columns are
// flattened into fields, book_id is Attributes.volumeid (falling back to Attributes.title),
// and Attributes.attribution is also exposed as "author". Bookmark rows with text become
// BookmarkAdded events when that tag is requested.
class KoboSqliteSource final : public IRowSource {
 public:
  explicit KoboSqliteSource(std::string db_path);

  // Call once after construction. Keeps ctor simple (no implicit IO).
  // missing_source when the file is absent, not a database, or has no AnalyticsEvents table.
  Status open();

  Result<std::vector<RawEvent>> read_events(const TagSet& tags) override;
  Result<std::vector<Book>> read_books() override;

  std::string name() const override { return "kobo_sqlite"; }

 private:
  Status ensure_open();
  Status read_analytics(const TagSet& tags, std::vector<RawEvent>& out);
  Status read_bookmarks(std::vector<RawEvent>& out);
  Status read_content_books(std::vector<Book>& out);
  Status read_attribute_books(std::vector<Book>& out);

  std::string db_path_;
  std::unique_ptr<SqliteDb> db_;
};

}  // namespace readlog
