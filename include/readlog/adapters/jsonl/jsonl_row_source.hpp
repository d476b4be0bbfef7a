// File: include/readlog/adapters/jsonl/jsonl_row_source.hpp
#pragma once

#include <string>
#include <vector>

#include "readlog/core/io/row_source.hpp"

namespace readlog {

// Replays a captured event log, one JSON object per line:
//   {"id": "...", "type": "OpenContent", "timestamp": "2024-01-02T10:00:00Z",
//    "book_id": "...", "fields": {"progress": "12"}}
// "timestamp" is ISO-8601 text or a number of seconds since the Unix epoch.
// Lines with "type": "Book" carry reference data instead: {"type":"Book","book_id","title","authors"}.
//
// Blank lines are skipped. A line that is not a JSON object becomes a row with an empty type
// tag (the classifier reports it). Every event row is returned regardless of requested tags.
class JsonlRowSource final : public IRowSource {
 public:
  explicit JsonlRowSource(std::string path);

  // Reads the whole file. missing_source when it cannot be opened.
  Status open();

  Result<std::vector<RawEvent>> read_events(const TagSet& tags) override;
  Result<std::vector<Book>> read_books() override;

  std::string name() const override { return "jsonl"; }

 private:
  Status ensure_open();
  void parse_line(const std::string& line, std::size_t line_no);

  std::string path_;
  bool opened_{false};

  std::vector<RawEvent> events_;
  std::vector<Book> books_;
};

}  // namespace readlog
