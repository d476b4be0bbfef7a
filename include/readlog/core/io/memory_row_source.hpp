// File: include/readlog/core/io/memory_row_source.hpp
#pragma once

#include <string>
#include <utility>
#include <vector>

#include "readlog/core/io/row_source.hpp"

namespace readlog {

// Row source over rows already held in memory (tests, embedding callers).
// Returns every row regardless of the requested tags, renumbered in insertion order.
class MemoryRowSource final : public IRowSource {
 public:
  MemoryRowSource() = default;
  MemoryRowSource(std::vector<RawEvent> events, std::vector<Book> books);

  void add(RawEvent e) { events_.push_back(std::move(e)); }
  void add_book(Book b) { books_.push_back(std::move(b)); }

  // Simulates a source that cannot supply any data (e.g. a missing database).
  void set_unavailable(std::string reason);

  Result<std::vector<RawEvent>> read_events(const TagSet& tags) override;
  Result<std::vector<Book>> read_books() override;

  std::string name() const override { return "memory"; }

 private:
  std::vector<RawEvent> events_;
  std::vector<Book> books_;

  bool available_{true};
  std::string unavailable_reason_;
};

}  // namespace readlog
