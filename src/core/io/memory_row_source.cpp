// File: src/core/io/memory_row_source.cpp
#include "readlog/core/io/memory_row_source.hpp"

#include <utility>

namespace readlog {

MemoryRowSource::MemoryRowSource(std::vector<RawEvent> events, std::vector<Book> books)
    : events_(std::move(events)), books_(std::move(books)) {}

void MemoryRowSource::set_unavailable(std::string reason) {
  available_ = false;
  unavailable_reason_ = std::move(reason);
}

Result<std::vector<RawEvent>> MemoryRowSource::read_events(const TagSet& /*tags*/) {
  if (!available_) {
    return Result<std::vector<RawEvent>>::err(Status::missing_source(unavailable_reason_));
  }

  std::vector<RawEvent> out = events_;
  for (std::size_t i = 0; i < out.size(); ++i) out[i].row_index = i;
  return Result<std::vector<RawEvent>>::ok(std::move(out));
}

Result<std::vector<Book>> MemoryRowSource::read_books() {
  if (!available_) {
    return Result<std::vector<Book>>::err(Status::missing_source(unavailable_reason_));
  }
  return Result<std::vector<Book>>::ok(books_);
}

}  // namespace readlog
