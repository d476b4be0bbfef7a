// File: include/readlog/core/io/raw_event.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "readlog/core/types.hpp"

namespace readlog {

// One stored analytics row, as the row source exposed it.
struct RawEvent {
  std::string id;        // source row id, diagnostics only
  std::string type_tag;  // e.g. "OpenContent", "DictionaryLookup"

  // Empty when the stored timestamp could not be decoded. The raw text is kept in
  // fields["Timestamp"] in that case.
  std::optional<TimestampNs> timestamp;

  std::optional<BookId> book_id;
  FieldMap fields;

  // Arrival order within one read. Breaks timestamp ties.
  std::uint64_t row_index{0};
};

}  // namespace readlog
