// File: include/readlog/core/io/row_source.hpp
#pragma once

#include <set>
#include <string>
#include <vector>

#include "readlog/core/io/raw_event.hpp"
#include "readlog/core/status.hpp"
#include "readlog/core/types.hpp"

namespace readlog {

using TagSet = std::set<std::string>;

class IRowSource {
 public:
  virtual ~IRowSource() = default;

  // Returns at least the events whose type_tag is in `tags`, ordered by arrival (row_index
  // ascending). `tags` is a filter hint: a source may return other rows as well (replay sources
  // return every row so unknown tags reach the classifier); callers drop what they do not need.
  // Returns:
  //  - OK with possibly zero events
  //  - missing_source(...) when the source holds no readable event log at all
  //  - other error codes on failure
  virtual Result<std::vector<RawEvent>> read_events(const TagSet& tags) = 0;

  // Book reference data, keyed by Book::id.
  virtual Result<std::vector<Book>> read_books() = 0;

  virtual std::string name() const = 0;
};

}  // namespace readlog
