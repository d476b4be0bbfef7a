// File: include/readlog/core/extract/extractors.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "readlog/core/events/classified_event.hpp"
#include "readlog/core/types.hpp"

namespace readlog {

struct DictionaryLookup {
  std::string term;
  std::optional<BookId> book_id;
  TimestampNs timestamp;
  std::string dictionary;  // language tag, may be empty
};

struct BrightnessEvent {
  TimestampNs timestamp;
  std::int64_t value = 0;
  BrightnessMode mode = BrightnessMode::kManual;
  std::string method;
};

struct Bookmark {
  BookId book_id;
  std::string location;
  TimestampNs timestamp;
  std::optional<std::string> note;
};

struct TermFrequency {
  std::string term;
  std::string dictionary;
  std::size_t count = 0;
};

const char* brightness_mode_name(BrightnessMode mode) noexcept;

// Lookups deduplicated on the exact (term, book_id, timestamp) triple, first occurrence kept,
// input order preserved.
std::vector<DictionaryLookup> extract_dictionary_lookups(const std::vector<ClassifiedEvent>& events);

// Brightness changes ordered by (timestamp, row_index).
std::vector<BrightnessEvent> extract_brightness(const std::vector<ClassifiedEvent>& events);

// Bookmarks in input order.
std::vector<Bookmark> extract_bookmarks(const std::vector<ClassifiedEvent>& events);

// Lookup counts per (term, dictionary), most frequent first, ties by term then dictionary.
std::vector<TermFrequency> term_frequencies(const std::vector<DictionaryLookup>& lookups);

}  // namespace readlog
