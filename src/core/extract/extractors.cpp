// File: src/core/extract/extractors.cpp
#include "readlog/core/extract/extractors.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <tuple>
#include <utility>

namespace readlog {

const char* brightness_mode_name(BrightnessMode mode) noexcept {
  switch (mode) {
    case BrightnessMode::kManual: return "manual";
    case BrightnessMode::kNaturalLight: return "natural_light";
  }
  return "unknown";
}

std::vector<DictionaryLookup> extract_dictionary_lookups(const std::vector<ClassifiedEvent>& events) {
  using Key = std::tuple<std::string, std::optional<BookId>, std::int64_t>;

  std::vector<DictionaryLookup> out;
  std::set<Key> seen;
  for (const auto& e : events) {
    const auto* d = e.as<DictionaryLookupEvent>();
    if (!d) continue;
    if (!seen.insert(Key{d->term, e.book_id, e.timestamp.ns}).second) continue;
    out.push_back(DictionaryLookup{d->term, e.book_id, e.timestamp, d->dictionary});
  }
  return out;
}

std::vector<BrightnessEvent> extract_brightness(const std::vector<ClassifiedEvent>& events) {
  std::vector<const ClassifiedEvent*> picked;
  for (const auto& e : events) {
    if (e.kind() == EventKind::kBrightnessChange) picked.push_back(&e);
  }
  std::stable_sort(picked.begin(), picked.end(),
                   [](const ClassifiedEvent* a, const ClassifiedEvent* b) {
                     if (a->timestamp != b->timestamp) return a->timestamp < b->timestamp;
                     return a->row_index < b->row_index;
                   });

  std::vector<BrightnessEvent> out;
  out.reserve(picked.size());
  for (const ClassifiedEvent* e : picked) {
    const auto* b = e->as<BrightnessChangeEvent>();
    out.push_back(BrightnessEvent{e->timestamp, b->value, b->mode, b->method});
  }
  return out;
}

std::vector<Bookmark> extract_bookmarks(const std::vector<ClassifiedEvent>& events) {
  std::vector<Bookmark> out;
  for (const auto& e : events) {
    const auto* b = e.as<BookmarkAddedEvent>();
    if (!b || !e.book_id) continue;
    out.push_back(Bookmark{*e.book_id, b->location, e.timestamp, b->note});
  }
  return out;
}

std::vector<TermFrequency> term_frequencies(const std::vector<DictionaryLookup>& lookups) {
  std::map<std::pair<std::string, std::string>, std::size_t> counts;
  for (const auto& l : lookups) ++counts[{l.term, l.dictionary}];

  std::vector<TermFrequency> out;
  out.reserve(counts.size());
  for (const auto& [key, n] : counts) out.push_back(TermFrequency{key.first, key.second, n});

  // Map order already sorts by (term, dictionary); stable sort keeps it for equal counts.
  std::stable_sort(out.begin(), out.end(), [](const TermFrequency& a, const TermFrequency& b) {
    return a.count > b.count;
  });
  return out;
}

}  // namespace readlog
