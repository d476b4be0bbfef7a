// File: src/core/analysis/selection.cpp
#include "readlog/core/analysis/selection.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>

#include "readlog/core/events/classifier.hpp"

namespace readlog {
namespace {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

void add_tags(TagSet& out, EventKind kind) {
  const TagSet tags = tags_for(kind);
  out.insert(tags.begin(), tags.end());
}

}  // namespace

const char* selection_name(Selection s) noexcept {
  switch (s) {
    case Selection::kAll: return "all";
    case Selection::kReadingSessions: return "reading_sessions";
    case Selection::kDictionaryLookups: return "dictionary_lookups";
    case Selection::kBookmarks: return "bookmarks";
    case Selection::kBrightness: return "brightness";
  }
  return "unknown";
}

Result<Selection> parse_selection(const std::string& name) {
  const std::string s = to_lower(name);
  for (const Selection sel : {Selection::kAll, Selection::kReadingSessions,
                              Selection::kDictionaryLookups, Selection::kBookmarks,
                              Selection::kBrightness}) {
    if (s == selection_name(sel)) return Result<Selection>::ok(sel);
  }
  return Result<Selection>::err(Status::invalid_argument("unknown selection: " + name));
}

ExtractionPlan plan_for(Selection s) {
  ExtractionPlan plan;
  const bool all = (s == Selection::kAll);

  plan.sessions = all || s == Selection::kReadingSessions;
  plan.lookups = all || s == Selection::kDictionaryLookups;
  plan.bookmarks = all || s == Selection::kBookmarks;
  plan.brightness = all || s == Selection::kBrightness;

  // Brightness events carry no book, so there is nothing to join.
  plan.books = plan.sessions || plan.lookups || plan.bookmarks;

  if (plan.sessions) {
    add_tags(plan.tags, EventKind::kSessionStart);
    add_tags(plan.tags, EventKind::kSessionEnd);
    add_tags(plan.tags, EventKind::kPageTurn);
  }
  if (plan.lookups) add_tags(plan.tags, EventKind::kDictionaryLookup);
  if (plan.bookmarks) add_tags(plan.tags, EventKind::kBookmarkAdded);
  if (plan.brightness) add_tags(plan.tags, EventKind::kBrightnessChange);
  return plan;
}

}  // namespace readlog
