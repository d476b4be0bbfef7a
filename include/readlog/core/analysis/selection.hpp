// File: include/readlog/core/analysis/selection.hpp
#pragma once

#include <string>

#include "readlog/core/io/row_source.hpp"
#include "readlog/core/status.hpp"

namespace readlog {

// Which data kinds one parse produces.
enum class Selection {
  kAll,
  kReadingSessions,
  kDictionaryLookups,
  kBookmarks,
  kBrightness,
};

const char* selection_name(Selection s) noexcept;

// Accepts selection_name() spellings, case-insensitive.
Result<Selection> parse_selection(const std::string& name);

// The work a selection implies, decided once before any row is read.
struct ExtractionPlan {
  bool sessions{false};
  bool lookups{false};
  bool brightness{false};
  bool bookmarks{false};
  bool books{false};

  TagSet tags;  // row tags to request from the source
};

ExtractionPlan plan_for(Selection s);

}  // namespace readlog
