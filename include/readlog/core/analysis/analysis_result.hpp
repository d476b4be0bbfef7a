// File: include/readlog/core/analysis/analysis_result.hpp
#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "readlog/core/analysis/selection.hpp"
#include "readlog/core/extract/extractors.hpp"
#include "readlog/core/sessions/reading_session.hpp"
#include "readlog/core/stats/session_stats.hpp"
#include "readlog/core/types.hpp"

namespace readlog {

struct ParseDiagnostics {
  std::size_t rows_read = 0;
  std::size_t classified = 0;      // rows that became a typed event
  std::size_t unknown_tags = 0;    // rows with a tag outside the lookup table
  std::size_t malformed_rows = 0;  // known tag, missing or undecodable fields
};

// Sections the selection did not ask for are nullopt, not empty.
struct AnalysisResult {
  Selection selection = Selection::kAll;

  std::optional<SessionReport> sessions;
  std::optional<std::vector<DictionaryLookup>> terms;
  std::optional<std::vector<BrightnessEvent>> brightness;
  std::optional<std::vector<Bookmark>> bookmarks;
  std::optional<std::vector<Book>> books;

  ParseDiagnostics diagnostics;

  // Statistics over the reconstructed sessions; empty when sessions were not selected.
  [[nodiscard]] SessionStats session_stats() const {
    return sessions ? SessionStats(sessions->sessions) : SessionStats();
  }
};

}  // namespace readlog
