// File: include/readlog/core/analysis/analyzer.hpp
#pragma once

#include <vector>

#include "readlog/core/analysis/analysis_result.hpp"
#include "readlog/core/analysis/selection.hpp"
#include "readlog/core/io/raw_event.hpp"
#include "readlog/core/io/row_source.hpp"
#include "readlog/core/sessions/session_reconstructor.hpp"
#include "readlog/core/status.hpp"

namespace readlog {

// One parse invocation: read -> classify -> selected extractors -> AnalysisResult.
// Holds no state between calls; concurrent calls on different sources are independent.
class Analyzer {
 public:
  // Fails only when the source cannot supply data (missing_source or an IO error). Per-row
  // problems are absorbed and counted in AnalysisResult::diagnostics.
  Result<AnalysisResult> parse(IRowSource& source, Selection selection) const;

  // Pure core over rows already in memory. `raws` may include tags the selection does not need;
  // those are skipped before classification.
  AnalysisResult analyze(const std::vector<RawEvent>& raws, const std::vector<Book>& books,
                         Selection selection) const;

 private:
  SessionReconstructor reconstructor_;
};

}  // namespace readlog
