// File: include/readlog/core/analysis/run_summary.hpp
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "readlog/core/analysis/analysis_result.hpp"
#include "readlog/core/config.hpp"
#include "readlog/core/extract/extractors.hpp"
#include "readlog/core/stats/session_stats.hpp"

namespace readlog {

struct MetricSummary {
  SessionMetric metric = SessionMetric::kDuration;

  // Unset when no session carried the metric.
  std::optional<double> average;
  std::vector<double> quantiles;  // requested p values
  std::vector<double> values;     // one per quantile, empty when average is unset
};

// Headline numbers for one run, computed from an AnalysisResult.
struct RunSummary {
  Selection selection = Selection::kAll;

  std::size_t session_count = 0;      // after the min-duration filter
  std::size_t sessions_excluded = 0;  // removed by the min-duration filter
  std::size_t orphan_count = 0;
  std::vector<MetricSummary> metrics;

  std::optional<double> manual_brightness_avg;
  std::optional<double> natural_light_avg;

  std::vector<TermFrequency> terms;

  ParseDiagnostics diagnostics;
  std::string result_fingerprint;
};

// Statistics failures caused by an empty section leave the matching field unset.
// invalid_argument (a bad quantile) is returned as an error.
Result<RunSummary> summarize(const AnalysisResult& result, const StatsConfig& stats);

}  // namespace readlog
