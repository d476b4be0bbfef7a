// File: src/core/analysis/run_summary.cpp
#include "readlog/core/analysis/run_summary.hpp"

#include <initializer_list>
#include <utility>

#include "readlog/core/stats/brightness_stats.hpp"
#include "readlog/core/util/repro_hash.hpp"

namespace readlog {
namespace {

// Unset on empty_input; any other failure is propagated.
Status optional_average(const Result<double>& r, std::optional<double>& out) {
  if (r.ok()) {
    out = r.value();
    return Status::ok_status();
  }
  if (r.status().code() == Status::Code::kEmptyInput) return Status::ok_status();
  return r.status();
}

}  // namespace

Result<RunSummary> summarize(const AnalysisResult& result, const StatsConfig& stats) {
  RunSummary out;
  out.selection = result.selection;
  out.diagnostics = result.diagnostics;
  out.result_fingerprint = compute_result_fingerprint(result);

  if (result.sessions) {
    const auto& all = result.sessions->sessions;
    const SessionStats st(filter_min_duration(all, stats.min_session_ns));
    out.session_count = st.count();
    out.sessions_excluded = all.size() - st.count();
    out.orphan_count = result.sessions->orphans.size();

    for (const SessionMetric m : {SessionMetric::kDuration, SessionMetric::kPagesTurned,
                                  SessionMetric::kSecondsRead, SessionMetric::kProgressDelta}) {
      MetricSummary ms;
      ms.metric = m;
      ms.quantiles = stats.quantiles;

      const Status avg = optional_average(st.average(m), ms.average);
      if (!avg.ok()) return Result<RunSummary>::err(avg);

      if (ms.average) {
        auto p = st.percentile(m, stats.quantiles);
        if (!p.ok()) return Result<RunSummary>::err(p.status());
        ms.values = p.take_value();
      }
      out.metrics.push_back(std::move(ms));
    }
  }

  if (result.brightness) {
    Status s = optional_average(time_weighted_average(*result.brightness, BrightnessMode::kManual),
                                out.manual_brightness_avg);
    if (!s.ok()) return Result<RunSummary>::err(s);
    s = optional_average(time_weighted_average(*result.brightness, BrightnessMode::kNaturalLight),
                         out.natural_light_avg);
    if (!s.ok()) return Result<RunSummary>::err(s);
  }

  if (result.terms) out.terms = term_frequencies(*result.terms);

  return Result<RunSummary>::ok(std::move(out));
}

}  // namespace readlog
