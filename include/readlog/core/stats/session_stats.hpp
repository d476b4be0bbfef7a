// File: include/readlog/core/stats/session_stats.hpp
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "readlog/core/sessions/reading_session.hpp"
#include "readlog/core/status.hpp"

namespace readlog {

enum class SessionMetric {
  kDuration,     // seconds, end - start
  kPagesTurned,
  kSecondsRead,  // vendor counter, sessions without it are skipped
  kButtonPresses,
  kProgressDelta,  // end_progress - start_progress, both required
};

const char* session_metric_name(SessionMetric metric) noexcept;
Result<SessionMetric> parse_session_metric(const std::string& name);

// Value of `metric` for one session; nullopt when the session does not carry it.
std::optional<double> metric_value(const ReadingSession& s, SessionMetric metric);

// Aggregates over a finalized session set.
//
// Quantiles use linear interpolation between closest ranks: for p in [0,1] and n sorted values,
// r = p * (n - 1) and the result interpolates between values[floor(r)] and values[ceil(r)].
// Duplicate values are kept.
class SessionStats {
 public:
  SessionStats() = default;
  explicit SessionStats(std::vector<ReadingSession> sessions);

  [[nodiscard]] std::size_t count() const noexcept { return sessions_.size(); }
  [[nodiscard]] const std::vector<ReadingSession>& sessions() const noexcept { return sessions_; }

  // empty_input when no session carries the metric.
  Result<double> average(SessionMetric metric) const;

  // invalid_argument for any quantile outside [0,1] (checked first), empty_input when no session
  // carries the metric. One result per requested quantile, in request order.
  Result<std::vector<double>> percentile(SessionMetric metric,
                                         const std::vector<double>& quantiles) const;

 private:
  std::vector<double> values(SessionMetric metric) const;

  std::vector<ReadingSession> sessions_;
};

// Sessions at least `min_duration_ns` long, order preserved.
std::vector<ReadingSession> filter_min_duration(const std::vector<ReadingSession>& sessions,
                                                DurationNs min_duration_ns);

}  // namespace readlog
