// File: src/core/stats/session_stats.cpp
#include "readlog/core/stats/session_stats.hpp"

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <utility>

namespace readlog {

const char* session_metric_name(SessionMetric metric) noexcept {
  switch (metric) {
    case SessionMetric::kDuration: return "duration";
    case SessionMetric::kPagesTurned: return "pages_turned";
    case SessionMetric::kSecondsRead: return "seconds_read";
    case SessionMetric::kButtonPresses: return "button_presses";
    case SessionMetric::kProgressDelta: return "progress_delta";
  }
  return "unknown";
}

Result<SessionMetric> parse_session_metric(const std::string& name) {
  for (const SessionMetric m : {SessionMetric::kDuration, SessionMetric::kPagesTurned,
                                SessionMetric::kSecondsRead, SessionMetric::kButtonPresses,
                                SessionMetric::kProgressDelta}) {
    if (name == session_metric_name(m)) return Result<SessionMetric>::ok(m);
  }
  return Result<SessionMetric>::err(Status::invalid_argument("unknown session metric: " + name));
}

std::optional<double> metric_value(const ReadingSession& s, SessionMetric metric) {
  switch (metric) {
    case SessionMetric::kDuration:
      return s.duration_s();
    case SessionMetric::kPagesTurned:
      return static_cast<double>(s.pages_turned);
    case SessionMetric::kSecondsRead:
      if (!s.seconds_read) return std::nullopt;
      return static_cast<double>(*s.seconds_read);
    case SessionMetric::kButtonPresses:
      if (!s.button_presses) return std::nullopt;
      return static_cast<double>(*s.button_presses);
    case SessionMetric::kProgressDelta:
      if (!s.start_progress || !s.end_progress) return std::nullopt;
      return static_cast<double>(*s.end_progress - *s.start_progress);
  }
  return std::nullopt;
}

SessionStats::SessionStats(std::vector<ReadingSession> sessions) : sessions_(std::move(sessions)) {}

std::vector<double> SessionStats::values(SessionMetric metric) const {
  std::vector<double> out;
  out.reserve(sessions_.size());
  for (const auto& s : sessions_) {
    if (const auto v = metric_value(s, metric)) out.push_back(*v);
  }
  return out;
}

Result<double> SessionStats::average(SessionMetric metric) const {
  const std::vector<double> vals = values(metric);
  if (vals.empty()) {
    return Result<double>::err(Status::empty_input(
        std::string("average(") + session_metric_name(metric) + ") over zero sessions"));
  }

  double sum = 0.0;
  for (const double v : vals) sum += v;
  return Result<double>::ok(sum / static_cast<double>(vals.size()));
}

Result<std::vector<double>> SessionStats::percentile(SessionMetric metric,
                                                     const std::vector<double>& quantiles) const {
  for (const double p : quantiles) {
    // NaN fails both comparisons.
    if (!(p >= 0.0 && p <= 1.0)) {
      return Result<std::vector<double>>::err(
          Status::invalid_argument("quantile must be within [0,1], got " + std::to_string(p)));
    }
  }

  std::vector<double> vals = values(metric);
  if (vals.empty()) {
    return Result<std::vector<double>>::err(Status::empty_input(
        std::string("percentile(") + session_metric_name(metric) + ") over zero sessions"));
  }
  std::sort(vals.begin(), vals.end());

  std::vector<double> out;
  out.reserve(quantiles.size());
  for (const double p : quantiles) {
    const double rank = p * static_cast<double>(vals.size() - 1);
    const auto lo = static_cast<std::size_t>(std::floor(rank));
    const auto hi = static_cast<std::size_t>(std::ceil(rank));
    if (lo == hi) {
      out.push_back(vals[lo]);
      continue;
    }
    const double frac = rank - static_cast<double>(lo);
    out.push_back(vals[lo] + (vals[hi] - vals[lo]) * frac);
  }
  return Result<std::vector<double>>::ok(std::move(out));
}

std::vector<ReadingSession> filter_min_duration(const std::vector<ReadingSession>& sessions,
                                                DurationNs min_duration_ns) {
  std::vector<ReadingSession> out;
  for (const auto& s : sessions) {
    if (s.duration_ns() >= min_duration_ns) out.push_back(s);
  }
  return out;
}

}  // namespace readlog
